#include "frontier_store.hpp"
#include <spdlog/spdlog.h>

namespace politecrawl {

const char* UrlStatusToString(UrlStatus status) {
	switch (status) {
		case UrlStatus::PENDING: return "pending";
		case UrlStatus::VISITED: return "visited";
		case UrlStatus::PAUSED: return "paused";
		case UrlStatus::ERROR: return "error";
		default: return "unknown";
	}
}

UrlStatus UrlStatusFromString(const std::string &name) {
	if (name == "pending") return UrlStatus::PENDING;
	if (name == "visited") return UrlStatus::VISITED;
	if (name == "paused") return UrlStatus::PAUSED;
	if (name == "error") return UrlStatus::ERROR;
	throw duckdb::InvalidInputException("Unknown URL status '%s'", name);
}

//===--------------------------------------------------------------------===//
// Helpers
//===--------------------------------------------------------------------===//

static void CheckResult(duckdb::QueryResult &result, const std::string &operation) {
	if (result.HasError()) {
		throw duckdb::IOException("Frontier %s failed: %s", operation, result.GetError());
	}
}

// Row count reported by INSERT/UPDATE
static int64_t AffectedRows(duckdb::QueryResult &result) {
	auto chunk = result.Fetch();
	if (!chunk || chunk->size() == 0) {
		return 0;
	}
	auto val = chunk->GetValue(0, 0);
	return val.IsNull() ? 0 : val.GetValue<int64_t>();
}

static std::string OptionalString(const duckdb::Value &val, bool &present) {
	present = !val.IsNull();
	return present ? duckdb::StringValue::Get(val) : std::string();
}

// Column order matches RECORD_COLUMNS
static UrlRecord ReadRecord(duckdb::DataChunk &chunk, duckdb::idx_t row) {
	UrlRecord record;
	record.id = chunk.GetValue(0, row).GetValue<int64_t>();
	record.url = duckdb::StringValue::Get(chunk.GetValue(1, row));
	record.status = UrlStatusFromString(duckdb::StringValue::Get(chunk.GetValue(2, row)));
	auto changed = chunk.GetValue(3, row);
	record.last_status_change = changed.IsNull() ? "" : changed.ToString();
	record.last_error = OptionalString(chunk.GetValue(4, row), record.has_last_error);
	record.retry_count = chunk.GetValue(5, row).GetValue<int32_t>();
	record.is_sitemap = chunk.GetValue(6, row).GetValue<bool>();
	record.pause_reason = OptionalString(chunk.GetValue(7, row), record.has_pause_reason);
	return record;
}

static constexpr const char *RECORD_COLUMNS =
    "id, url, status, CAST(last_status_change AS VARCHAR), last_error, retry_count, is_sitemap, pause_reason";

// Rolls back unless Commit() was reached
class FrontierTransaction {
public:
	explicit FrontierTransaction(duckdb::Connection &conn) : conn_(conn) {
		conn_.BeginTransaction();
	}
	~FrontierTransaction() {
		if (!committed_) {
			try {
				conn_.Rollback();
			} catch (const std::exception &ex) {
				spdlog::error("Frontier rollback failed: {}", ex.what());
			}
		}
	}
	FrontierTransaction(const FrontierTransaction&) = delete;
	FrontierTransaction& operator=(const FrontierTransaction&) = delete;

	void Commit() {
		conn_.Commit();
		committed_ = true;
	}

private:
	duckdb::Connection &conn_;
	bool committed_ = false;
};

//===--------------------------------------------------------------------===//
// FrontierStore
//===--------------------------------------------------------------------===//

FrontierStore::FrontierStore(const std::string &db_path) : db_path_(db_path) {
	if (db_path_.empty() || db_path_ == ":memory:") {
		db_ = duckdb::make_uniq<duckdb::DuckDB>();
	} else {
		db_ = duckdb::make_uniq<duckdb::DuckDB>(db_path_);
	}
	conn_ = duckdb::make_uniq<duckdb::Connection>(*db_);
	InitializeSchema();
	spdlog::debug("Frontier store opened at {}", db_path_.empty() ? ":memory:" : db_path_);
}

FrontierStore::~FrontierStore() {
	try {
		Close();
	} catch (const std::exception &ex) {
		spdlog::error("Closing frontier store {} failed: {}", db_path_, ex.what());
	}
}

void FrontierStore::InitializeSchema() {
	auto seq = conn_->Query("CREATE SEQUENCE IF NOT EXISTS frontier_id_seq");
	CheckResult(*seq, "schema setup");

	// No secondary index on status: DuckDB rewrites indexed rows on UPDATE
	auto table = conn_->Query(R"(
		CREATE TABLE IF NOT EXISTS frontier (
			id BIGINT DEFAULT nextval('frontier_id_seq'),
			url VARCHAR PRIMARY KEY,
			status VARCHAR NOT NULL,
			last_status_change TIMESTAMP DEFAULT current_timestamp,
			last_error VARCHAR,
			retry_count INTEGER DEFAULT 0,
			is_sitemap BOOLEAN DEFAULT false,
			pause_reason VARCHAR
		)
	)");
	CheckResult(*table, "schema setup");
}

duckdb::Connection &FrontierStore::Conn() {
	if (!conn_) {
		throw duckdb::IOException("Frontier store %s is closed", db_path_);
	}
	return *conn_;
}

bool FrontierStore::IsOpen() {
	std::lock_guard<std::mutex> lock(mutex_);
	return conn_ != nullptr;
}

bool FrontierStore::InsertIfAbsent(const std::string &url, UrlStatus status, bool is_sitemap) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto result = Conn().Query(
	    "INSERT INTO frontier (url, status, is_sitemap, last_status_change) "
	    "VALUES ($1, $2, $3, current_timestamp) ON CONFLICT DO NOTHING",
	    url, std::string(UrlStatusToString(status)), is_sitemap);
	CheckResult(*result, "insert");
	return AffectedRows(*result) > 0;
}

duckdb::unique_ptr<UrlRecord> FrontierStore::GetLocked(const std::string &url) {
	auto result = Conn().Query(std::string("SELECT ") + RECORD_COLUMNS + " FROM frontier WHERE url = $1", url);
	CheckResult(*result, "lookup");
	auto chunk = result->Fetch();
	if (!chunk || chunk->size() == 0) {
		return nullptr;
	}
	return duckdb::make_uniq<UrlRecord>(ReadRecord(*chunk, 0));
}

duckdb::unique_ptr<UrlRecord> FrontierStore::Get(const std::string &url) {
	std::lock_guard<std::mutex> lock(mutex_);
	return GetLocked(url);
}

void FrontierStore::UpdateStatus(const std::string &url, UrlStatus status, const StatusUpdate &update) {
	std::vector<duckdb::Value> params;
	params.emplace_back(url);
	params.emplace_back(UrlStatusToString(status));

	std::string sql = "UPDATE frontier SET status = $2, last_status_change = current_timestamp";

	if (status != UrlStatus::PAUSED) {
		sql += ", pause_reason = NULL";
	} else if (update.set_pause_reason) {
		params.emplace_back(update.pause_reason);
		sql += ", pause_reason = $" + std::to_string(params.size());
	} else {
		sql += ", pause_reason = COALESCE(pause_reason, 'paused')";
	}

	if (update.set_last_error) {
		params.emplace_back(update.last_error);
		sql += ", last_error = $" + std::to_string(params.size());
	} else if (update.clear_last_error) {
		sql += ", last_error = NULL";
	}

	if (update.set_is_sitemap) {
		params.push_back(duckdb::Value::BOOLEAN(update.is_sitemap));
		sql += ", is_sitemap = $" + std::to_string(params.size());
	}

	if (update.increment_retry) {
		sql += ", retry_count = retry_count + 1";
	}

	sql += " WHERE url = $1";

	std::lock_guard<std::mutex> lock(mutex_);
	auto prepared = Conn().Prepare(sql);
	if (prepared->HasError()) {
		throw duckdb::IOException("Frontier update failed: %s", prepared->GetError());
	}
	auto result = prepared->Execute(params, false);
	CheckResult(*result, "update");
}

static std::vector<std::string> CollectUrls(duckdb::QueryResult &result) {
	CheckResult(result, "listing");
	std::vector<std::string> urls;
	while (auto chunk = result.Fetch()) {
		for (duckdb::idx_t row = 0; row < chunk->size(); row++) {
			urls.push_back(duckdb::StringValue::Get(chunk->GetValue(0, row)));
		}
	}
	return urls;
}

std::vector<std::string> FrontierStore::ListUrlsLocked(const std::string &sql) {
	auto result = Conn().Query(sql);
	return CollectUrls(*result);
}

std::vector<std::string> FrontierStore::ListUrlsLocked(const std::string &sql, const std::string &param) {
	auto result = Conn().Query(sql, param);
	return CollectUrls(*result);
}

std::vector<std::string> FrontierStore::ListByStatus(UrlStatus status) {
	std::lock_guard<std::mutex> lock(mutex_);
	return ListUrlsLocked("SELECT url FROM frontier WHERE status = $1 ORDER BY id", UrlStatusToString(status));
}

std::vector<std::string> FrontierStore::ListAll() {
	std::lock_guard<std::mutex> lock(mutex_);
	return ListUrlsLocked("SELECT url FROM frontier ORDER BY id");
}

bool FrontierStore::PauseUrl(const std::string &url, const std::string &reason) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto result = Conn().Query(
	    "UPDATE frontier SET status = 'paused', pause_reason = $2, last_status_change = current_timestamp "
	    "WHERE url = $1 AND status = 'pending'",
	    url, reason);
	CheckResult(*result, "pause");
	return AffectedRows(*result) > 0;
}

bool FrontierStore::ResumeUrl(const std::string &url) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto result = Conn().Query(
	    "UPDATE frontier SET status = 'pending', pause_reason = NULL, last_status_change = current_timestamp "
	    "WHERE url = $1 AND status = 'paused'",
	    url);
	CheckResult(*result, "resume");
	return AffectedRows(*result) > 0;
}

int64_t FrontierStore::PausePrefix(const std::string &prefix, const std::string &reason) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto &conn = Conn();
	FrontierTransaction txn(conn);
	auto result = conn.Query(
	    "UPDATE frontier SET status = 'paused', pause_reason = $2, last_status_change = current_timestamp "
	    "WHERE status = 'pending' AND starts_with(url, $1)",
	    prefix, reason);
	CheckResult(*result, "prefix pause");
	int64_t count = AffectedRows(*result);
	txn.Commit();
	return count;
}

void FrontierStore::SetPendingLocked(const std::vector<std::string> &urls) {
	auto &conn = Conn();
	for (const auto &url : urls) {
		auto result = conn.Query(
		    "UPDATE frontier SET status = 'pending', pause_reason = NULL, last_status_change = current_timestamp "
		    "WHERE url = $1 AND status = 'paused'",
		    url);
		CheckResult(*result, "resume");
	}
}

ResumeResult FrontierStore::ResumePrefix(const std::string &prefix) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto &conn = Conn();
	FrontierTransaction txn(conn);

	ResumeResult resumed;
	resumed.urls = ListUrlsLocked(
	    "SELECT url FROM frontier WHERE status = 'paused' AND starts_with(url, $1) ORDER BY id", prefix);

	auto result = conn.Query(
	    "UPDATE frontier SET status = 'pending', pause_reason = NULL, last_status_change = current_timestamp "
	    "WHERE status = 'paused' AND starts_with(url, $1)",
	    prefix);
	CheckResult(*result, "prefix resume");
	resumed.count = AffectedRows(*result);
	txn.Commit();
	return resumed;
}

std::vector<std::string> FrontierStore::ResumeAll() {
	std::lock_guard<std::mutex> lock(mutex_);
	auto &conn = Conn();
	FrontierTransaction txn(conn);

	auto urls = ListUrlsLocked("SELECT url FROM frontier WHERE status = 'paused' ORDER BY id");
	auto result = conn.Query(
	    "UPDATE frontier SET status = 'pending', pause_reason = NULL, last_status_change = current_timestamp "
	    "WHERE status = 'paused'");
	CheckResult(*result, "resume all");
	txn.Commit();
	return urls;
}

std::vector<std::string> FrontierStore::ResumeMatching(const std::function<bool(const std::string &)> &predicate) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto &conn = Conn();
	FrontierTransaction txn(conn);

	std::vector<std::string> matched;
	for (auto &url : ListUrlsLocked("SELECT url FROM frontier WHERE status = 'paused' ORDER BY id")) {
		if (predicate(url)) {
			matched.push_back(std::move(url));
		}
	}
	SetPendingLocked(matched);
	txn.Commit();
	return matched;
}

duckdb::unique_ptr<UrlRecord> FrontierStore::RecordFailure(const std::string &url, const std::string &error,
                                                        int32_t max_retries) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto result = Conn().Query(
	    "UPDATE frontier SET retry_count = retry_count + 1, last_error = $2, "
	    "status = CASE WHEN retry_count + 1 >= $3 THEN 'error' ELSE 'pending' END, "
	    "pause_reason = NULL, last_status_change = current_timestamp "
	    "WHERE url = $1",
	    url, error, max_retries);
	CheckResult(*result, "failure update");
	return GetLocked(url);
}

std::string FrontierStore::EarliestUrl() {
	std::lock_guard<std::mutex> lock(mutex_);
	auto urls = ListUrlsLocked("SELECT url FROM frontier ORDER BY id LIMIT 1");
	return urls.empty() ? "" : urls.front();
}

StatusCounts FrontierStore::GetStatusCounts() {
	std::lock_guard<std::mutex> lock(mutex_);
	auto result = Conn().Query(R"(
		SELECT
			count(*) FILTER (WHERE status = 'pending'),
			count(*) FILTER (WHERE status = 'visited'),
			count(*) FILTER (WHERE status = 'paused'),
			count(*) FILTER (WHERE status = 'error')
		FROM frontier
	)");
	CheckResult(*result, "status counts");

	StatusCounts counts;
	auto chunk = result->Fetch();
	if (chunk && chunk->size() > 0) {
		counts.pending = chunk->GetValue(0, 0).GetValue<int64_t>();
		counts.visited = chunk->GetValue(1, 0).GetValue<int64_t>();
		counts.paused = chunk->GetValue(2, 0).GetValue<int64_t>();
		counts.error = chunk->GetValue(3, 0).GetValue<int64_t>();
	}
	return counts;
}

void FrontierStore::Close() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!conn_) {
		return;
	}
	auto result = conn_->Query("CHECKPOINT");
	std::string error = result->HasError() ? result->GetError() : "";
	conn_.reset();
	db_.reset();
	if (!error.empty()) {
		throw duckdb::IOException("Frontier checkpoint failed: %s", error);
	}
	spdlog::debug("Frontier store {} closed", db_path_.empty() ? ":memory:" : db_path_);
}

} // namespace politecrawl
