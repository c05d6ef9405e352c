#pragma once

#include "duckdb.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace politecrawl {

//===--------------------------------------------------------------------===//
// URL Record
//===--------------------------------------------------------------------===//

enum class UrlStatus : uint8_t {
	PENDING = 0,
	VISITED = 1,
	PAUSED = 2,
	ERROR = 3
};

const char* UrlStatusToString(UrlStatus status);
// Throws duckdb::InvalidInputException for unknown names
UrlStatus UrlStatusFromString(const std::string &name);

struct UrlRecord {
	int64_t id = 0;
	std::string url;
	UrlStatus status = UrlStatus::PENDING;
	std::string last_status_change;
	std::string last_error;          // empty when NULL
	bool has_last_error = false;
	int32_t retry_count = 0;
	bool is_sitemap = false;
	std::string pause_reason;        // empty when NULL
	bool has_pause_reason = false;
};

// Optional fields applied together with a status transition
struct StatusUpdate {
	bool set_last_error = false;
	std::string last_error;
	bool clear_last_error = false;
	bool set_is_sitemap = false;
	bool is_sitemap = false;
	bool set_pause_reason = false;
	std::string pause_reason;
	bool clear_pause_reason = false;
	bool increment_retry = false;
};

struct StatusCounts {
	int64_t pending = 0;
	int64_t visited = 0;
	int64_t paused = 0;
	int64_t error = 0;

	int64_t Total() const { return pending + visited + paused + error; }
};

struct ResumeResult {
	std::vector<std::string> urls;
	int64_t count = 0;
};

//===--------------------------------------------------------------------===//
// Frontier Store
//===--------------------------------------------------------------------===//

// Durable URL state table in an embedded DuckDB file. Every operation takes
// the store mutex; multi-row operations additionally run in one transaction.
// Storage failures throw duckdb::IOException.
class FrontierStore {
public:
	// Opens (or creates) the database file. ":memory:" gives a private
	// in-memory store.
	explicit FrontierStore(const std::string &db_path);
	~FrontierStore();

	FrontierStore(const FrontierStore&) = delete;
	FrontierStore& operator=(const FrontierStore&) = delete;

	// True when this call created the record
	bool InsertIfAbsent(const std::string &url, UrlStatus status = UrlStatus::PENDING, bool is_sitemap = false);

	// nullptr for unknown URLs
	duckdb::unique_ptr<UrlRecord> Get(const std::string &url);

	// Silent no-op for unknown URLs. Any status other than PAUSED clears
	// pause_reason.
	void UpdateStatus(const std::string &url, UrlStatus status, const StatusUpdate &update = StatusUpdate());

	// URLs with the given status in insertion order
	std::vector<std::string> ListByStatus(UrlStatus status);
	std::vector<std::string> ListAll();

	// Pending -> Paused for one URL; false if unknown or not pending
	bool PauseUrl(const std::string &url, const std::string &reason);
	// Paused -> Pending for one URL; false if unknown or not paused
	bool ResumeUrl(const std::string &url);

	// Literal string prefix, so "https://a.com" also matches "https://a.com.evil.org"
	int64_t PausePrefix(const std::string &prefix, const std::string &reason);
	ResumeResult ResumePrefix(const std::string &prefix);
	std::vector<std::string> ResumeAll();
	std::vector<std::string> ResumeMatching(const std::function<bool(const std::string &)> &predicate);

	// Increment retry_count and store the error. The record goes back to
	// PENDING while retry_count < max_retries, otherwise to ERROR. Returns
	// the updated record, nullptr for unknown URLs.
	duckdb::unique_ptr<UrlRecord> RecordFailure(const std::string &url, const std::string &error, int32_t max_retries);

	// First inserted URL, empty when the store is empty
	std::string EarliestUrl();

	StatusCounts GetStatusCounts();

	// Checkpoint and release the database. Later calls throw.
	void Close();
	bool IsOpen();

private:
	void InitializeSchema();
	duckdb::Connection &Conn();
	duckdb::unique_ptr<UrlRecord> GetLocked(const std::string &url);
	std::vector<std::string> ListUrlsLocked(const std::string &sql);
	std::vector<std::string> ListUrlsLocked(const std::string &sql, const std::string &param);
	void SetPendingLocked(const std::vector<std::string> &urls);

	std::mutex mutex_;
	duckdb::unique_ptr<duckdb::DuckDB> db_;
	duckdb::unique_ptr<duckdb::Connection> conn_;
	std::string db_path_;
};

} // namespace politecrawl
