#include "crawler.hpp"
#include "crawler_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>

namespace politecrawl {

std::vector<CountEntry> TopCounts(const std::vector<std::string> &keys, size_t top_n) {
	std::vector<CountEntry> entries;
	std::unordered_map<std::string, size_t> index;
	for (const auto &key : keys) {
		auto it = index.find(key);
		if (it == index.end()) {
			index.emplace(key, entries.size());
			entries.push_back({key, 1});
		} else {
			entries[it->second].count++;
		}
	}
	std::stable_sort(entries.begin(), entries.end(),
	                 [](const CountEntry &a, const CountEntry &b) { return a.count > b.count; });
	if (entries.size() > top_n) {
		entries.resize(top_n);
	}
	return entries;
}

Crawler::Crawler(CrawlerSettings settings, std::shared_ptr<PageFetcher> fetcher)
    : settings_(std::move(settings)), fetcher_(std::move(fetcher)) {
	ResolveCrawlerSettings(settings_);

	store_ = duckdb::make_uniq<FrontierStore>(settings_.db_path);
	sink_ = duckdb::make_uniq<ContentSink>(settings_.output_path);

	// Pending records are the work left over from the previous run
	auto pending = store_->ListByStatus(UrlStatus::PENDING);
	queue_.PushAll(pending);

	std::string earliest = store_->EarliestUrl();
	if (!earliest.empty()) {
		SetMainDomainIfUnknown(earliest);
	}

	spdlog::info("Crawler initialized: db={} workers={} delay={}s max_retries={} pending={}",
	             settings_.db_path, settings_.num_workers, settings_.politeness_delay_seconds,
	             settings_.max_retries, pending.size());
}

Crawler::~Crawler() {
	try {
		Stop();
	} catch (const std::exception &ex) {
		spdlog::error("Crawler shutdown failed: {}", ex.what());
	}
}

void Crawler::SetMainDomainIfUnknown(const std::string &url) {
	std::lock_guard<std::mutex> lock(domain_mutex_);
	if (main_domain_.empty()) {
		main_domain_ = ExtractBaseDomain(url);
		if (!main_domain_.empty()) {
			spdlog::info("Main domain set to {}", main_domain_);
		}
	}
}

std::string Crawler::MainDomain() const {
	std::lock_guard<std::mutex> lock(domain_mutex_);
	return main_domain_;
}

//===--------------------------------------------------------------------===//
// Control plane
//===--------------------------------------------------------------------===//

SeedResult Crawler::Seed(const std::string &url) {
	std::string normalized = NormalizeUrl(url);
	std::string validation_error = GetUrlValidationError(normalized);
	if (!validation_error.empty()) {
		spdlog::warn("Rejected seed '{}': {}", url, validation_error);
		return SeedResult::INVALID;
	}

	SetMainDomainIfUnknown(normalized);

	if (!store_->InsertIfAbsent(normalized, UrlStatus::PENDING, LooksLikeSitemap(normalized))) {
		spdlog::info("Seed already known: {}", normalized);
		return SeedResult::ALREADY_KNOWN;
	}
	queue_.Push(normalized);
	spdlog::info("Seeded {}", normalized);
	return SeedResult::SEEDED;
}

bool Crawler::PauseUrl(const std::string &url, const std::string &reason) {
	std::string normalized = NormalizeUrl(url);
	auto record = store_->Get(normalized);
	if (!record) {
		spdlog::warn("Cannot pause unknown URL {}", normalized);
		return false;
	}
	if (record->status != UrlStatus::PENDING) {
		spdlog::warn("Cannot pause {}: status is {}", normalized, UrlStatusToString(record->status));
		return false;
	}
	// A queued copy is dropped by the worker's status re-check
	if (!store_->PauseUrl(normalized, reason)) {
		spdlog::warn("Cannot pause {}: status changed concurrently", normalized);
		return false;
	}
	spdlog::info("Paused {} ({})", normalized, reason);
	return true;
}

bool Crawler::ResumeUrl(const std::string &url) {
	std::string normalized = NormalizeUrl(url);
	if (!store_->ResumeUrl(normalized)) {
		auto record = store_->Get(normalized);
		if (!record) {
			spdlog::warn("Cannot resume unknown URL {}", normalized);
		} else {
			spdlog::warn("Cannot resume {}: status is {}", normalized, UrlStatusToString(record->status));
		}
		return false;
	}
	queue_.Push(normalized);
	spdlog::info("Resumed {}", normalized);
	return true;
}

int64_t Crawler::PausePrefix(const std::string &prefix, const std::string &reason) {
	std::string trimmed = TrimString(prefix);
	if (trimmed.empty()) {
		spdlog::warn("Refusing to pause an empty prefix");
		return 0;
	}
	int64_t paused = store_->PausePrefix(trimmed, reason);
	size_t dequeued = queue_.RemoveByPrefix(trimmed);
	spdlog::info("Paused {} URLs with prefix {} ({} removed from queue, reason: {})", paused, trimmed, dequeued,
	             reason);
	return paused;
}

int64_t Crawler::ResumePrefix(const std::string &prefix) {
	std::string trimmed = TrimString(prefix);
	if (trimmed.empty()) {
		spdlog::warn("Refusing to resume an empty prefix");
		return 0;
	}
	auto resumed = store_->ResumePrefix(trimmed);
	queue_.PushAll(resumed.urls);
	spdlog::info("Resumed {} URLs with prefix {}", resumed.count, trimmed);
	return resumed.count;
}

int64_t Crawler::ResumeAll() {
	auto urls = store_->ResumeAll();
	queue_.PushAll(urls);
	spdlog::info("Resumed all {} paused URLs", urls.size());
	return static_cast<int64_t>(urls.size());
}

int64_t Crawler::ResumeForDomain(const std::string &domain) {
	std::string target = ToLower(TrimString(domain));
	if (StartsWith(target, "www.")) {
		target = target.substr(4);
	}
	if (target.empty()) {
		spdlog::warn("Refusing to resume an empty domain");
		return 0;
	}
	auto urls = store_->ResumeMatching([&target](const std::string &url) {
		return IsSameOrSubdomain(ExtractBaseDomain(url), target);
	});
	queue_.PushAll(urls);
	spdlog::info("Resumed {} paused URLs for domain {}", urls.size(), target);
	return static_cast<int64_t>(urls.size());
}

StatusCounts Crawler::GetStatusCounts() {
	return store_->GetStatusCounts();
}

CrawlStats Crawler::Stats(size_t top_n) {
	CrawlStats stats;
	stats.counts = store_->GetStatusCounts();
	stats.earliest_url = store_->EarliestUrl();

	std::vector<std::string> paused_hosts;
	std::vector<std::string> paused_prefixes;
	for (const auto &url : store_->ListByStatus(UrlStatus::PAUSED)) {
		paused_hosts.push_back(ExtractBaseDomain(url));
		paused_prefixes.push_back(ExtractHostPrefix(url));
	}

	std::vector<std::string> hosts;
	for (const auto &url : store_->ListAll()) {
		hosts.push_back(ExtractBaseDomain(url));
	}

	stats.top_paused_hosts = TopCounts(paused_hosts, top_n);
	stats.top_paused_prefixes = TopCounts(paused_prefixes, top_n);
	stats.top_hosts = TopCounts(hosts, top_n);
	return stats;
}

std::vector<std::string> Crawler::ListPaused() {
	return store_->ListByStatus(UrlStatus::PAUSED);
}

std::vector<std::string> Crawler::ListPendingByPrefix(const std::string &prefix) {
	std::vector<std::string> matching;
	for (auto &url : store_->ListByStatus(UrlStatus::PENDING)) {
		if (StartsWith(url, prefix)) {
			matching.push_back(std::move(url));
		}
	}
	return matching;
}

//===--------------------------------------------------------------------===//
// Lifecycle
//===--------------------------------------------------------------------===//

void Crawler::Start() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);
	if (stopped_) {
		spdlog::warn("Start ignored: crawler has been stopped");
		return;
	}
	if (running_) {
		spdlog::warn("Start ignored: workers already running");
		return;
	}

	running_ = true;
	workers_.reserve(settings_.num_workers);
	for (int i = 0; i < settings_.num_workers; i++) {
		workers_.emplace_back(&Crawler::WorkerLoop, this, i);
	}
	spdlog::info("Started {} workers ({} queued)", settings_.num_workers, queue_.Size());
}

void Crawler::Stop() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex_);
	if (stopped_) {
		return;
	}
	stopped_ = true;

	{
		std::lock_guard<std::mutex> delay_lock(delay_mutex_);
		stop_requested_ = true;
	}
	delay_cv_.notify_all();
	queue_.Shutdown();

	for (auto &worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	workers_.clear();
	running_ = false;

	store_->Close();
	spdlog::info("Crawler stopped; state saved to {}", settings_.db_path);
}

} // namespace politecrawl
