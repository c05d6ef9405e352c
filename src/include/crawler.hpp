#pragma once

#include "content_dispatcher.hpp"
#include "content_sink.hpp"
#include "crawler_settings.hpp"
#include "frontier_store.hpp"
#include "http_client.hpp"
#include "url_queue.hpp"
#include <atomic>
#include <cstdint>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace politecrawl {

enum class SeedResult : uint8_t {
	SEEDED = 0,
	ALREADY_KNOWN = 1,
	INVALID = 2
};

struct CountEntry {
	std::string key;
	int64_t count = 0;
};

struct CrawlStats {
	StatusCounts counts;
	std::string earliest_url;
	std::vector<CountEntry> top_paused_hosts;
	std::vector<CountEntry> top_paused_prefixes;   // host or host/first-segment
	std::vector<CountEntry> top_hosts;
};

// Descending by count; ties keep first-encountered order
std::vector<CountEntry> TopCounts(const std::vector<std::string> &keys, size_t top_n);

//===--------------------------------------------------------------------===//
// Crawler
//===--------------------------------------------------------------------===//

// Owns the frontier store, work queue and worker pool. Control plane calls
// come from the command thread while workers run.
class Crawler {
public:
	// Opens the store and rebuilds the work queue from its pending set.
	// Throws whatever DuckDB throws when the database cannot be opened.
	Crawler(CrawlerSettings settings, std::shared_ptr<PageFetcher> fetcher);
	~Crawler();

	Crawler(const Crawler&) = delete;
	Crawler& operator=(const Crawler&) = delete;

	//===--------------------------------------------------------------===//
	// Control plane
	//===--------------------------------------------------------------===//

	SeedResult Seed(const std::string &url);

	bool PauseUrl(const std::string &url, const std::string &reason = "manual");
	bool ResumeUrl(const std::string &url);
	int64_t PausePrefix(const std::string &prefix, const std::string &reason = "manual");
	int64_t ResumePrefix(const std::string &prefix);
	int64_t ResumeAll();
	int64_t ResumeForDomain(const std::string &domain);

	StatusCounts GetStatusCounts();
	CrawlStats Stats(size_t top_n = 10);
	std::vector<std::string> ListPaused();
	std::vector<std::string> ListPendingByPrefix(const std::string &prefix);

	// Host (lowercased, www. stripped) of the first seed, empty if unknown
	std::string MainDomain() const;

	//===--------------------------------------------------------------===//
	// Worker pool
	//===--------------------------------------------------------------===//

	void Start();
	// Stop workers, join them and close the store. Idempotent.
	void Stop();
	bool IsRunning() const { return running_; }
	int WorkerCount() const { return settings_.num_workers; }

	// Run one worker iteration on the calling thread: pop with timeout and
	// process. False when nothing was popped.
	bool ProcessOne(std::chrono::milliseconds timeout);

	FrontierStore &Store() { return *store_; }
	ThreadSafeUrlQueue &Queue() { return queue_; }
	const CrawlerSettings &Settings() const { return settings_; }

private:
	void WorkerLoop(int worker_id);
	void ProcessUrlGuarded(const std::string &url, int worker_id);
	void ProcessUrl(const std::string &url);
	void HandleFailure(const std::string &url, const std::string &error, int status_code);
	// False when Stop() interrupted the delay
	bool PolitenessWait();
	void SetMainDomainIfUnknown(const std::string &url);

	CrawlerSettings settings_;
	std::shared_ptr<PageFetcher> fetcher_;
	duckdb::unique_ptr<FrontierStore> store_;
	duckdb::unique_ptr<ContentSink> sink_;
	ContentDispatcher dispatcher_;
	ThreadSafeUrlQueue queue_;

	std::atomic<bool> stop_requested_{false};
	std::atomic<bool> running_{false};
	bool stopped_ = false;
	std::mutex lifecycle_mutex_;
	std::mutex delay_mutex_;
	std::condition_variable delay_cv_;
	std::vector<std::thread> workers_;

	mutable std::mutex domain_mutex_;
	std::string main_domain_;
};

} // namespace politecrawl
