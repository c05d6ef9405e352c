#include "crawler.hpp"
#include "crawler_utils.hpp"
#include <spdlog/spdlog.h>

namespace politecrawl {

//===--------------------------------------------------------------------===//
// Worker loop
//===--------------------------------------------------------------------===//

void Crawler::WorkerLoop(int worker_id) {
	spdlog::debug("Worker {} started", worker_id);
	auto poll = std::chrono::milliseconds(settings_.queue_poll_ms);

	while (!stop_requested_) {
		std::string url;
		if (!queue_.WaitAndPop(url, poll)) {
			continue;
		}
		if (stop_requested_) {
			// Still pending in the store; requeued on the next run
			break;
		}
		ProcessUrlGuarded(url, worker_id);
	}

	spdlog::debug("Worker {} exiting", worker_id);
}

bool Crawler::ProcessOne(std::chrono::milliseconds timeout) {
	std::string url;
	if (!queue_.WaitAndPop(url, timeout)) {
		return false;
	}
	ProcessUrlGuarded(url, -1);
	return true;
}

void Crawler::ProcessUrlGuarded(const std::string &url, int worker_id) {
	try {
		ProcessUrl(url);
	} catch (const std::exception &ex) {
		spdlog::error("Worker {} failed processing {}: {}", worker_id, url, ex.what());
	}
}

bool Crawler::PolitenessWait() {
	if (settings_.politeness_delay_seconds <= 0) {
		return !stop_requested_;
	}
	auto delay = std::chrono::duration<double>(settings_.politeness_delay_seconds);
	std::unique_lock<std::mutex> lock(delay_mutex_);
	bool stopped = delay_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
	return !stopped;
}

//===--------------------------------------------------------------------===//
// One URL
//===--------------------------------------------------------------------===//

void Crawler::ProcessUrl(const std::string &url) {
	// The queue may hold URLs paused or finished since they were pushed
	auto record = store_->Get(url);
	if (!record) {
		spdlog::debug("Skipping {}: not in frontier", url);
		return;
	}
	if (record->status != UrlStatus::PENDING) {
		spdlog::debug("Skipping {}: status is {}", url, UrlStatusToString(record->status));
		return;
	}

	if (!PolitenessWait()) {
		spdlog::debug("Stop requested before fetching {}", url);
		return;
	}

	spdlog::info("Fetching {} (attempt {})", url, record->retry_count + 1);
	HttpResponse response = fetcher_->Fetch(url);

	if (!response.success) {
		std::string error = response.error;
		if (error.empty()) {
			error = "HTTP " + std::to_string(response.status_code);
		}
		HandleFailure(url, error, response.status_code);
		return;
	}

	DispatchResult dispatched;
	try {
		dispatched = dispatcher_.Dispatch(url, response);
	} catch (const std::exception &ex) {
		HandleFailure(url, std::string("Content processing failed: ") + ex.what(), response.status_code);
		return;
	}

	for (const auto &warning : dispatched.warnings) {
		spdlog::warn("{}: {}", url, warning);
	}

	size_t new_urls = 0;
	for (const auto &found : dispatched.discovered) {
		if (store_->InsertIfAbsent(found.url, UrlStatus::PENDING, found.is_sitemap)) {
			queue_.Push(found.url);
			new_urls++;
			spdlog::info("Enqueued {}{}", found.url, found.is_sitemap ? " (sitemap)" : "");
		}
	}

	if (dispatched.record) {
		try {
			sink_->Append(*dispatched.record);
		} catch (const std::exception &ex) {
			HandleFailure(url, std::string("Content save failed: ") + ex.what(), response.status_code);
			return;
		}
		spdlog::info("Saved content for {} (title: \"{}\")", url, dispatched.record->title);
	}

	StatusUpdate update;
	update.clear_last_error = true;
	update.set_is_sitemap = true;
	update.is_sitemap = dispatched.is_sitemap;
	store_->UpdateStatus(url, UrlStatus::VISITED, update);

	spdlog::info("Visited {}{}: {} links found, {} new", url, dispatched.is_sitemap ? " (sitemap)" : "",
	             dispatched.discovered.size(), new_urls);
}

void Crawler::HandleFailure(const std::string &url, const std::string &error, int status_code) {
	auto record = store_->RecordFailure(url, error, settings_.max_retries);
	if (!record) {
		return;
	}
	const char *error_type = ErrorTypeToString(ClassifyError(status_code, error));

	if (record->status == UrlStatus::ERROR) {
		spdlog::error("Giving up on {} after {} attempts [{}]: {}", url, record->retry_count, error_type, error);
		return;
	}

	spdlog::warn("Fetch failed for {} [{}] (retry {}/{}): {}", url, error_type, record->retry_count,
	             settings_.max_retries, error);
	queue_.Push(url);
}

} // namespace politecrawl
