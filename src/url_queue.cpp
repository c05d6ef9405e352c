#include "url_queue.hpp"
#include <algorithm>
#include <iterator>

namespace politecrawl {

void ThreadSafeUrlQueue::Push(std::string url) {
	std::lock_guard<std::mutex> lock(mutex_);
	queue_.push_back(std::move(url));
	cv_.notify_one();
}

void ThreadSafeUrlQueue::PushAll(const std::vector<std::string> &urls) {
	if (urls.empty()) {
		return;
	}
	std::lock_guard<std::mutex> lock(mutex_);
	queue_.insert(queue_.end(), urls.begin(), urls.end());
	cv_.notify_all();
}

bool ThreadSafeUrlQueue::WaitAndPop(std::string &url, std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lock(mutex_);
	if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || shutdown_; })) {
		return false;
	}
	if (shutdown_ && queue_.empty())
		return false;
	url = std::move(queue_.front());
	queue_.pop_front();
	return true;
}

size_t ThreadSafeUrlQueue::RemoveByPrefix(const std::string &prefix) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto first_removed = std::remove_if(queue_.begin(), queue_.end(), [&prefix](const std::string &url) {
		return url.compare(0, prefix.size(), prefix) == 0;
	});
	size_t removed = static_cast<size_t>(std::distance(first_removed, queue_.end()));
	queue_.erase(first_removed, queue_.end());
	return removed;
}

void ThreadSafeUrlQueue::Shutdown() {
	std::lock_guard<std::mutex> lock(mutex_);
	shutdown_ = true;
	cv_.notify_all();
}

bool ThreadSafeUrlQueue::IsShutdown() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return shutdown_;
}

bool ThreadSafeUrlQueue::Empty() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return queue_.empty();
}

size_t ThreadSafeUrlQueue::Size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return queue_.size();
}

bool ThreadSafeUrlQueue::Contains(const std::string &url) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return std::find(queue_.begin(), queue_.end(), url) != queue_.end();
}

} // namespace politecrawl
