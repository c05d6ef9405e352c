#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace politecrawl {

//===--------------------------------------------------------------------===//
// Thread-Safe URL Work Queue
//===--------------------------------------------------------------------===//

// FIFO of pending URLs shared by the worker pool and the control plane.
// Mirrors the store's pending set; the store stays authoritative.
class ThreadSafeUrlQueue {
public:
	void Push(std::string url);
	void PushAll(const std::vector<std::string> &urls);
	bool WaitAndPop(std::string &url, std::chrono::milliseconds timeout);

	// Drop every queued URL starting with prefix, keeping the order of the
	// rest. URLs already popped by a worker are not affected.
	size_t RemoveByPrefix(const std::string &prefix);

	void Shutdown();
	bool IsShutdown() const;

	bool Empty() const;
	size_t Size() const;
	bool Contains(const std::string &url) const;

private:
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<std::string> queue_;
	bool shutdown_ = false;
};

} // namespace politecrawl
