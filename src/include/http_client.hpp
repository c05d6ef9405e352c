#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <utility>
#include <curl/curl.h>

namespace politecrawl {

struct HttpResponse {
	int status_code = 0;          // 0 when the request never got a response
	std::string body;
	std::string content_type;
	std::string error;
	bool success = false;         // status_code == 200
	std::string final_url;        // Final URL after redirects
};

struct FetchOptions {
	std::string user_agent;
	int timeout_seconds = 15;
	int connect_timeout_seconds = 10;
};

// Thread-safe connection pool for curl handles
class HttpConnectionPool {
public:
	HttpConnectionPool();
	~HttpConnectionPool();

	// Disable copy/move
	HttpConnectionPool(const HttpConnectionPool&) = delete;
	HttpConnectionPool& operator=(const HttpConnectionPool&) = delete;

	// Get a curl easy handle (reuses from pool or creates new)
	CURL* AcquireHandle();
	// Return handle to pool for reuse
	void ReleaseHandle(CURL* handle);

	// Get HTTP version string for logging
	static std::string GetHttpVersionString();

private:
	std::mutex pool_mutex_;
	std::vector<CURL*> available_handles_;
	bool initialized_ = false;
};

// Global connection pool access
HttpConnectionPool& GetConnectionPool();

// Initialize HTTP client (call once at startup, before any worker runs)
void InitializeHttpClient();
// Cleanup HTTP client (call after all workers have joined)
void CleanupHttpClient();

class HttpClient {
public:
	// Single GET. Never throws; failures are reported through HttpResponse.
	static HttpResponse Fetch(const std::string &url, const FetchOptions &options);
};

// Seam between the worker pool and the network
class PageFetcher {
public:
	virtual ~PageFetcher() = default;
	virtual HttpResponse Fetch(const std::string &url) = 0;
};

class CurlPageFetcher : public PageFetcher {
public:
	explicit CurlPageFetcher(FetchOptions options) : options_(std::move(options)) {}

	HttpResponse Fetch(const std::string &url) override {
		return HttpClient::Fetch(url, options_);
	}

private:
	FetchOptions options_;
};

} // namespace politecrawl
