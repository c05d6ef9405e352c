#include "http_client.hpp"
#include "crawler_utils.hpp"

namespace politecrawl {

// Determine HTTP version at compile time based on available features
#if defined(POLITECRAWL_HTTP2_SUPPORT) && POLITECRAWL_HTTP2_SUPPORT
static constexpr long POLITECRAWL_HTTP_VERSION = CURL_HTTP_VERSION_2TLS;
static constexpr const char* POLITECRAWL_HTTP_VERSION_STR = "HTTP/2";
#else
static constexpr long POLITECRAWL_HTTP_VERSION = CURL_HTTP_VERSION_1_1;
static constexpr const char* POLITECRAWL_HTTP_VERSION_STR = "HTTP/1.1";
#endif

// Global connection pool (singleton)
static HttpConnectionPool* g_connection_pool = nullptr;

HttpConnectionPool& GetConnectionPool() {
	if (!g_connection_pool) {
		g_connection_pool = new HttpConnectionPool();
	}
	return *g_connection_pool;
}

void InitializeHttpClient() {
	curl_global_init(CURL_GLOBAL_DEFAULT);
	GetConnectionPool();
}

void CleanupHttpClient() {
	if (g_connection_pool) {
		delete g_connection_pool;
		g_connection_pool = nullptr;
	}
	curl_global_cleanup();
}

HttpConnectionPool::HttpConnectionPool() : initialized_(true) {
}

HttpConnectionPool::~HttpConnectionPool() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (CURL* handle : available_handles_) {
		curl_easy_cleanup(handle);
	}
	available_handles_.clear();
	initialized_ = false;
}

CURL* HttpConnectionPool::AcquireHandle() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (!available_handles_.empty()) {
		CURL* handle = available_handles_.back();
		available_handles_.pop_back();
		curl_easy_reset(handle);  // Reset options but keep the connection cache
		return handle;
	}
	return curl_easy_init();
}

void HttpConnectionPool::ReleaseHandle(CURL* handle) {
	if (!handle) return;
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (initialized_ && available_handles_.size() < 64) {
		available_handles_.push_back(handle);
	} else {
		curl_easy_cleanup(handle);
	}
}

std::string HttpConnectionPool::GetHttpVersionString() {
	return POLITECRAWL_HTTP_VERSION_STR;
}

struct HeaderData {
	std::string content_type;
};

// Write callback for response body
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
	size_t total_size = size * nmemb;
	std::string* body = static_cast<std::string*>(userp);
	body->append(static_cast<char*>(contents), total_size);
	return total_size;
}

// Header callback; redirects reset the headers of the previous hop
static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
	size_t total_size = size * nitems;
	HeaderData* headers = static_cast<HeaderData*>(userdata);

	std::string header(buffer, total_size);
	if (StartsWith(header, "HTTP/")) {
		headers->content_type.clear();
		return total_size;
	}

	size_t colon_pos = header.find(':');
	if (colon_pos != std::string::npos) {
		std::string name = ToLower(TrimString(header.substr(0, colon_pos)));
		if (name == "content-type") {
			headers->content_type = TrimString(header.substr(colon_pos + 1));
		}
	}

	return total_size;
}

HttpResponse HttpClient::Fetch(const std::string &url, const FetchOptions &options) {
	HttpResponse response;

	auto& pool = GetConnectionPool();
	CURL* curl = pool.AcquireHandle();
	if (!curl) {
		response.error = "Failed to acquire curl handle";
		return response;
	}

	std::string body;
	HeaderData header_data;

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, POLITECRAWL_HTTP_VERSION);

	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_data);

	if (!options.user_agent.empty()) {
		curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
	}

	// Transparent content-encoding; .gz files are still delivered as gzip bytes
	curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

	curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(options.timeout_seconds));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout_seconds));
	// Workers run outside the main thread; signals would interrupt the wrong one
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

	CURLcode res = curl_easy_perform(curl);

	if (res == CURLE_OK) {
		long status_code = 0;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
		response.status_code = static_cast<int>(status_code);

		char* effective_url = nullptr;
		curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
		if (effective_url) {
			response.final_url = effective_url;
		}

		response.body = std::move(body);
		response.content_type = std::move(header_data.content_type);

		// Only a plain 200 counts as a successful fetch
		response.success = response.status_code == 200;
		if (!response.success) {
			response.error = "HTTP " + std::to_string(response.status_code);
		}
	} else {
		response.error = curl_easy_strerror(res);
		response.status_code = 0;
		response.success = false;
	}

	pool.ReleaseHandle(curl);

	return response;
}

} // namespace politecrawl
