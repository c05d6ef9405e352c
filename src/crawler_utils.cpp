#include "crawler_utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <vector>
#include <cctype>

namespace politecrawl {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

const char* ErrorTypeToString(CrawlErrorType type) {
	switch (type) {
		case CrawlErrorType::NONE: return "";
		case CrawlErrorType::NETWORK_TIMEOUT: return "network_timeout";
		case CrawlErrorType::NETWORK_DNS_FAILURE: return "network_dns_failure";
		case CrawlErrorType::NETWORK_CONNECTION_REFUSED: return "network_connection_refused";
		case CrawlErrorType::NETWORK_SSL_ERROR: return "network_ssl_error";
		case CrawlErrorType::HTTP_CLIENT_ERROR: return "http_client_error";
		case CrawlErrorType::HTTP_SERVER_ERROR: return "http_server_error";
		case CrawlErrorType::HTTP_RATE_LIMITED: return "http_rate_limited";
		case CrawlErrorType::CONTENT_DECODE_ERROR: return "content_decode_error";
		default: return "unknown";
	}
}

CrawlErrorType ClassifyError(int status_code, const std::string &error_msg) {
	if (status_code == 429) return CrawlErrorType::HTTP_RATE_LIMITED;
	if (status_code >= 500 && status_code < 600) return CrawlErrorType::HTTP_SERVER_ERROR;
	if (status_code >= 400 && status_code < 500) return CrawlErrorType::HTTP_CLIENT_ERROR;
	if (status_code == 200) {
		// Fetched fine but the body could not be processed
		return error_msg.empty() ? CrawlErrorType::NONE : CrawlErrorType::CONTENT_DECODE_ERROR;
	}
	if (status_code <= 0) {
		// Network error - classify from message
		if (error_msg.find("timeout") != std::string::npos ||
		    error_msg.find("Timeout") != std::string::npos ||
		    error_msg.find("timed out") != std::string::npos) {
			return CrawlErrorType::NETWORK_TIMEOUT;
		}
		if (error_msg.find("DNS") != std::string::npos ||
		    error_msg.find("resolve") != std::string::npos) {
			return CrawlErrorType::NETWORK_DNS_FAILURE;
		}
		if (error_msg.find("SSL") != std::string::npos ||
		    error_msg.find("certificate") != std::string::npos) {
			return CrawlErrorType::NETWORK_SSL_ERROR;
		}
		if (error_msg.find("refused") != std::string::npos ||
		    error_msg.find("connect") != std::string::npos) {
			return CrawlErrorType::NETWORK_CONNECTION_REFUSED;
		}
		return CrawlErrorType::NETWORK_TIMEOUT;  // Default network error
	}
	return CrawlErrorType::HTTP_CLIENT_ERROR;
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data) {
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// Use inflateInit2 with 16+MAX_WBITS to handle gzip format
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef*>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END) {
			// Z_BUF_ERROR here means truncated input: no progress is possible
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		decompressed.append(buffer, have);

		// Concatenated gzip members: continue with the next one
		if (ret == Z_STREAM_END && zs.avail_in > 0) {
			if (inflateReset(&zs) != Z_OK) {
				inflateEnd(&zs);
				return "";
			}
			ret = Z_OK;
		}
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

//===--------------------------------------------------------------------===//
// String Utilities
//===--------------------------------------------------------------------===//

std::string TrimString(const std::string &str) {
	size_t start = 0;
	size_t end = str.length();
	while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

bool StartsWith(const std::string &str, const std::string &prefix) {
	return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string &str, const std::string &suffix) {
	return str.size() >= suffix.size() &&
	       str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string TruncateUtf8(const std::string &text, size_t max_chars) {
	size_t chars = 0;
	for (size_t i = 0; i < text.size(); i++) {
		// Continuation bytes (10xxxxxx) belong to the previous code point
		if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
			if (chars == max_chars) {
				return text.substr(0, i);
			}
			chars++;
		}
	}
	return text;
}

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

std::string NormalizeUrl(const std::string &url) {
	return TrimString(url);
}

bool HasHttpScheme(const std::string &url) {
	return StartsWith(url, "http://") || StartsWith(url, "https://");
}

bool IsValidCrawlUrl(const std::string &url) {
	return GetUrlValidationError(url).empty();
}

std::string GetUrlValidationError(const std::string &url) {
	if (url.empty()) {
		return "URL is empty";
	}
	if (url.length() > 2048) {
		return "URL exceeds 2048 characters";
	}
	if (!HasHttpScheme(url)) {
		return "URL must start with http:// or https://";
	}
	if (ExtractDomain(url).empty()) {
		return "URL has no hostname";
	}
	return "";
}

bool LooksLikeSitemap(const std::string &url) {
	std::string lower = ToLower(url);
	return EndsWith(lower, ".xml") || EndsWith(lower, ".xml.gz") ||
	       lower.find("sitemap") != std::string::npos;
}

std::string ExtractDomain(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}
	size_t domain_start = proto_end + 3;
	size_t domain_end = url.find_first_of("/?#", domain_start);
	if (domain_end == std::string::npos) {
		domain_end = url.length();
	}
	std::string domain = url.substr(domain_start, domain_end - domain_start);

	// Remove userinfo if present
	size_t at_pos = domain.rfind('@');
	if (at_pos != std::string::npos) {
		domain = domain.substr(at_pos + 1);
	}

	// Remove port if present
	size_t port_pos = domain.find(':');
	if (port_pos != std::string::npos) {
		domain = domain.substr(0, port_pos);
	}

	return ToLower(domain);
}

std::string ExtractBaseDomain(const std::string &url) {
	std::string domain = ExtractDomain(url);
	if (StartsWith(domain, "www.")) {
		domain = domain.substr(4);
	}
	return domain;
}

std::string ExtractPath(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "/";
	}
	size_t path_start = url.find_first_of("/?#", proto_end + 3);
	if (path_start == std::string::npos || url[path_start] != '/') {
		return "/";
	}
	size_t path_end = url.find_first_of("?#", path_start);
	if (path_end == std::string::npos) {
		path_end = url.length();
	}
	return url.substr(path_start, path_end - path_start);
}

std::string ExtractHostPrefix(const std::string &url) {
	std::string host = ExtractBaseDomain(url);
	std::string path = ExtractPath(url);

	// First non-empty path segment
	size_t pos = 0;
	while (pos < path.length()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.length();
		}
		if (next > pos) {
			return host + "/" + path.substr(pos, next - pos);
		}
		pos = next + 1;
	}
	return host;
}

bool IsSameOrSubdomain(const std::string &host, const std::string &domain) {
	if (host.empty() || domain.empty()) {
		return false;
	}
	if (host == domain) {
		return true;
	}
	std::string suffix = "." + domain;
	return host.length() > suffix.length() && EndsWith(host, suffix);
}

} // namespace politecrawl
