#pragma once

#include <string>
#include <cstdint>

namespace politecrawl {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class CrawlErrorType : uint8_t {
	NONE = 0,
	NETWORK_TIMEOUT = 1,
	NETWORK_DNS_FAILURE = 2,
	NETWORK_CONNECTION_REFUSED = 3,
	NETWORK_SSL_ERROR = 4,
	HTTP_CLIENT_ERROR = 5,
	HTTP_SERVER_ERROR = 6,
	HTTP_RATE_LIMITED = 7,
	CONTENT_DECODE_ERROR = 8
};

const char* ErrorTypeToString(CrawlErrorType type);
CrawlErrorType ClassifyError(int status_code, const std::string &error_msg);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
std::string DecompressGzip(const std::string &compressed_data);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

//===--------------------------------------------------------------------===//
// String Utilities
//===--------------------------------------------------------------------===//

std::string TrimString(const std::string &str);
std::string ToLower(const std::string &str);
bool StartsWith(const std::string &str, const std::string &prefix);
bool EndsWith(const std::string &str, const std::string &suffix);

// First max_chars UTF-8 code points of text
std::string TruncateUtf8(const std::string &text, size_t max_chars);

//===--------------------------------------------------------------------===//
// URL Utilities
//===--------------------------------------------------------------------===//

// Trim whitespace. Returns empty string for blank input, otherwise the
// trimmed URL unchanged (no case folding, no slash or query rewriting).
std::string NormalizeUrl(const std::string &url);

// True if the URL starts with http:// or https://
bool HasHttpScheme(const std::string &url);

// Validate URL for crawling. Returns true if URL is valid.
// Checks: http/https scheme, non-empty hostname, max length
bool IsValidCrawlUrl(const std::string &url);

// Get validation error message for URL. Returns empty string if valid.
std::string GetUrlValidationError(const std::string &url);

// URL-shape sitemap hint: ends in .xml or .xml.gz, or contains "sitemap"
bool LooksLikeSitemap(const std::string &url);

// Extract host from URL (without port or userinfo), lowercased
std::string ExtractDomain(const std::string &url);

// Host with "www." stripped; the key used for domain grouping
std::string ExtractBaseDomain(const std::string &url);

// Extract path from URL (without query string or fragment)
std::string ExtractPath(const std::string &url);

// "host" or "host/first-segment" for prefix statistics
std::string ExtractHostPrefix(const std::string &url);

// Host equals domain, or is a dotted subdomain of it
bool IsSameOrSubdomain(const std::string &host, const std::string &domain);

} // namespace politecrawl
