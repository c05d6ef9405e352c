#include "link_parser.hpp"
#include "crawler_utils.hpp"
#include <cctype>

namespace politecrawl {

// Helper: Normalize path (resolve . and ..)
static std::string NormalizePath(const std::string &path) {
	std::vector<std::string> segments;
	size_t pos = 0;

	while (pos < path.length()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.length();
		}

		std::string segment = path.substr(pos, next - pos);

		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (segment != "." && !segment.empty()) {
			segments.push_back(segment);
		}

		pos = next + 1;
	}

	std::string result = "/";
	for (size_t i = 0; i < segments.size(); i++) {
		result += segments[i];
		if (i < segments.size() - 1) {
			result += "/";
		}
	}

	// Preserve trailing slash if original had one (or ended in . / ..)
	bool dir_like = path.length() > 1 &&
	                (path.back() == '/' || EndsWith(path, "/.") || EndsWith(path, "/.."));
	if (dir_like && result.back() != '/') {
		result += "/";
	}

	return result;
}

bool LinkParser::HasScheme(const std::string &href) {
	if (href.empty() || !std::isalpha(static_cast<unsigned char>(href[0]))) {
		return false;
	}
	for (size_t i = 1; i < href.length(); i++) {
		char c = href[i];
		if (c == ':') {
			return true;
		}
		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
			return false;
		}
	}
	return false;
}

std::string LinkParser::StripFragment(const std::string &url) {
	size_t frag = url.find('#');
	if (frag == std::string::npos) {
		return url;
	}
	return url.substr(0, frag);
}

std::string LinkParser::ResolveUrl(const std::string &base_url, const std::string &href) {
	std::string trimmed_href = TrimString(href);
	if (trimmed_href.empty()) {
		return base_url;
	}

	// Already absolute (or another scheme such as mailto:); schemes are case-insensitive
	if (HasScheme(trimmed_href)) {
		size_t colon = trimmed_href.find(':');
		return ToLower(trimmed_href.substr(0, colon)) + trimmed_href.substr(colon);
	}

	size_t proto_end = base_url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}

	// Protocol-relative (//example.com/path)
	if (trimmed_href.length() >= 2 && trimmed_href[0] == '/' && trimmed_href[1] == '/') {
		return base_url.substr(0, proto_end + 1) + trimmed_href;
	}

	size_t domain_start = proto_end + 3;
	size_t path_start = base_url.find_first_of("/?#", domain_start);

	std::string base_origin = (path_start != std::string::npos)
	    ? base_url.substr(0, path_start)
	    : base_url;

	// Fragment only: same document
	if (trimmed_href[0] == '#') {
		return StripFragment(base_url) + trimmed_href;
	}

	// Absolute path (/path)
	if (trimmed_href[0] == '/') {
		size_t suffix = trimmed_href.find_first_of("?#");
		if (suffix == std::string::npos) {
			return base_origin + NormalizePath(trimmed_href);
		}
		return base_origin + NormalizePath(trimmed_href.substr(0, suffix)) + trimmed_href.substr(suffix);
	}

	std::string base_path = (path_start != std::string::npos && base_url[path_start] == '/')
	    ? base_url.substr(path_start)
	    : "/";

	// Remove query string and fragment from base path
	size_t query_pos = base_path.find_first_of("?#");
	if (query_pos != std::string::npos) {
		base_path = base_path.substr(0, query_pos);
	}

	// Query only (?q=1): keep the base path
	if (trimmed_href[0] == '?') {
		return base_origin + base_path + trimmed_href;
	}

	// Relative path (path or ../path): remove filename from base path
	size_t last_slash = base_path.rfind('/');
	if (last_slash != std::string::npos) {
		base_path = base_path.substr(0, last_slash + 1);
	}

	std::string relative = trimmed_href;
	std::string suffix_part;
	size_t suffix = relative.find_first_of("?#");
	if (suffix != std::string::npos) {
		suffix_part = relative.substr(suffix);
		relative = relative.substr(0, suffix);
	}

	return base_origin + NormalizePath(base_path + relative) + suffix_part;
}

std::string LinkParser::ToCrawlableUrl(const std::string &base_url, const std::string &href) {
	std::string resolved = StripFragment(ResolveUrl(base_url, href));
	std::string normalized = NormalizeUrl(resolved);
	if (normalized.empty() || !HasHttpScheme(normalized)) {
		return "";
	}
	return normalized;
}

} // namespace politecrawl
