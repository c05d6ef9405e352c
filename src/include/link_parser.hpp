#pragma once

#include <string>
#include <vector>

namespace politecrawl {

class LinkParser {
public:
	// Resolve an href against the page URL. Hrefs that carry their own
	// scheme (https:, mailto:, javascript:, ...) are returned unchanged.
	static std::string ResolveUrl(const std::string &base_url, const std::string &href);

	// Drop the #fragment component
	static std::string StripFragment(const std::string &url);

	// Resolve, strip fragment and normalize; returns empty string unless the
	// result is an http(s) URL worth registering
	static std::string ToCrawlableUrl(const std::string &base_url, const std::string &href);

	// True if href starts with "scheme:" per RFC 3986
	static bool HasScheme(const std::string &href);
};

} // namespace politecrawl
