#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace politecrawl {

enum class SitemapKind : uint8_t {
	URLSET = 0,        // <urlset><url><loc>
	INDEX = 1,         // <sitemapindex><sitemap><loc>
	UNRECOGNIZED = 2,  // well-formed XML with another root element
	PARSE_ERROR = 3    // not well-formed XML
};

struct SitemapData {
	SitemapKind kind = SitemapKind::PARSE_ERROR;
	std::vector<std::string> page_urls;       // <url><loc> entries (urlset)
	std::vector<std::string> sitemap_urls;    // <sitemap><loc> entries (index)
	std::string root_tag;                     // local name of the root element
	std::string error;                        // parser message for PARSE_ERROR
};

class SitemapParser {
public:
	// Parse sitemap XML content. Element names are matched by local name so
	// namespaced and plain documents behave the same.
	static SitemapData Parse(const std::string &xml_content);

	// Gunzip when the URL ends in .gz; returns the raw bytes when they are
	// not valid gzip
	static std::string DecodeBody(const std::string &url, const std::string &body);
};

} // namespace politecrawl
