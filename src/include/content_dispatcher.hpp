#pragma once

#include "content_sink.hpp"
#include "http_client.hpp"
#include "duckdb.hpp"
#include <memory>
#include <string>
#include <vector>

namespace politecrawl {

struct DiscoveredUrl {
	std::string url;
	bool is_sitemap = false;
};

struct DispatchResult {
	bool is_sitemap = false;
	std::vector<DiscoveredUrl> discovered;
	duckdb::unique_ptr<ContentRecord> record;   // HTML pages only
	std::vector<std::string> warnings;       // sitemap parse problems; never fatal
};

// Routes a successful fetch to sitemap or HTML extraction
class ContentDispatcher {
public:
	// Characters of visible text kept in a content record
	static constexpr size_t CONTENT_PREVIEW_CHARS = 500;

	ContentDispatcher();

	// URL ends in .xml / .xml.gz, mentions "sitemap", or the content type
	// contains "xml"
	static bool IsSitemapResponse(const std::string &url, const std::string &content_type);

	DispatchResult Dispatch(const std::string &url, const HttpResponse &response) const;

private:
	void DispatchSitemap(const std::string &url, const HttpResponse &response, DispatchResult &result) const;
	void DispatchHtml(const std::string &url, const HttpResponse &response, DispatchResult &result) const;
};

} // namespace politecrawl
