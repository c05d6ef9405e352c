#include "content_dispatcher.hpp"
#include "crawler_utils.hpp"
#include "html_extractor.hpp"
#include "sitemap_parser.hpp"
#include <libxml/parser.h>

namespace politecrawl {

constexpr size_t ContentDispatcher::CONTENT_PREVIEW_CHARS;

ContentDispatcher::ContentDispatcher() {
	// libxml2 must be initialized once before parsers run on several threads
	xmlInitParser();
}

bool ContentDispatcher::IsSitemapResponse(const std::string &url, const std::string &content_type) {
	return LooksLikeSitemap(url) || ToLower(content_type).find("xml") != std::string::npos;
}

DispatchResult ContentDispatcher::Dispatch(const std::string &url, const HttpResponse &response) const {
	DispatchResult result;
	result.is_sitemap = IsSitemapResponse(url, response.content_type);
	if (result.is_sitemap) {
		DispatchSitemap(url, response, result);
	} else {
		DispatchHtml(url, response, result);
	}
	return result;
}

void ContentDispatcher::DispatchSitemap(const std::string &url, const HttpResponse &response,
                                        DispatchResult &result) const {
	std::string xml = SitemapParser::DecodeBody(url, response.body);
	SitemapData sitemap = SitemapParser::Parse(xml);

	switch (sitemap.kind) {
	case SitemapKind::INDEX:
		for (const auto &loc : sitemap.sitemap_urls) {
			std::string child = NormalizeUrl(loc);
			if (HasHttpScheme(child)) {
				result.discovered.push_back({child, true});
			}
		}
		break;
	case SitemapKind::URLSET:
		for (const auto &loc : sitemap.page_urls) {
			std::string page = NormalizeUrl(loc);
			if (HasHttpScheme(page)) {
				result.discovered.push_back({page, false});
			}
		}
		break;
	case SitemapKind::UNRECOGNIZED:
		result.warnings.push_back("Unrecognized sitemap format (root element <" + sitemap.root_tag + ">)");
		break;
	case SitemapKind::PARSE_ERROR:
		result.warnings.push_back("Sitemap XML parse error: " + sitemap.error);
		break;
	}
}

void ContentDispatcher::DispatchHtml(const std::string &url, const HttpResponse &response,
                                     DispatchResult &result) const {
	HtmlPage page = ExtractHtmlPage(response.body, url);

	for (auto &link : page.links) {
		result.discovered.push_back({std::move(link), false});
	}

	result.record = duckdb::make_uniq<ContentRecord>();
	result.record->url = url;
	result.record->title = page.title;
	result.record->status_code = response.status_code;
	result.record->content = TruncateUtf8(page.text, CONTENT_PREVIEW_CHARS);
}

} // namespace politecrawl
