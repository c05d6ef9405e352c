// Unit tests for ContentDispatcher, SitemapParser and the HTML extractor

#include <iostream>
#include <cassert>
#include <string>
#include <zlib.h>
#include "content_dispatcher.hpp"
#include "html_extractor.hpp"
#include "sitemap_parser.hpp"

using namespace politecrawl;

static std::string GzipCompress(const std::string &input) {
	z_stream zs = {};
	deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
	zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
	zs.avail_in = static_cast<uInt>(input.size());
	std::string out;
	char buffer[4096];
	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(buffer);
		zs.avail_out = sizeof(buffer);
		ret = deflate(&zs, Z_FINISH);
		out.append(buffer, sizeof(buffer) - zs.avail_out);
	} while (ret == Z_OK);
	deflateEnd(&zs);
	return out;
}

static HttpResponse Ok(const std::string &body, const std::string &content_type) {
	HttpResponse response;
	response.status_code = 200;
	response.success = true;
	response.body = body;
	response.content_type = content_type;
	return response;
}

static const char *kSitemapIndex = R"(<?xml version="1.0" encoding="UTF-8"?>
<sitemapindex xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
  <sitemap><loc>https://example.com/sitemap-posts.xml</loc></sitemap>
  <sitemap><loc>
      https://example.com/sitemap-pages.xml.gz
  </loc></sitemap>
</sitemapindex>)";

static const char *kUrlset = R"(<?xml version="1.0" encoding="UTF-8"?>
<urlset xmlns="http://www.sitemaps.org/schemas/sitemap/0.9">
  <url><loc>https://example.com/a</loc><lastmod>2024-01-01</lastmod></url>
  <url><loc>https://example.com/b</loc></url>
  <url><loc>https://example.com/c</loc></url>
</urlset>)";

void test_sitemap_detection() {
	assert(ContentDispatcher::IsSitemapResponse("https://a.com/sitemap.xml", "text/html"));
	assert(ContentDispatcher::IsSitemapResponse("https://a.com/feed.xml.gz", ""));
	assert(ContentDispatcher::IsSitemapResponse("https://a.com/SITEMAP", ""));
	assert(ContentDispatcher::IsSitemapResponse("https://a.com/data", "application/xml; charset=utf-8"));
	assert(!ContentDispatcher::IsSitemapResponse("https://a.com/page", "text/html; charset=utf-8"));
	std::cout << "✓ test_sitemap_detection\n";
}

void test_sitemap_index() {
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/sitemap.xml", Ok(kSitemapIndex, "application/xml"));
	assert(result.is_sitemap);
	assert(!result.record);
	assert(result.warnings.empty());
	assert(result.discovered.size() == 2);
	assert(result.discovered[0].url == "https://example.com/sitemap-posts.xml");
	assert(result.discovered[0].is_sitemap);
	// Whitespace around <loc> text is trimmed
	assert(result.discovered[1].url == "https://example.com/sitemap-pages.xml.gz");
	assert(result.discovered[1].is_sitemap);
	std::cout << "✓ test_sitemap_index\n";
}

void test_sitemap_urlset() {
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/sitemap-pages.xml", Ok(kUrlset, "text/xml"));
	assert(result.is_sitemap);
	assert(result.discovered.size() == 3);
	for (const auto &found : result.discovered) {
		assert(!found.is_sitemap);
	}
	assert(result.discovered[2].url == "https://example.com/c");
	std::cout << "✓ test_sitemap_urlset\n";
}

void test_sitemap_without_namespace_and_uppercase() {
	auto data = SitemapParser::Parse("<URLSET><URL><LOC>https://a.com/x</LOC></URL></URLSET>");
	assert(data.kind == SitemapKind::URLSET);
	assert(data.page_urls.size() == 1 && data.page_urls[0] == "https://a.com/x");
	std::cout << "✓ test_sitemap_without_namespace_and_uppercase\n";
}

void test_unrecognized_root_warns() {
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/feed.xml",
	                                  Ok("<rss><channel><title>x</title></channel></rss>", "application/rss+xml"));
	assert(result.is_sitemap);
	assert(result.discovered.empty());
	assert(result.warnings.size() == 1);
	assert(result.warnings[0].find("rss") != std::string::npos);
	std::cout << "✓ test_unrecognized_root_warns\n";
}

void test_malformed_xml_warns() {
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/sitemap.xml",
	                                  Ok("<urlset><url><loc>https://a.com/</loc>", "application/xml"));
	assert(result.is_sitemap);
	assert(result.warnings.size() == 1);
	assert(result.warnings[0].find("parse") != std::string::npos);
	std::cout << "✓ test_malformed_xml_warns\n";
}

void test_gz_url_with_plain_body() {
	// Server already decoded it: bytes are plain XML despite the .gz name
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/sitemap.xml.gz", Ok(kUrlset, "application/xml"));
	assert(result.is_sitemap);
	assert(result.warnings.empty());
	assert(result.discovered.size() == 3);
	std::cout << "✓ test_gz_url_with_plain_body\n";
}

void test_gz_url_with_gzip_body() {
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/sitemap.xml.gz",
	                                  Ok(GzipCompress(kSitemapIndex), "application/x-gzip"));
	assert(result.is_sitemap);
	assert(result.warnings.empty());
	assert(result.discovered.size() == 2);
	assert(result.discovered[0].is_sitemap);
	std::cout << "✓ test_gz_url_with_gzip_body\n";
}

void test_gz_url_with_multi_member_gzip() {
	std::string first = "<urlset><url><loc>https://e.com/a</loc></url>";
	std::string second = "<url><loc>https://e.com/b</loc></url></urlset>";
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://e.com/sitemap.xml.gz",
	                                  Ok(GzipCompress(first) + GzipCompress(second), "application/x-gzip"));
	assert(result.warnings.empty());
	assert(result.discovered.size() == 2);
	assert(result.discovered[1].url == "https://e.com/b");
	std::cout << "✓ test_gz_url_with_multi_member_gzip\n";
}

void test_html_uppercase_scheme_link() {
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://e.com/",
	                                  Ok("<html><body><a href=\"/a\">a</a><a href=\"https://other.com/b\">b</a>"
	                                     "<a href=\"HTTPS://Upper.com/c\">c</a></body></html>",
	                                     "text/html"));
	assert(result.discovered.size() == 3);
	assert(result.discovered[2].url == "https://Upper.com/c");
	std::cout << "✓ test_html_uppercase_scheme_link\n";
}

void test_sitemap_skips_non_http_locs() {
	auto response = Ok("<urlset><url><loc>ftp://a.com/f</loc></url><url><loc>https://a.com/ok</loc></url>"
	                   "<url><loc>   </loc></url></urlset>",
	                   "application/xml");
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://a.com/sitemap.xml", response);
	assert(result.discovered.size() == 1);
	assert(result.discovered[0].url == "https://a.com/ok");
	std::cout << "✓ test_sitemap_skips_non_http_locs\n";
}

void test_html_links_and_record() {
	std::string html = R"(<html><head><title>  Example Home </title>
<style>body { color: red; }</style>
<script>var hidden = "do not index";</script></head>
<body>
  <h1>Welcome</h1>
  <p>Some   text
     here.</p>
  <a href="/about">About</a>
  <a href="docs/start#intro">Docs</a>
  <a href="/about#team">Team</a>
  <a href="mailto:hello@example.com">Mail</a>
  <a href="javascript:void(0)">JS</a>
  <a>No href</a>
</body></html>)";

	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/index.html", Ok(html, "text/html; charset=utf-8"));
	assert(!result.is_sitemap);
	assert(result.warnings.empty());

	assert(result.discovered.size() == 2);
	assert(result.discovered[0].url == "https://example.com/about");
	assert(result.discovered[1].url == "https://example.com/docs/start");
	assert(!result.discovered[0].is_sitemap);

	assert(result.record);
	assert(result.record->url == "https://example.com/index.html");
	assert(result.record->title == "Example Home");
	assert(result.record->status_code == 200);
	assert(result.record->content.find("Welcome Some text here.") != std::string::npos);
	assert(result.record->content.find("do not index") == std::string::npos);
	assert(result.record->content.find("color") == std::string::npos);
	std::cout << "✓ test_html_links_and_record\n";
}

void test_html_content_truncated() {
	std::string body(1200, 'x');
	std::string html = "<html><body><p>" + body + "</p></body></html>";
	ContentDispatcher dispatcher;
	auto result = dispatcher.Dispatch("https://example.com/long", Ok(html, "text/html"));
	assert(result.record);
	assert(result.record->content.size() == ContentDispatcher::CONTENT_PREVIEW_CHARS);
	assert(result.record->title.empty());
	std::cout << "✓ test_html_content_truncated\n";
}

void test_empty_html() {
	auto page = ExtractHtmlPage("", "https://example.com/");
	assert(page.title.empty() && page.text.empty() && page.links.empty());
	std::cout << "✓ test_empty_html\n";
}

int main() {
	std::cout << "Running content_dispatcher tests...\n\n";

	test_sitemap_detection();
	test_sitemap_index();
	test_sitemap_urlset();
	test_sitemap_without_namespace_and_uppercase();
	test_unrecognized_root_warns();
	test_malformed_xml_warns();
	test_gz_url_with_plain_body();
	test_gz_url_with_gzip_body();
	test_gz_url_with_multi_member_gzip();
	test_html_uppercase_scheme_link();
	test_sitemap_skips_non_http_locs();
	test_html_links_and_record();
	test_html_content_truncated();
	test_empty_html();

	std::cout << "\nAll tests passed!\n";
	return 0;
}
