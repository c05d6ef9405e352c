#pragma once

#include <string>
#include <vector>

namespace politecrawl {

// Result of parsing one HTML page
struct HtmlPage {
	// Contents of the first <title>, trimmed
	std::string title;

	// Visible text: text nodes outside script/style, joined by single spaces
	std::string text;

	// Absolute http(s) targets of every <a href>, fragment stripped, in
	// document order without duplicates
	std::vector<std::string> links;
};

// Parse HTML with libxml2's forgiving HTML parser
HtmlPage ExtractHtmlPage(const std::string &html, const std::string &base_url);

} // namespace politecrawl
