#include "html_extractor.hpp"
#include "crawler_utils.hpp"
#include "link_parser.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <cctype>
#include <set>

namespace politecrawl {

// RAII wrapper for xmlDoc
class HtmlDocGuard {
public:
	explicit HtmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~HtmlDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	HtmlDocGuard(const HtmlDocGuard&) = delete;
	HtmlDocGuard& operator=(const HtmlDocGuard&) = delete;

	xmlDocPtr get() const { return doc_; }
	operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

// Helper: get attribute value from xmlNode, returns empty string if not found
static std::string GetAttribute(xmlNodePtr node, const char *attr) {
	xmlChar *value = xmlGetProp(node, BAD_CAST attr);
	if (!value) {
		return "";
	}
	std::string result(reinterpret_cast<char*>(value));
	xmlFree(value);
	return result;
}

static std::string GetNodeText(xmlNodePtr node) {
	xmlChar *content = xmlNodeGetContent(node);
	if (!content) {
		return "";
	}
	std::string result(reinterpret_cast<char*>(content));
	xmlFree(content);
	return result;
}

// Append a text node's words to out, collapsing whitespace runs
static void AppendCollapsed(const char *text, std::string &out) {
	bool pending_space = !out.empty();
	bool wrote = false;
	for (const char *p = text; *p; p++) {
		if (std::isspace(static_cast<unsigned char>(*p))) {
			if (wrote) {
				pending_space = true;
			}
			continue;
		}
		if (pending_space && !out.empty()) {
			out += ' ';
		}
		pending_space = false;
		out += *p;
		wrote = true;
	}
}

static bool IsInvisibleElement(xmlNodePtr node) {
	return xmlStrcasecmp(node->name, BAD_CAST "script") == 0 ||
	       xmlStrcasecmp(node->name, BAD_CAST "style") == 0 ||
	       xmlStrcasecmp(node->name, BAD_CAST "noscript") == 0 ||
	       xmlStrcasecmp(node->name, BAD_CAST "template") == 0;
}

struct WalkState {
	const std::string *base_url;
	HtmlPage *page;
	std::set<std::string> seen_links;
	bool title_found = false;
};

static void WalkNodes(xmlNodePtr node, WalkState &state) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE) {
			if (cur->content) {
				AppendCollapsed(reinterpret_cast<const char*>(cur->content), state.page->text);
			}
			continue;
		}
		if (cur->type != XML_ELEMENT_NODE) {
			continue;
		}
		if (IsInvisibleElement(cur)) {
			continue;
		}

		if (!state.title_found && xmlStrcasecmp(cur->name, BAD_CAST "title") == 0) {
			state.page->title = TrimString(GetNodeText(cur));
			state.title_found = true;
		}

		if (xmlStrcasecmp(cur->name, BAD_CAST "a") == 0) {
			std::string href = GetAttribute(cur, "href");
			if (!TrimString(href).empty()) {
				std::string link = LinkParser::ToCrawlableUrl(*state.base_url, href);
				if (!link.empty() && state.seen_links.insert(link).second) {
					state.page->links.push_back(link);
				}
			}
		}

		if (cur->children) {
			WalkNodes(cur->children, state);
		}
	}
}

HtmlPage ExtractHtmlPage(const std::string &html, const std::string &base_url) {
	HtmlPage page;
	if (html.empty()) {
		return page;
	}

	HtmlDocGuard doc(htmlReadMemory(
		html.c_str(),
		static_cast<int>(html.size()),
		base_url.c_str(),
		"UTF-8",
		HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
	));

	if (!doc) {
		return page;
	}

	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		return page;
	}

	WalkState state;
	state.base_url = &base_url;
	state.page = &page;
	WalkNodes(root, state);

	return page;
}

} // namespace politecrawl
