#include "sitemap_parser.hpp"
#include "crawler_utils.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

namespace politecrawl {

// RAII wrapper for xmlDoc
class XmlDocGuard {
public:
	explicit XmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~XmlDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	XmlDocGuard(const XmlDocGuard&) = delete;
	XmlDocGuard& operator=(const XmlDocGuard&) = delete;

	xmlDocPtr get() const { return doc_; }
	operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

static std::string LocalName(xmlNodePtr node) {
	if (!node->name) {
		return "";
	}
	return ToLower(reinterpret_cast<const char*>(node->name));
}

// First child element with the given local name
static xmlNodePtr FindChild(xmlNodePtr parent, const char *local_name) {
	for (xmlNodePtr cur = parent->children; cur; cur = cur->next) {
		if (cur->type == XML_ELEMENT_NODE && LocalName(cur) == local_name) {
			return cur;
		}
	}
	return nullptr;
}

// Collect <entry_tag><loc>...</loc></entry_tag> values under root
static void CollectLocs(xmlNodePtr root, const char *entry_tag, std::vector<std::string> &out) {
	for (xmlNodePtr cur = root->children; cur; cur = cur->next) {
		if (cur->type != XML_ELEMENT_NODE || LocalName(cur) != entry_tag) {
			continue;
		}
		xmlNodePtr loc = FindChild(cur, "loc");
		if (!loc) {
			continue;
		}
		xmlChar *content = xmlNodeGetContent(loc);
		if (!content) {
			continue;
		}
		std::string value = TrimString(reinterpret_cast<char*>(content));
		xmlFree(content);
		if (!value.empty()) {
			out.push_back(value);
		}
	}
}

SitemapData SitemapParser::Parse(const std::string &xml_content) {
	SitemapData result;

	XmlDocGuard doc(xmlReadMemory(
		xml_content.c_str(),
		static_cast<int>(xml_content.size()),
		nullptr,
		nullptr,
		XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING
	));

	if (!doc) {
		result.kind = SitemapKind::PARSE_ERROR;
		const xmlError *err = xmlGetLastError();
		if (err && err->message) {
			result.error = TrimString(err->message);
		} else {
			result.error = "malformed XML";
		}
		return result;
	}

	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		result.kind = SitemapKind::PARSE_ERROR;
		result.error = "document has no root element";
		return result;
	}

	result.root_tag = LocalName(root);
	if (result.root_tag == "sitemapindex") {
		result.kind = SitemapKind::INDEX;
		CollectLocs(root, "sitemap", result.sitemap_urls);
	} else if (result.root_tag == "urlset") {
		result.kind = SitemapKind::URLSET;
		CollectLocs(root, "url", result.page_urls);
	} else {
		result.kind = SitemapKind::UNRECOGNIZED;
	}

	return result;
}

std::string SitemapParser::DecodeBody(const std::string &url, const std::string &body) {
	if (!EndsWith(ToLower(url), ".gz")) {
		return body;
	}
	std::string decompressed = DecompressGzip(body);
	if (decompressed.empty()) {
		// Not actually gzip (server already decoded it, or mislabelled)
		return body;
	}
	return decompressed;
}

} // namespace politecrawl
