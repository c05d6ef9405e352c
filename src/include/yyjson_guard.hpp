#pragma once

// RAII wrappers for yyjson allocations used by the content sink

#include <yyjson.h>
#include <cstdlib>
#include <string>

namespace politecrawl {

// RAII wrapper for yyjson_mut_doc (mutable document)
class YyjsonMutDocGuard {
public:
	explicit YyjsonMutDocGuard(yyjson_mut_doc *doc) : doc_(doc) {}
	~YyjsonMutDocGuard() { if (doc_) yyjson_mut_doc_free(doc_); }

	// Non-copyable
	YyjsonMutDocGuard(const YyjsonMutDocGuard&) = delete;
	YyjsonMutDocGuard& operator=(const YyjsonMutDocGuard&) = delete;

	yyjson_mut_doc* get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }

private:
	yyjson_mut_doc *doc_;
};

// Serialize a document to one compact line. Returns empty string on failure.
inline std::string WriteJsonLine(yyjson_mut_doc *doc) {
	size_t len = 0;
	yyjson_write_err err;
	char *json_str = yyjson_mut_write_opts(doc, YYJSON_WRITE_ALLOW_INVALID_UNICODE, nullptr, &len, &err);
	if (!json_str) {
		return "";
	}
	std::string result(json_str, len);
	free(json_str);
	return result;
}

} // namespace politecrawl
