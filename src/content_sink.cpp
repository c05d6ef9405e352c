#include "content_sink.hpp"
#include "yyjson_guard.hpp"
#include "duckdb.hpp"
#include <fstream>

namespace politecrawl {

ContentSink::ContentSink(std::string path) : path_(std::move(path)) {
}

std::string ContentSink::ToJsonLine(const ContentRecord &record) {
	YyjsonMutDocGuard doc(yyjson_mut_doc_new(nullptr));
	if (!doc) {
		return "";
	}

	yyjson_mut_val *root = yyjson_mut_obj(doc.get());
	yyjson_mut_doc_set_root(doc.get(), root);

	yyjson_mut_obj_add_strncpy(doc.get(), root, "url", record.url.data(), record.url.size());
	yyjson_mut_obj_add_strncpy(doc.get(), root, "title", record.title.data(), record.title.size());
	yyjson_mut_obj_add_int(doc.get(), root, "status_code", record.status_code);
	yyjson_mut_obj_add_strncpy(doc.get(), root, "content", record.content.data(), record.content.size());

	return WriteJsonLine(doc.get());
}

void ContentSink::Append(const ContentRecord &record) {
	std::string line = ToJsonLine(record);
	if (line.empty()) {
		throw duckdb::IOException("Failed to serialize content record for %s", record.url);
	}

	std::lock_guard<std::mutex> lock(mutex_);
	std::ofstream out(path_, std::ios::app | std::ios::binary);
	if (!out) {
		throw duckdb::IOException("Cannot open content file %s", path_);
	}
	out << line << '\n';
	out.flush();
	if (!out) {
		throw duckdb::IOException("Failed to write content file %s", path_);
	}
}

} // namespace politecrawl
