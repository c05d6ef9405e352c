// Unit tests for the JSON lines ContentSink

#include <iostream>
#include <cassert>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <yyjson.h>
#include "content_sink.hpp"
#include "duckdb.hpp"

using namespace politecrawl;

static std::string MakeTempDir() {
	char templ[] = "/tmp/politecrawl_sink_XXXXXX";
	char *dir = mkdtemp(templ);
	assert(dir != nullptr);
	return std::string(dir);
}

static std::vector<std::string> ReadLines(const std::string &path) {
	std::vector<std::string> lines;
	std::ifstream in(path);
	std::string line;
	while (std::getline(in, line)) {
		lines.push_back(line);
	}
	return lines;
}

static std::string GetString(yyjson_val *obj, const char *key) {
	yyjson_val *val = yyjson_obj_get(obj, key);
	assert(val && yyjson_is_str(val));
	return std::string(yyjson_get_str(val), yyjson_get_len(val));
}

void test_json_line_fields() {
	ContentRecord record;
	record.url = "https://example.com/";
	record.title = "Quote \" and \\ backslash";
	record.status_code = 200;
	record.content = "line one\nline two \xc3\xa9";

	std::string line = ContentSink::ToJsonLine(record);
	assert(!line.empty());
	assert(line.find('\n') == std::string::npos);

	yyjson_doc *doc = yyjson_read(line.c_str(), line.size(), 0);
	assert(doc);
	yyjson_val *root = yyjson_doc_get_root(doc);
	assert(yyjson_is_obj(root));
	assert(yyjson_obj_size(root) == 4);
	assert(GetString(root, "url") == record.url);
	assert(GetString(root, "title") == record.title);
	assert(GetString(root, "content") == record.content);
	assert(yyjson_get_int(yyjson_obj_get(root, "status_code")) == 200);
	yyjson_doc_free(doc);
	std::cout << "✓ test_json_line_fields\n";
}

void test_append_creates_and_appends() {
	std::string dir = MakeTempDir();
	std::string path = dir + "/scraped.jsonl";
	ContentSink sink(path);

	ContentRecord first;
	first.url = "https://a.com/1";
	first.status_code = 200;
	sink.Append(first);

	ContentRecord second;
	second.url = "https://a.com/2";
	second.title = "Second";
	second.status_code = 200;
	sink.Append(second);

	auto lines = ReadLines(path);
	assert(lines.size() == 2);
	assert(lines[0].find("https://a.com/1") != std::string::npos);
	assert(lines[1].find("Second") != std::string::npos);

	unlink(path.c_str());
	rmdir(dir.c_str());
	std::cout << "✓ test_append_creates_and_appends\n";
}

void test_concurrent_appends_keep_lines_whole() {
	std::string dir = MakeTempDir();
	std::string path = dir + "/scraped.jsonl";
	ContentSink sink(path);

	std::vector<std::thread> writers;
	for (int t = 0; t < 4; t++) {
		writers.emplace_back([&sink, t]() {
			for (int i = 0; i < 50; i++) {
				ContentRecord record;
				record.url = "https://a.com/" + std::to_string(t) + "/" + std::to_string(i);
				record.content = std::string(200, 'a' + t);
				record.status_code = 200;
				sink.Append(record);
			}
		});
	}
	for (auto &writer : writers) {
		writer.join();
	}

	auto lines = ReadLines(path);
	assert(lines.size() == 200);
	for (const auto &line : lines) {
		yyjson_doc *doc = yyjson_read(line.c_str(), line.size(), 0);
		assert(doc);
		yyjson_doc_free(doc);
	}

	unlink(path.c_str());
	rmdir(dir.c_str());
	std::cout << "✓ test_concurrent_appends_keep_lines_whole\n";
}

void test_unwritable_path_throws() {
	ContentSink sink("/nonexistent-dir/for/politecrawl/out.jsonl");
	ContentRecord record;
	record.url = "https://a.com/";
	bool threw = false;
	try {
		sink.Append(record);
	} catch (const duckdb::IOException &) {
		threw = true;
	}
	assert(threw);
	std::cout << "✓ test_unwritable_path_throws\n";
}

int main() {
	std::cout << "Running content_sink tests...\n\n";

	test_json_line_fields();
	test_append_creates_and_appends();
	test_concurrent_appends_keep_lines_whole();
	test_unwritable_path_throws();

	std::cout << "\nAll tests passed!\n";
	return 0;
}
