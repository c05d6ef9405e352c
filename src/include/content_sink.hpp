#pragma once

#include <string>
#include <mutex>

namespace politecrawl {

// One scraped HTML page
struct ContentRecord {
	std::string url;
	std::string title;
	int status_code = 0;
	std::string content;   // first 500 code points of the visible text
};

// Append-only JSON lines file. Each Append opens, writes one line and closes
// the file under a mutex, so a crash loses at most the line being written.
class ContentSink {
public:
	explicit ContentSink(std::string path);

	ContentSink(const ContentSink&) = delete;
	ContentSink& operator=(const ContentSink&) = delete;

	// Throws duckdb::IOException when the file cannot be written
	void Append(const ContentRecord &record);

	// Serialize a record as a single JSON object (no trailing newline)
	static std::string ToJsonLine(const ContentRecord &record);

	const std::string &Path() const { return path_; }

private:
	std::string path_;
	std::mutex mutex_;
};

} // namespace politecrawl
