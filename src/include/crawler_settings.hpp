#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace politecrawl {

struct CrawlerSettings {
	// Storage
	std::string db_path = "crawler_state.duckdb";
	std::string output_path;               // JSON lines content sink (empty = beside db)

	// Worker pool
	int num_workers = 0;                   // 0 = auto (hardware_concurrency * 4, clamped 2-32)
	double politeness_delay_seconds = 1.0; // Sleep before each fetch, per worker
	int max_retries = 3;                   // Failures before a URL becomes terminal
	int queue_poll_ms = 1000;              // Bounded wait on the work queue

	// HTTP
	int timeout_seconds = 15;
	int connect_timeout_seconds = 10;
	std::string user_agent = "politecrawl/1.0 (+https://example.com/bot)";

	// Logging
	std::string log_path;                  // empty = crawler.log beside db
	size_t log_max_bytes = 5 * 1024 * 1024;
	size_t log_max_files = 5;
	std::string log_level = "info";

	// Command line only
	std::vector<std::string> seeds;        // Positional arguments
	bool show_help = false;
};

// Worker count used when num_workers is 0
int AutoThreadCount();

// Fill in derived paths and the automatic worker count
void ResolveCrawlerSettings(CrawlerSettings &settings);

// Parse --key=value options and positional seed URLs. Throws
// duckdb::InvalidInputException on unknown options or invalid values.
CrawlerSettings ParseCrawlerSettings(const std::vector<std::string> &args);

std::string CrawlerUsage();

} // namespace politecrawl
