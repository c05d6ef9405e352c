#pragma once

#include "crawler_settings.hpp"

namespace politecrawl {

// Install a rotating file logger as the spdlog default logger. Throws
// duckdb::IOException when the log file cannot be opened.
void InitializeCrawlerLog(const CrawlerSettings &settings);

// Flush and drop all loggers
void ShutdownCrawlerLog();

} // namespace politecrawl
