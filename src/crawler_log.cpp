#include "crawler_log.hpp"
#include "duckdb.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace politecrawl {

void InitializeCrawlerLog(const CrawlerSettings &settings) {
	spdlog::drop("politecrawl");
	std::shared_ptr<spdlog::logger> logger;
	try {
		logger = spdlog::rotating_logger_mt("politecrawl", settings.log_path, settings.log_max_bytes,
		                                    settings.log_max_files);
	} catch (const spdlog::spdlog_ex &ex) {
		throw duckdb::IOException("Cannot open log file %s: %s", settings.log_path, std::string(ex.what()));
	}

	logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %l [%t] %v");
	logger->set_level(spdlog::level::from_str(settings.log_level));
	logger->flush_on(spdlog::level::warn);
	spdlog::set_default_logger(logger);
	spdlog::flush_every(std::chrono::seconds(2));
}

void ShutdownCrawlerLog() {
	spdlog::shutdown();
}

} // namespace politecrawl
