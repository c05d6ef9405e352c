#include "crawler_settings.hpp"
#include "crawler_utils.hpp"
#include "duckdb.hpp"
#include <algorithm>
#include <thread>

namespace politecrawl {

int AutoThreadCount() {
	unsigned int cores = std::thread::hardware_concurrency();
	if (cores == 0) {
		cores = 4;
	}
	// Workers mostly wait on the network
	return std::max(2, std::min(static_cast<int>(cores) * 4, 32));
}

static std::string DirectoryOf(const std::string &path) {
	size_t slash = path.rfind('/');
	if (slash == std::string::npos) {
		return "";
	}
	return path.substr(0, slash + 1);
}

void ResolveCrawlerSettings(CrawlerSettings &settings) {
	std::string dir = settings.db_path == ":memory:" ? "" : DirectoryOf(settings.db_path);
	if (settings.output_path.empty()) {
		settings.output_path = dir + "scraped_data.jsonl";
	}
	if (settings.log_path.empty()) {
		settings.log_path = dir + "crawler.log";
	}
	if (settings.num_workers <= 0) {
		settings.num_workers = AutoThreadCount();
	}
}

static int64_t ParseInteger(const std::string &key, const std::string &value, int64_t min_value, int64_t max_value) {
	int64_t result;
	size_t consumed = 0;
	try {
		result = std::stoll(value, &consumed);
	} catch (const std::exception &) {
		throw duckdb::InvalidInputException("Option --%s expects an integer, got '%s'", key, value);
	}
	if (consumed != value.size()) {
		throw duckdb::InvalidInputException("Option --%s expects an integer, got '%s'", key, value);
	}
	if (result < min_value || result > max_value) {
		throw duckdb::InvalidInputException("Option --%s must be between %lld and %lld", key,
		                                    static_cast<int64_t>(min_value), static_cast<int64_t>(max_value));
	}
	return result;
}

static double ParseDouble(const std::string &key, const std::string &value) {
	double result;
	size_t consumed = 0;
	try {
		result = std::stod(value, &consumed);
	} catch (const std::exception &) {
		throw duckdb::InvalidInputException("Option --%s expects a number, got '%s'", key, value);
	}
	if (consumed != value.size() || result < 0) {
		throw duckdb::InvalidInputException("Option --%s expects a non-negative number, got '%s'", key, value);
	}
	return result;
}

static std::string RequireValue(const std::string &key, const std::string &value) {
	if (TrimString(value).empty()) {
		throw duckdb::InvalidInputException("Option --%s requires a value", key);
	}
	return value;
}

static void ApplyOption(CrawlerSettings &settings, const std::string &key, const std::string &value) {
	if (key == "db") {
		settings.db_path = RequireValue(key, value);
	} else if (key == "output") {
		settings.output_path = RequireValue(key, value);
	} else if (key == "workers") {
		settings.num_workers = static_cast<int>(ParseInteger(key, value, 0, 256));
	} else if (key == "delay") {
		settings.politeness_delay_seconds = ParseDouble(key, value);
	} else if (key == "max-retries") {
		settings.max_retries = static_cast<int>(ParseInteger(key, value, 1, 1000));
	} else if (key == "poll-ms") {
		settings.queue_poll_ms = static_cast<int>(ParseInteger(key, value, 10, 60000));
	} else if (key == "timeout") {
		settings.timeout_seconds = static_cast<int>(ParseInteger(key, value, 1, 3600));
	} else if (key == "connect-timeout") {
		settings.connect_timeout_seconds = static_cast<int>(ParseInteger(key, value, 1, 3600));
	} else if (key == "user-agent") {
		settings.user_agent = RequireValue(key, value);
	} else if (key == "log") {
		settings.log_path = RequireValue(key, value);
	} else if (key == "log-max-bytes") {
		settings.log_max_bytes = static_cast<size_t>(ParseInteger(key, value, 1024, INT64_C(1) << 40));
	} else if (key == "log-files") {
		settings.log_max_files = static_cast<size_t>(ParseInteger(key, value, 1, 100));
	} else if (key == "log-level") {
		std::string level = ToLower(value);
		if (level != "trace" && level != "debug" && level != "info" && level != "warn" &&
		    level != "error" && level != "off") {
			throw duckdb::InvalidInputException("Option --log-level must be one of trace, debug, info, warn, error, off");
		}
		settings.log_level = level;
	} else {
		throw duckdb::InvalidInputException("Unknown option --%s", key);
	}
}

CrawlerSettings ParseCrawlerSettings(const std::vector<std::string> &args) {
	CrawlerSettings settings;

	for (const auto &arg : args) {
		if (arg == "--help" || arg == "-h") {
			settings.show_help = true;
			continue;
		}
		if (!StartsWith(arg, "--")) {
			settings.seeds.push_back(arg);
			continue;
		}
		size_t eq = arg.find('=');
		if (eq == std::string::npos) {
			throw duckdb::InvalidInputException("Option %s must be written as --key=value", arg);
		}
		ApplyOption(settings, ToLower(arg.substr(2, eq - 2)), arg.substr(eq + 1));
	}

	ResolveCrawlerSettings(settings);
	return settings;
}

std::string CrawlerUsage() {
	return "Usage: politecrawl [options] [seed-url ...]\n"
	       "\n"
	       "Options:\n"
	       "  --db=PATH               Frontier database (default crawler_state.duckdb)\n"
	       "  --output=PATH           JSON lines content file (default scraped_data.jsonl)\n"
	       "  --workers=N             Worker threads, 0 = auto (default 0)\n"
	       "  --delay=SECONDS         Politeness delay before each fetch (default 1.0)\n"
	       "  --max-retries=N         Failures before a URL is marked error (default 3)\n"
	       "  --timeout=SECONDS       Fetch timeout (default 15)\n"
	       "  --connect-timeout=SECONDS\n"
	       "                          Connect timeout (default 10)\n"
	       "  --user-agent=STRING     User-Agent header\n"
	       "  --poll-ms=N             Work queue poll interval (default 1000)\n"
	       "  --log=PATH              Log file (default crawler.log)\n"
	       "  --log-max-bytes=N       Rotate the log after N bytes (default 5 MiB)\n"
	       "  --log-files=N           Rotated log files kept (default 5)\n"
	       "  --log-level=LEVEL       trace, debug, info, warn, error, off (default info)\n";
}

} // namespace politecrawl
