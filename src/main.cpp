#include "crawler.hpp"
#include "crawler_log.hpp"
#include "crawler_settings.hpp"
#include "crawler_utils.hpp"
#include "http_client.hpp"
#include "duckdb.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <signal.h>
#include <iostream>
#include <memory>

using namespace politecrawl;

// Global signal flag for graceful shutdown
static std::atomic<bool> g_shutdown_requested(false);

static void SignalHandler(int signum) {
	if (signum == SIGINT) {
		g_shutdown_requested = true;
	}
}

// No SA_RESTART, so a blocked read on stdin returns when Ctrl+C arrives
static void InstallSignalHandler() {
	struct sigaction action;
	action.sa_handler = SignalHandler;
	sigemptyset(&action.sa_mask);
	action.sa_flags = 0;
	sigaction(SIGINT, &action, nullptr);
}

static std::string ErrorMessage(const std::exception &ex) {
	return duckdb::ErrorData(ex).Message();
}

static void PrintHelp() {
	std::cout << "Commands:\n"
	             "  seed <url>              add a new seed URL (page or sitemap)\n"
	             "  pause <url>             pause a single pending URL\n"
	             "  pause-prefix <prefix>   pause all pending URLs with the prefix\n"
	             "  resume <url>            resume a paused URL\n"
	             "  resume-prefix <prefix>  resume paused URLs with the prefix\n"
	             "  resume-all              resume every paused URL\n"
	             "  resume-domain <domain>  resume paused URLs of a domain and its subdomains\n"
	             "  list-paused             list paused URLs\n"
	             "  list-pending <prefix>   list pending URLs with the prefix\n"
	             "  stats [n]               totals and top hosts/prefixes\n"
	             "  status                  worker and URL counts\n"
	             "  start                   start the worker pool\n"
	             "  stop / quit / exit      save state and exit\n"
	             "  help                    show this help\n";
}

static void PrintStatus(Crawler &crawler) {
	auto counts = crawler.GetStatusCounts();
	std::cout << "Workers: " << crawler.WorkerCount() << (crawler.IsRunning() ? " (running)" : " (idle)")
	          << " | Queued: " << crawler.Queue().Size() << " | Pending: " << counts.pending
	          << ", Visited: " << counts.visited << ", Paused: " << counts.paused << ", Error: " << counts.error
	          << "\n";
}

static void PrintCounts(const char *title, const std::vector<CountEntry> &entries) {
	std::cout << title << ":\n";
	if (entries.empty()) {
		std::cout << "  (none)\n";
		return;
	}
	for (const auto &entry : entries) {
		std::cout << "  " << entry.count << "  " << entry.key << "\n";
	}
}

static void PrintStats(Crawler &crawler, size_t top_n) {
	auto stats = crawler.Stats(top_n);
	std::cout << "Total URLs: " << stats.counts.Total() << " (pending " << stats.counts.pending << ", visited "
	          << stats.counts.visited << ", paused " << stats.counts.paused << ", error " << stats.counts.error
	          << ")\n";
	std::cout << "Earliest seed: " << (stats.earliest_url.empty() ? "(none)" : stats.earliest_url) << "\n";
	std::string domain = crawler.MainDomain();
	std::cout << "Main domain: " << (domain.empty() ? "(unknown)" : domain) << "\n";
	PrintCounts("Top paused hosts", stats.top_paused_hosts);
	PrintCounts("Top paused prefixes", stats.top_paused_prefixes);
	PrintCounts("Top hosts", stats.top_hosts);
}

static void PrintList(const std::vector<std::string> &urls, size_t limit) {
	for (size_t i = 0; i < urls.size() && i < limit; i++) {
		std::cout << "  " << urls[i] << "\n";
	}
	if (urls.size() > limit) {
		std::cout << "  ... (" << (urls.size() - limit) << " more)\n";
	}
}

static void StartCrawler(Crawler &crawler) {
	if (crawler.IsRunning()) {
		std::cout << "Crawler is already running.\n";
		return;
	}
	std::string domain = crawler.MainDomain();
	int64_t resumed;
	if (!domain.empty()) {
		resumed = crawler.ResumeForDomain(domain);
		std::cout << "Resumed " << resumed << " paused URL(s) for main domain " << domain << ".\n";
	} else {
		resumed = crawler.ResumeAll();
		std::cout << "Resumed " << resumed << " paused URL(s).\n";
	}
	crawler.Start();
	std::cout << "Crawler started with " << crawler.WorkerCount() << " workers.\n";
}

static void ReportSeed(SeedResult result, const std::string &url) {
	switch (result) {
	case SeedResult::SEEDED:
		std::cout << "Seeded " << url << "\n";
		break;
	case SeedResult::ALREADY_KNOWN:
		std::cout << "Already known: " << url << "\n";
		break;
	case SeedResult::INVALID:
		std::cout << "Invalid URL (http:// or https:// required): " << url << "\n";
		break;
	}
}

// Returns false when the loop should end
static bool RunCommand(Crawler &crawler, const std::string &line) {
	std::string trimmed = TrimString(line);
	if (trimmed.empty()) {
		return true;
	}
	size_t space = trimmed.find_first_of(" \t");
	std::string cmd = ToLower(trimmed.substr(0, space));
	std::string arg = space == std::string::npos ? "" : TrimString(trimmed.substr(space + 1));

	if (cmd == "quit" || cmd == "stop" || cmd == "exit") {
		return false;
	} else if (cmd == "help") {
		PrintHelp();
	} else if (cmd == "seed") {
		if (arg.empty()) {
			std::cout << "Usage: seed <url>\n";
		} else {
			ReportSeed(crawler.Seed(arg), arg);
		}
	} else if (cmd == "pause") {
		if (arg.empty()) {
			std::cout << "Usage: pause <url>\n";
		} else {
			std::cout << (crawler.PauseUrl(arg) ? "Paused " : "Not paused (unknown or not pending): ") << arg << "\n";
		}
	} else if (cmd == "pause-prefix") {
		if (arg.empty()) {
			std::cout << "Usage: pause-prefix <prefix>\n";
		} else {
			std::cout << "Paused " << crawler.PausePrefix(arg) << " URL(s) with prefix " << arg << "\n";
		}
	} else if (cmd == "resume") {
		if (arg.empty()) {
			std::cout << "Usage: resume <url>\n";
		} else {
			std::cout << (crawler.ResumeUrl(arg) ? "Resumed " : "Not resumed (unknown or not paused): ") << arg << "\n";
		}
	} else if (cmd == "resume-prefix") {
		if (arg.empty()) {
			std::cout << "Usage: resume-prefix <prefix>\n";
		} else {
			std::cout << "Resumed " << crawler.ResumePrefix(arg) << " URL(s) with prefix " << arg << "\n";
		}
	} else if (cmd == "resume-all") {
		std::cout << "Resumed " << crawler.ResumeAll() << " URL(s)\n";
	} else if (cmd == "resume-domain") {
		if (arg.empty()) {
			std::cout << "Usage: resume-domain <domain>\n";
		} else {
			std::cout << "Resumed " << crawler.ResumeForDomain(arg) << " URL(s) for " << arg << "\n";
		}
	} else if (cmd == "list-paused") {
		auto paused = crawler.ListPaused();
		std::cout << paused.size() << " paused URL(s):\n";
		PrintList(paused, paused.size());
	} else if (cmd == "list-pending") {
		if (arg.empty()) {
			std::cout << "Usage: list-pending <prefix>\n";
		} else {
			auto pending = crawler.ListPendingByPrefix(arg);
			std::cout << "Found " << pending.size() << " pending URL(s) with prefix " << arg << ":\n";
			PrintList(pending, 20);
		}
	} else if (cmd == "stats") {
		size_t top_n = 10;
		if (!arg.empty()) {
			try {
				top_n = static_cast<size_t>(std::max(1, std::stoi(arg)));
			} catch (const std::exception &) {
				std::cout << "Usage: stats [n]\n";
				return true;
			}
		}
		PrintStats(crawler, top_n);
	} else if (cmd == "status") {
		PrintStatus(crawler);
	} else if (cmd == "start") {
		StartCrawler(crawler);
	} else {
		std::cout << "Unknown command: '" << cmd << "'. Type 'help' for the list of commands.\n";
	}
	return true;
}

int main(int argc, char **argv) {
	std::vector<std::string> args(argv + 1, argv + argc);

	CrawlerSettings settings;
	try {
		settings = ParseCrawlerSettings(args);
	} catch (const std::exception &ex) {
		std::cerr << "Error: " << ErrorMessage(ex) << "\n\n" << CrawlerUsage();
		return 1;
	}
	if (settings.show_help) {
		std::cout << CrawlerUsage();
		return 0;
	}

	try {
		InitializeCrawlerLog(settings);
	} catch (const std::exception &ex) {
		std::cerr << "Error: " << ErrorMessage(ex) << "\n";
		return 1;
	}
	InitializeHttpClient();
	spdlog::info("politecrawl starting ({})", HttpConnectionPool::GetHttpVersionString());

	int exit_code = 0;
	try {
		FetchOptions fetch_options;
		fetch_options.user_agent = settings.user_agent;
		fetch_options.timeout_seconds = settings.timeout_seconds;
		fetch_options.connect_timeout_seconds = settings.connect_timeout_seconds;

		Crawler crawler(settings, std::make_shared<CurlPageFetcher>(fetch_options));
		InstallSignalHandler();

		std::cout << "=== politecrawl ===\n";
		for (const auto &seed : settings.seeds) {
			ReportSeed(crawler.Seed(seed), seed);
		}
		PrintStatus(crawler);
		std::cout << "Type 'start' to begin crawling or 'help' for commands.\n";

		std::string line;
		while (!g_shutdown_requested) {
			std::cout << "> " << std::flush;
			if (!std::getline(std::cin, line)) {
				// EOF or interrupted read
				break;
			}
			try {
				if (!RunCommand(crawler, line)) {
					break;
				}
			} catch (const std::exception &ex) {
				std::cout << "Error: " << ErrorMessage(ex) << "\n";
				spdlog::error("Command '{}' failed: {}", line, ErrorMessage(ex));
			}
		}

		if (g_shutdown_requested) {
			std::cout << "\nInterrupt received.\n";
		}
		std::cout << "Stopping crawler and saving state...\n";
		crawler.Stop();
		std::cout << "State saved to " << settings.db_path << "\n";
	} catch (const std::exception &ex) {
		std::cerr << "Error: " << ErrorMessage(ex) << "\n";
		spdlog::critical("Fatal: {}", ErrorMessage(ex));
		exit_code = 1;
	}

	CleanupHttpClient();
	ShutdownCrawlerLog();
	return exit_code;
}
