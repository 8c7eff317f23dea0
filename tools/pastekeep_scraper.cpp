#include <pastekeep/dedup_cache.hpp>
#include <pastekeep/scraper/archive_processor.hpp>
#include <pastekeep/scraper/config.hpp>
#include <pastekeep/scraper/http.hpp>
#include <pastekeep/scraper/poller.hpp>
#include <pastekeep/shutdown.hpp>
#include <pastekeep/store.hpp>
#include <pastekeep/version.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <iostream>
#include <thread>

int main(int argc, char** argv) {
  try {
    auto config = pastekeep::scraper::Config::LoadFromArgs(argc, argv);
    if (config.show_help) {
      std::cerr << pastekeep::scraper::Config::Usage(argv[0]);
      return 0;
    }
    config.Validate();

    trantor::Logger::setLogLevel(config.TrantorLogLevel());
    LOG_INFO << "pastekeep " << pastekeep::Version() << " starting, db " << config.db_path;

    std::unique_ptr<pastekeep::Store> store;
    auto s = pastekeep::Store::Open(config.db_path, &store, config.store);
    if (!s.ok()) {
      std::cerr << "Open failed: " << s.ToString() << std::endl;
      return 1;
    }

    const double timeout_s = config.fetch_timeout_ms / 1000.0;
    pastekeep::scraper::HttpFetcher listing_fetcher(timeout_s);
    pastekeep::scraper::HttpFetcher paste_fetcher(timeout_s);

    pastekeep::scraper::HttpPasteSource source(&listing_fetcher, config.scrape_url);
    pastekeep::scraper::ArchiveProcessor processor(
        store.get(), config.archive_bucket, config.download ? &paste_fetcher : nullptr);
    pastekeep::DedupCache cache;

    pastekeep::scraper::PollerOptions poller_opt;
    poller_opt.poll_interval = config.poll_interval;
    poller_opt.max_age = config.max_age;
    poller_opt.seen_bucket = config.seen_bucket;
    pastekeep::scraper::Poller poller(poller_opt, &source, &processor, &cache, store.get());

    poller.Restore(pastekeep::DedupCache::Clock::now());

    // Declared after everything it touches, so any exit from this scope runs
    // the stop hook and closes the store while both are still alive.
    std::thread worker;
    pastekeep::ShutdownHandler shutdown;
    shutdown.OnShutdown([&poller, &worker] {
      poller.Stop();
      if (worker.joinable()) worker.join();
    });
    shutdown.RegisterStore(store.get());
    if (!shutdown.InstallSignalHandlers()) {
      std::cerr << "Failed to install signal handlers" << std::endl;
      return 1;
    }

    worker = std::thread([&poller] { poller.Run(); });

    shutdown.WaitForShutdown();
    shutdown.RestoreSignalHandlers();

    s = shutdown.CloseStatus();
    if (!s.ok()) {
      std::cerr << "Close failed: " << s.ToString() << std::endl;
      return 1;
    }
    LOG_INFO << "pastekeep stopped";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
