#pragma once

#include <pastekeep/store.hpp>

#include <chrono>
#include <cstdint>
#include <string>

#include <trantor/utils/Logger.h>

namespace pastekeep::scraper {

inline constexpr const char* kDefaultScrapeUrl =
    "https://scrape.pastebin.com/api_scraping.php?limit=100";

/**
 * Scraper configuration.
 *
 * File format (sections optional):
 *   db_path: /var/lib/pastekeep
 *   scraper:
 *     scrape_url: https://...
 *     poll_interval: 60s
 *     max_age: 1h
 *   store:
 *     open_timeout_ms: 50
 */
struct Config {
  std::string db_path;

  // scraper
  std::string scrape_url = kDefaultScrapeUrl;
  std::chrono::milliseconds poll_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds max_age{std::chrono::hours(1)};
  uint32_t fetch_timeout_ms = 10000;
  bool download = true;
  std::string archive_bucket = "pastes";
  std::string seen_bucket = "seen";
  std::string log_level = "info";

  pastekeep::Options store;

  // Set by --help; the caller prints Usage() and exits.
  bool show_help = false;

  /**
   * Load configuration from a config file.
   * @throws std::runtime_error if the file cannot be read or a value is invalid.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse command-line arguments. With --config the file is loaded first and
   * flags given on the command line override its values.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /** log_level as a trantor level. Call after Validate(). */
  trantor::Logger::LogLevel TrantorLogLevel() const;

  static std::string Usage(const char* argv0);
};

/**
 * Parse "250ms", "30s", "5m", "1h", or a bare number of seconds.
 * @throws std::runtime_error on malformed input.
 */
std::chrono::milliseconds ParseDuration(const std::string& text);

}  // namespace pastekeep::scraper
