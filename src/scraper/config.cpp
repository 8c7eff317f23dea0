#include <pastekeep/scraper/config.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace pastekeep::scraper {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw std::runtime_error("Invalid boolean for " + key + ": " + value);
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value[0] == '-') {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    throw std::runtime_error("Invalid number for " + key + ": " + value);
  }
  return v;
}

int ParseInt(const std::string& key, const std::string& value) {
  uint64_t v = ParseUnsigned(key, value);
  if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Number out of range for " + key + ": " + value);
  }
  return static_cast<int>(v);
}

std::chrono::milliseconds ParseDurationFor(const std::string& key, const std::string& value) {
  try {
    return ParseDuration(value);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(key + ": " + e.what());
  }
}

// Applies one setting. Section "" holds top-level keys; "scraper" keys are
// also accepted at top level. Unknown keys are ignored.
void Apply(Config* config, const std::string& section, const std::string& key,
           const std::string& value) {
  if (section.empty() || section == "scraper") {
    if (key == "db_path") {
      config->db_path = value;
    } else if (key == "scrape_url") {
      config->scrape_url = value;
    } else if (key == "poll_interval") {
      config->poll_interval = ParseDurationFor(key, value);
    } else if (key == "max_age") {
      config->max_age = ParseDurationFor(key, value);
    } else if (key == "fetch_timeout_ms") {
      config->fetch_timeout_ms = static_cast<uint32_t>(ParseInt(key, value));
    } else if (key == "download") {
      config->download = ParseBool(key, value);
    } else if (key == "archive_bucket") {
      config->archive_bucket = value;
    } else if (key == "seen_bucket") {
      config->seen_bucket = value;
    } else if (key == "log_level") {
      config->log_level = value;
    }
  } else if (section == "store") {
    if (key == "path") {
      config->db_path = value;
    } else if (key == "open_timeout_ms") {
      config->store.open_timeout_ms = ParseInt(key, value);
    } else if (key == "lock_timeout_ms") {
      config->store.lock_timeout_ms = ParseInt(key, value);
    } else if (key == "max_retries") {
      config->store.max_retries = ParseInt(key, value);
    } else if (key == "sync_writes") {
      config->store.sync_writes = ParseBool(key, value);
    } else if (key == "block_cache_bytes") {
      config->store.block_cache_bytes = ParseUnsigned(key, value);
    }
  }
}

}  // namespace

std::chrono::milliseconds ParseDuration(const std::string& text) {
  std::string s = Trim(text);
  size_t digits = 0;
  while (digits < s.size() && s[digits] >= '0' && s[digits] <= '9') ++digits;
  if (digits == 0) {
    throw std::runtime_error("Invalid duration: '" + text + "'");
  }

  errno = 0;
  unsigned long long n = std::strtoull(s.substr(0, digits).c_str(), nullptr, 10);
  if (errno != 0) {
    throw std::runtime_error("Duration out of range: '" + text + "'");
  }

  const std::string unit = s.substr(digits);
  using namespace std::chrono;
  if (unit.empty() || unit == "s") return duration_cast<milliseconds>(seconds(n));
  if (unit == "ms") return milliseconds(n);
  if (unit == "m") return duration_cast<milliseconds>(minutes(n));
  if (unit == "h") return duration_cast<milliseconds>(hours(n));
  throw std::runtime_error("Invalid duration unit in '" + text + "' (use ms, s, m or h)");
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    Apply(&config, current_section, key, value);
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The config file is loaded first so that flags override it regardless of
  // where --config appears.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--config requires a path argument");
      }
      config_file = argv[i + 1];
    }
  }

  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file);

  struct Flag {
    const char* name;
    const char* section;
    const char* key;
  };
  static const Flag kFlags[] = {
      {"--db-path", "", "db_path"},
      {"--scrape-url", "", "scrape_url"},
      {"--poll-interval", "", "poll_interval"},
      {"--max-age", "", "max_age"},
      {"--fetch-timeout-ms", "", "fetch_timeout_ms"},
      {"--archive-bucket", "", "archive_bucket"},
      {"--seen-bucket", "", "seen_bucket"},
      {"--log-level", "", "log_level"},
      {"--open-timeout-ms", "store", "open_timeout_ms"},
      {"--lock-timeout-ms", "store", "lock_timeout_ms"},
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      continue;
    }
    if (arg == "--config" || arg == "-c") {
      ++i;
      continue;
    }
    if (arg == "--no-download") {
      config.download = false;
      continue;
    }
    if (arg == "--no-sync") {
      config.store.sync_writes = false;
      continue;
    }

    const Flag* match = nullptr;
    for (const auto& flag : kFlags) {
      if (arg == flag.name) {
        match = &flag;
        break;
      }
    }
    if (match == nullptr) {
      throw std::runtime_error("Unknown option: " + arg);
    }
    if (++i >= argc) {
      throw std::runtime_error(arg + " requires a value");
    }
    Apply(&config, match->section, match->key, argv[i]);
  }

  return config;
}

void Config::Validate() const {
  if (db_path.empty()) {
    throw std::runtime_error("db_path is required (use --db-path or config file)");
  }

  if (scrape_url.empty()) {
    throw std::runtime_error("scrape_url must not be empty");
  }

  if (poll_interval.count() <= 0) {
    throw std::runtime_error("poll_interval must be positive");
  }

  if (max_age.count() <= 0) {
    throw std::runtime_error("max_age must be positive");
  }

  if (fetch_timeout_ms == 0) {
    throw std::runtime_error("fetch_timeout_ms must be positive");
  }

  if (store.max_retries < 1) {
    throw std::runtime_error("store.max_retries must be at least 1");
  }

  if (archive_bucket.empty()) {
    throw std::runtime_error("archive_bucket must not be empty");
  }

  // Validate log level
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }
}

trantor::Logger::LogLevel Config::TrantorLogLevel() const {
  if (log_level == "debug") return trantor::Logger::kDebug;
  if (log_level == "warn") return trantor::Logger::kWarn;
  if (log_level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

std::string Config::Usage(const char* argv0) {
  std::ostringstream out;
  out << "Usage: " << argv0 << " [options]\n"
      << "\nOptions:\n"
      << "  --config, -c <path>        Path to config file\n"
      << "  --db-path <path>           Database path (required)\n"
      << "  --scrape-url <url>         Listing URL (default: " << kDefaultScrapeUrl << ")\n"
      << "  --poll-interval <dur>      Time between polls (default: 60s)\n"
      << "  --max-age <dur>            Dedup retention (default: 1h)\n"
      << "  --fetch-timeout-ms <n>     HTTP timeout (default: 10000)\n"
      << "  --no-download              Archive listing metadata only\n"
      << "  --archive-bucket <name>    Bucket for pastes (default: pastes)\n"
      << "  --seen-bucket <name>       Bucket for dedup records, empty disables (default: seen)\n"
      << "  --open-timeout-ms <n>      Store lock wait (default: 50)\n"
      << "  --lock-timeout-ms <n>      Transaction lock wait (default: 2000)\n"
      << "  --no-sync                  Do not fsync on commit\n"
      << "  --log-level <level>        Log level: debug, info, warn, error\n"
      << "  --help, -h                 Show this help\n"
      << "\nDurations: 250ms, 30s, 5m, 1h, or a bare number of seconds.\n";
  return out.str();
}

}  // namespace pastekeep::scraper
