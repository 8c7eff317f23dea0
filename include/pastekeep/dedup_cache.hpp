#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pastekeep {

/**
 * In-memory record of recently seen item identifiers.
 *
 * Each identifier is either absent or present with the time it was last
 * marked. Mark() inserts or refreshes; Evict() drops every record older than
 * the retention window. Nothing here is persisted: a new cache starts empty,
 * so dedup only holds for the lifetime of the process unless the caller
 * mirrors records elsewhere (see scraper::Poller).
 *
 * Thread-safe: one mutex covers Mark, Seen and Evict.
 */
class DedupCache {
 public:
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;
  using Duration = Clock::duration;

  DedupCache() = default;

  DedupCache(const DedupCache&) = delete;
  DedupCache& operator=(const DedupCache&) = delete;

  /** Record id as seen at `now`, refreshing an existing record. */
  void Mark(std::string_view id, TimePoint now);

  /** Membership test. Does not refresh the timestamp. */
  bool Seen(std::string_view id) const;

  /** Timestamp of the last Mark() for id, if present. */
  std::optional<TimePoint> LastSeen(std::string_view id) const;

  /**
   * Remove every record with now - last_seen > max_age.
   * Removed identifiers are appended to *evicted when it is non-null.
   * Returns the number of records removed.
   */
  size_t Evict(TimePoint now, Duration max_age, std::vector<std::string>* evicted = nullptr);

  size_t Size() const;

  void Clear();

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, TimePoint> entries_;
};

}  // namespace pastekeep
