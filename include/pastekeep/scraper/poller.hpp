#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>

#include <pastekeep/dedup_cache.hpp>
#include <pastekeep/scraper/source.hpp>
#include <pastekeep/store.hpp>

namespace pastekeep::scraper {

struct PollerOptions {
  std::chrono::milliseconds poll_interval{std::chrono::seconds(60)};

  // Dedup retention window.
  DedupCache::Duration max_age = std::chrono::hours(1);

  // Bucket that mirrors dedup records across restarts. Empty disables it.
  std::string seen_bucket;
};

/** What one poll cycle did. */
struct CycleStats {
  bool fetched = false;     // false: the listing fetch failed, nothing else ran
  size_t candidates = 0;    // pastes in the listing
  size_t already_seen = 0;  // skipped by the dedup cache
  size_t processed = 0;     // downloaded and processed without error
  size_t failed = 0;        // download or process failed (still marked seen)
};

/**
 * Drives the scrape loop: fetch the listing, hand every unseen paste to the
 * processor, mark it seen, and age out old dedup records between cycles.
 *
 * Errors from the source, the processor or the seen-bucket mirror are logged
 * and never stop the loop.
 *
 * RunOnce/EvictStale/Restore are meant to be called from one thread (the one
 * running Run()). Stop() may be called from any thread.
 */
class Poller {
 public:
  // store may be null; then dedup records are not persisted.
  Poller(PollerOptions options,
         PasteSource* source,
         PasteProcessor* processor,
         DedupCache* cache,
         Store* store = nullptr);

  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  CycleStats RunOnce(DedupCache::TimePoint now);

  /** Evict records older than max_age. Returns how many were dropped. */
  size_t EvictStale(DedupCache::TimePoint now);

  /**
   * Reload persisted dedup records into the cache. Stale or unreadable
   * records are deleted from the store. Returns the number restored.
   */
  size_t Restore(DedupCache::TimePoint now);

  /** Loop RunOnce, sleep, EvictStale until Stop(). */
  void Run();

  /** Wake a sleeping Run() and make it return. Sticky. */
  void Stop();

  bool StopRequested() const;

 private:
  bool Persisting() const { return store_ != nullptr && !options_.seen_bucket.empty(); }

  void MarkSeen(const std::string& id, DedupCache::TimePoint now);

  void ForgetPersisted(const std::string& id);

  PollerOptions options_;
  PasteSource* source_;
  PasteProcessor* processor_;
  DedupCache* cache_;
  Store* store_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
};

}  // namespace pastekeep::scraper
