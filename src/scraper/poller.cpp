#include <pastekeep/scraper/poller.hpp>

#include <trantor/utils/Logger.h>

#include <cstdint>
#include <vector>

namespace pastekeep::scraper {

namespace {

int64_t ToMicros(DedupCache::TimePoint t) {
  return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

// False when `us` does not fit the cache clock's duration type.
bool FromMicros(int64_t us, DedupCache::TimePoint* t) {
  using Micros = std::chrono::microseconds;
  constexpr int64_t kMax =
      std::chrono::duration_cast<Micros>(DedupCache::Duration::max()).count();
  constexpr int64_t kMin =
      std::chrono::duration_cast<Micros>(DedupCache::Duration::min()).count();
  if (us > kMax || us < kMin) return false;
  *t = DedupCache::TimePoint(std::chrono::duration_cast<DedupCache::Duration>(Micros(us)));
  return true;
}

}  // namespace

Poller::Poller(PollerOptions options,
               PasteSource* source,
               PasteProcessor* processor,
               DedupCache* cache,
               Store* store)
    : options_(std::move(options)),
      source_(source),
      processor_(processor),
      cache_(cache),
      store_(store) {}

CycleStats Poller::RunOnce(DedupCache::TimePoint now) {
  CycleStats stats;

  FetchResult listing = source_->Fetch();
  if (!listing.ok) {
    LOG_ERROR << "Fetching paste listing failed, skipping cycle: " << listing.error;
    return stats;
  }
  stats.fetched = true;
  stats.candidates = listing.pastes.size();

  for (Paste& paste : listing.pastes) {
    if (cache_->Seen(paste.key)) {
      ++stats.already_seen;
      continue;
    }

    LOG_DEBUG << "New paste " << paste.key << " (" << paste.size << " bytes)";

    std::string error;
    bool ok = processor_->Download(&paste, &error);
    if (!ok) {
      LOG_WARN << "Download of paste " << paste.key << " failed: " << error;
    } else {
      ok = processor_->Process(paste, &error);
      if (!ok) {
        LOG_WARN << "Processing paste " << paste.key << " failed: " << error;
      }
    }

    if (ok) {
      ++stats.processed;
    } else {
      ++stats.failed;
    }

    // Marked either way so a broken paste is not retried every cycle.
    MarkSeen(paste.key, now);
  }

  LOG_INFO << "Poll cycle: " << stats.candidates << " listed, " << stats.already_seen
           << " already seen, " << stats.processed << " processed, " << stats.failed
           << " failed";
  return stats;
}

size_t Poller::EvictStale(DedupCache::TimePoint now) {
  std::vector<std::string> evicted;
  size_t n = cache_->Evict(now, options_.max_age, Persisting() ? &evicted : nullptr);

  for (const auto& id : evicted) {
    ForgetPersisted(id);
  }

  if (n > 0) {
    LOG_DEBUG << "Evicted " << n << " stale dedup records";
  }
  return n;
}

size_t Poller::Restore(DedupCache::TimePoint now) {
  if (!Persisting()) return 0;

  std::vector<std::string> ids;
  rocksdb::Status s = store_->ListKeys(options_.seen_bucket, &ids);
  if (s.IsNotFound()) return 0;
  if (!s.ok()) {
    LOG_ERROR << "Listing seen records failed: " << s.ToString();
    return 0;
  }

  size_t restored = 0;
  size_t dropped = 0;
  for (const auto& id : ids) {
    int64_t micros = 0;
    s = store_->Get(options_.seen_bucket, id, &micros);
    if (s.IsNotFound()) continue;
    if (!s.ok() && !IsDecodeError(s)) {
      LOG_WARN << "Reading seen record " << id << " failed: " << s.ToString();
      continue;
    }

    DedupCache::TimePoint t;
    if (IsDecodeError(s) || !FromMicros(micros, &t) || now - t > options_.max_age) {
      ForgetPersisted(id);
      ++dropped;
      continue;
    }

    cache_->Mark(id, t);
    ++restored;
  }

  LOG_INFO << "Restored " << restored << " seen records (" << dropped << " dropped)";
  return restored;
}

void Poller::Run() {
  LOG_INFO << "Poller started, interval " << options_.poll_interval.count() << "ms";

  while (!StopRequested()) {
    RunOnce(DedupCache::Clock::now());

    {
      std::unique_lock<std::mutex> lock(mu_);
      if (cv_.wait_for(lock, options_.poll_interval, [this] { return stop_; })) {
        break;
      }
    }

    EvictStale(DedupCache::Clock::now());
  }

  LOG_INFO << "Poller stopped";
}

void Poller::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
}

bool Poller::StopRequested() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stop_;
}

void Poller::MarkSeen(const std::string& id, DedupCache::TimePoint now) {
  cache_->Mark(id, now);
  if (!Persisting()) return;

  rocksdb::Status s = store_->Put(options_.seen_bucket, id, ToMicros(now));
  if (!s.ok()) {
    LOG_WARN << "Persisting seen record " << id << " failed: " << s.ToString();
  }
}

void Poller::ForgetPersisted(const std::string& id) {
  rocksdb::Status s = store_->Delete(options_.seen_bucket, id);
  if (!s.ok() && !s.IsNotFound()) {
    LOG_WARN << "Deleting seen record " << id << " failed: " << s.ToString();
  }
}

}  // namespace pastekeep::scraper
