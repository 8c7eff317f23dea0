#include <pastekeep/dedup_cache.hpp>

namespace pastekeep {

void DedupCache::Mark(std::string_view id, TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_[std::string(id)] = now;
}

bool DedupCache::Seen(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.find(std::string(id)) != entries_.end();
}

std::optional<DedupCache::TimePoint> DedupCache::LastSeen(std::string_view id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(std::string(id));
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

size_t DedupCache::Evict(TimePoint now, Duration max_age, std::vector<std::string>* evicted) {
  std::lock_guard<std::mutex> lock(mu_);

  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now - it->second > max_age) {
      if (evicted) evicted->push_back(it->first);
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t DedupCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void DedupCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

}  // namespace pastekeep
