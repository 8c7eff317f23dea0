#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace pastekeep::internal {

// Monotonic timestamp helper for metrics and timeouts (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

inline bool IsRetryableTxnStatus(const rocksdb::Status& s) {
  return s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsAborted();
}

// ---------------------------------------------------------------------------
// Bucket <-> column family naming
// ---------------------------------------------------------------------------

// Buckets map to column families "bucket/<name>". The RocksDB default column
// family never carries user data, so "default" is an ordinary bucket name.
constexpr std::string_view kBucketPrefix = "bucket/";

inline std::string BucketColumnFamilyName(std::string_view bucket) {
  std::string name(kBucketPrefix);
  name.append(bucket.data(), bucket.size());
  return name;
}

inline bool ParseBucketColumnFamilyName(std::string_view cf_name, std::string* bucket) {
  if (cf_name.substr(0, kBucketPrefix.size()) != kBucketPrefix) return false;
  *bucket = std::string(cf_name.substr(kBucketPrefix.size()));
  return true;
}

// RocksDB reports a held LOCK file as an IOError whose message mentions the
// lock ("While lock file: ..." across processes, "lock hold by current
// process" within one).
inline bool IsLockError(const rocksdb::Status& s) {
  if (!s.IsIOError()) return false;
  const char* state = s.getState();
  if (state == nullptr) return false;
  std::string_view msg(state);
  return msg.find("lock file") != std::string_view::npos ||
         msg.find("lock hold by current process") != std::string_view::npos;
}

}  // namespace pastekeep::internal
