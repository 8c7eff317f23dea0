#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>

#include <pastekeep/codec.hpp>
#include <pastekeep/status.hpp>

namespace pastekeep {

/** A minimal metrics sink interface (counters + histograms). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., calls, not-found, retries). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., latency in microseconds, sizes in bytes). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;
};

/**
 * Options for the pastekeep typed store.
 *
 * These are layered on top of RocksDB's Options/TransactionDBOptions.
 */
struct Options {
  // How long Open() keeps retrying while another handle holds the file lock.
  int open_timeout_ms = 50;

  // Transaction behavior
  int lock_timeout_ms = 2000;
  int max_retries = 16;

  // fsync the WAL on every commit.
  bool sync_writes = true;

  // RocksDB performance knobs
  size_t block_cache_bytes = 32ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Observability hook (optional)
  std::shared_ptr<MetricsSink> metrics;
};

class Store;

/**
 * Typed access to one transaction, handed to Store::Update() and
 * Store::View() callbacks. Valid only inside the callback.
 *
 * Buckets are not created here: AddBucket() first, or writes fail with
 * NotFound. Writes through a View() transaction fail with NotSupported.
 * Reads see the transaction's own writes on top of its snapshot.
 */
class Transaction {
 public:
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  template <typename T>
  rocksdb::Status Put(std::string_view bucket, std::string_view key, const T& value) {
    if (IsAbsent(value)) return BadValueError();

    std::string bytes;
    rocksdb::Status s = EncodeValue(value, &bytes);
    if (!s.ok()) return s;

    return PutEncoded(bucket, key, bytes);
  }

  template <typename T>
  rocksdb::Status Get(std::string_view bucket, std::string_view key, T* out) const {
    std::string bytes;
    rocksdb::Status s = GetEncoded(bucket, key, out ? &bytes : nullptr);
    if (!s.ok() || !out) return s;

    T decoded{};
    s = DecodeValue(bytes, &decoded);
    if (!s.ok()) return s;
    *out = std::move(decoded);
    return rocksdb::Status::OK();
  }

  rocksdb::Status Get(std::string_view bucket, std::string_view key, std::nullptr_t) const {
    return GetEncoded(bucket, key, nullptr);
  }

  rocksdb::Status Delete(std::string_view bucket, std::string_view key);

  rocksdb::Status PutEncoded(std::string_view bucket, std::string_view key,
                             std::string_view value_bytes);

  rocksdb::Status GetEncoded(std::string_view bucket, std::string_view key,
                             std::string* bytes_out) const;

  bool read_only() const { return txn_ == nullptr; }

 private:
  friend class Store;

  Transaction(const Store* store, rocksdb::Transaction* txn, const rocksdb::Snapshot* snapshot)
      : store_(store), txn_(txn), snapshot_(snapshot) {}

  rocksdb::ColumnFamilyHandle* Bucket(std::string_view bucket) const;

  const Store* store_;
  rocksdb::Transaction* txn_;  // null for View()
  const rocksdb::Snapshot* snapshot_;
};

/**
 * pastekeep::Store
 *
 * A persistent key-value store for typed values, backed by a RocksDB
 * TransactionDB. Entries live in named buckets; each bucket is its own
 * column family, so keys in different buckets never collide.
 *
 * Values are encoded with Codec<T> (see codec.hpp) and decoded into a
 * destination of the caller's choosing:
 *
 *   store->Put("users", "harry", 100);
 *   int n = 0;
 *   rocksdb::Status s = store->Get("users", "harry", &n);
 *   if (s.IsNotFound()) { ... } else if (IsDecodeError(s)) { ... }
 *
 * All methods are safe for concurrent use. Writes serialize through RocksDB
 * transactions; readers work from an implicit snapshot and never observe a
 * partially committed write.
 *
 * Only one process may hold the database open at a time. A second Open()
 * waits at most Options::open_timeout_ms and then fails with TimedOut.
 */
class Store {
 public:
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  /**
   * Open or create a store at db_path. The leaf directory is created with
   * mode 0750 if needed; leading directories must already exist.
   */
  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<Store>* out,
                              const Options& opt = Options{});

  /** Create the bucket if it does not exist. Existing buckets are left alone. */
  rocksdb::Status AddBucket(std::string_view bucket);

  /**
   * Encode value and store it under (bucket, key), creating the bucket if
   * needed. The key may be empty. An absent value (nullptr, null pointer,
   * empty optional, null Json::Value) fails with BadValue before any I/O.
   */
  template <typename T>
  rocksdb::Status Put(std::string_view bucket, std::string_view key, const T& value) {
    if (IsAbsent(value)) return BadValueError();

    rocksdb::Status s = AddBucket(bucket);
    if (!s.ok()) return s;

    std::string bytes;
    s = EncodeValue(value, &bytes);
    if (!s.ok()) return s;

    return PutEncoded(bucket, key, bytes);
  }

  /**
   * Read (bucket, key) into *out. NotFound if the bucket or key is absent.
   * If out is null only presence is checked. A stored value whose shape does
   * not match T fails with a decode error and leaves *out untouched.
   */
  template <typename T>
  rocksdb::Status Get(std::string_view bucket, std::string_view key, T* out) const {
    std::string bytes;
    rocksdb::Status s = GetEncoded(bucket, key, out ? &bytes : nullptr);
    if (!s.ok() || !out) return s;

    T decoded{};
    s = DecodeValue(bytes, &decoded);
    if (!s.ok()) return s;
    *out = std::move(decoded);
    return rocksdb::Status::OK();
  }

  rocksdb::Status Get(std::string_view bucket, std::string_view key, std::nullptr_t) const {
    return GetEncoded(bucket, key, nullptr);
  }

  /** Presence check; same as Get(bucket, key, nullptr). */
  rocksdb::Status Contains(std::string_view bucket, std::string_view key) const {
    return GetEncoded(bucket, key, nullptr);
  }

  /** Remove (bucket, key). NotFound if it is not present. */
  rocksdb::Status Delete(std::string_view bucket, std::string_view key);

  /** Store pre-encoded value bytes. The bucket must already exist. */
  rocksdb::Status PutEncoded(std::string_view bucket, std::string_view key,
                             std::string_view value_bytes);

  /** Fetch raw value bytes. bytes_out may be null for a presence check. */
  rocksdb::Status GetEncoded(std::string_view bucket, std::string_view key,
                             std::string* bytes_out) const;

  /** Bucket names in sorted order. */
  rocksdb::Status ListBuckets(std::vector<std::string>* out_buckets) const;

  /** Keys of one bucket in sorted order, optionally filtered by prefix. */
  rocksdb::Status ListKeys(std::string_view bucket,
                           std::vector<std::string>* out_keys,
                           uint64_t limit = 0,
                           std::string_view prefix = {}) const;

  rocksdb::Status CountKeys(std::string_view bucket, uint64_t* out_key_count) const;

  /**
   * Close the store and release the file lock. Every later operation fails
   * with a closed error. Safe to call multiple times.
   */
  rocksdb::Status Close();

  bool IsOpen() const;

  using TxnFn = std::function<rocksdb::Status(Transaction*)>;

  /**
   * Run fn inside one read-write transaction. A non-OK status from fn rolls
   * everything back and is returned as is; OK commits atomically. fn must
   * go through the Transaction, not back through this Store.
   */
  rocksdb::Status Update(const TxnFn& fn);

  /** Run fn against one consistent snapshot. Writers are never blocked. */
  rocksdb::Status View(const TxnFn& fn) const;

 private:
  friend class Transaction;

  explicit Store(const Options& opt);

  // Caller holds mu_ (shared or exclusive).
  rocksdb::ColumnFamilyHandle* FindBucketLocked(std::string_view bucket) const;

  rocksdb::Status CloseLocked();

  Options opt_;

  mutable std::shared_mutex mu_;
  rocksdb::TransactionDB* db_ = nullptr;
  rocksdb::ColumnFamilyHandle* default_cf_ = nullptr;
  std::map<std::string, rocksdb::ColumnFamilyHandle*, std::less<>> buckets_;

  std::shared_ptr<rocksdb::Cache> block_cache_;
};

}  // namespace pastekeep
