#include <pastekeep/store.hpp>

#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <thread>

#include <pastekeep/internal.hpp>

namespace pastekeep {

namespace {

constexpr int kOpenRetrySleepMs = 5;

// --------------------------
// Observability helpers
// --------------------------
inline void EmitCounter(const pastekeep::Options& opt,
                        std::string_view name,
                        uint64_t delta = 1) {
  if (opt.metrics) opt.metrics->Counter(name, delta);
}

inline void EmitHistogram(const pastekeep::Options& opt,
                          std::string_view name,
                          uint64_t value) {
  if (opt.metrics) opt.metrics->Histogram(name, value);
}

// Emits <prefix>.latency_us and one of ok/not_found/error totals.
inline rocksdb::Status FinishOp(const pastekeep::Options& opt,
                                const std::string& prefix,
                                uint64_t op_start_us,
                                const rocksdb::Status& st) {
  if (!opt.metrics) return st;
  EmitHistogram(opt, prefix + ".latency_us", internal::NowMicros() - op_start_us);
  if (st.ok()) {
    EmitCounter(opt, prefix + ".ok_total");
  } else if (st.IsNotFound()) {
    EmitCounter(opt, prefix + ".not_found_total");
  } else {
    EmitCounter(opt, prefix + ".error_total");
  }
  return st;
}

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

inline rocksdb::Slice ToSlice(std::string_view s) {
  return rocksdb::Slice(s.data(), s.size());
}

// Seek lands on the first key >= the target, so the key must be compared
// exactly: "ab" must not match a stored "abc".
rocksdb::Status SeekExact(rocksdb::Iterator* it, std::string_view key, std::string* bytes_out) {
  const rocksdb::Slice target = ToSlice(key);
  it->Seek(target);

  if (!it->Valid()) {
    rocksdb::Status s = it->status();
    return s.ok() ? rocksdb::Status::NotFound() : s;
  }
  if (it->key().compare(target) != 0) return rocksdb::Status::NotFound();

  if (bytes_out) bytes_out->assign(it->value().data(), it->value().size());
  return rocksdb::Status::OK();
}

// Create the store directory with owner rwx, group rx.
rocksdb::Status EnsureStoreDirectory(const std::string& db_path) {
  namespace fs = std::filesystem;
  std::error_code ec;

  const fs::path dir(db_path);
  if (fs::exists(dir, ec)) {
    if (!fs::is_directory(dir, ec)) {
      return rocksdb::Status::InvalidArgument("not a directory", db_path);
    }
    return rocksdb::Status::OK();
  }
  if (ec) return rocksdb::Status::IOError("stat " + db_path, ec.message());

  fs::create_directory(dir, ec);
  if (ec) return rocksdb::Status::IOError("create " + db_path, ec.message());

  fs::permissions(dir,
                  fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                  fs::perm_options::replace, ec);
  if (ec) return rocksdb::Status::IOError("chmod " + db_path, ec.message());

  return rocksdb::Status::OK();
}

}  // namespace

Store::Store(const Options& opt) : opt_(opt) {}

Store::~Store() { Close().PermitUncheckedError(); }

rocksdb::Status Store::Open(const std::string& db_path,
                            std::unique_ptr<Store>* out,
                            const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  if (db_path.empty()) return rocksdb::Status::InvalidArgument("db_path is empty");

  rocksdb::Status s = EnsureStoreDirectory(db_path);
  if (!s.ok()) return s;

  auto store = std::unique_ptr<Store>(new Store(opt));

  // RocksDB options
  rocksdb::Options options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  rocksdb::TransactionDBOptions txn_opts;
  txn_opts.transaction_lock_timeout = opt.lock_timeout_ms;

  // Shared cache for all CFs
  store->block_cache_ = rocksdb::NewLRUCache(opt.block_cache_bytes);

  // Discover the buckets of an existing database.
  std::vector<std::string> cf_names;
  std::error_code ec;
  if (std::filesystem::exists(std::filesystem::path(db_path) / "CURRENT", ec)) {
    s = rocksdb::DB::ListColumnFamilies(rocksdb::DBOptions(options), db_path, &cf_names);
    if (!s.ok()) return s;
  }

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  std::vector<std::string> bucket_names;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName,
                   MakeCFOptions(store->block_cache_, opt.bloom_bits_per_key));
  for (const auto& name : cf_names) {
    if (name == rocksdb::kDefaultColumnFamilyName) continue;
    std::string bucket;
    if (!internal::ParseBucketColumnFamilyName(name, &bucket)) {
      return rocksdb::Status::Corruption("unexpected column family", name);
    }
    cfs.emplace_back(name, MakeCFOptions(store->block_cache_, opt.bloom_bits_per_key));
    bucket_names.push_back(std::move(bucket));
  }

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::TransactionDB* db = nullptr;

  // The LOCK file is exclusive. Wait a bounded time for another holder to go
  // away instead of failing on the first attempt.
  const uint64_t deadline_us =
      internal::NowMicros() + static_cast<uint64_t>(std::max(opt.open_timeout_ms, 0)) * 1000ull;
  for (;;) {
    s = rocksdb::TransactionDB::Open(options, txn_opts, db_path, cfs, &handles, &db);
    if (s.ok()) break;

    for (auto* h : handles) delete h;
    handles.clear();
    db = nullptr;

    if (!internal::IsLockError(s)) return s;
    if (internal::NowMicros() >= deadline_us) {
      return rocksdb::Status::TimedOut("timed out waiting for lock on " + db_path,
                                       s.ToString());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kOpenRetrySleepMs));
  }

  store->db_ = db;

  // Descriptor order = handle order
  store->default_cf_ = handles[0];
  for (size_t i = 1; i < handles.size(); ++i) {
    store->buckets_.emplace(std::move(bucket_names[i - 1]), handles[i]);
  }

  *out = std::move(store);
  return rocksdb::Status::OK();
}

rocksdb::ColumnFamilyHandle* Store::FindBucketLocked(std::string_view bucket) const {
  auto it = buckets_.find(bucket);
  return it == buckets_.end() ? nullptr : it->second;
}

rocksdb::Status Store::AddBucket(std::string_view bucket) {
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (!db_) return ClosedError();
    if (FindBucketLocked(bucket)) return rocksdb::Status::OK();
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  if (!db_) return ClosedError();
  if (FindBucketLocked(bucket)) return rocksdb::Status::OK();

  rocksdb::ColumnFamilyHandle* handle = nullptr;
  rocksdb::Status s = db_->CreateColumnFamily(
      MakeCFOptions(block_cache_, opt_.bloom_bits_per_key),
      internal::BucketColumnFamilyName(bucket), &handle);
  if (!s.ok()) return s;

  buckets_.emplace(std::string(bucket), handle);
  EmitCounter(opt_, "pastekeep.bucket.created_total", 1);
  return rocksdb::Status::OK();
}

rocksdb::Status Store::PutEncoded(std::string_view bucket, std::string_view key,
                                  std::string_view value_bytes) {
  EmitCounter(opt_, "pastekeep.put.calls", 1);
  EmitHistogram(opt_, "pastekeep.put.value_bytes", static_cast<uint64_t>(value_bytes.size()));
  const uint64_t op_start_us = internal::NowMicros();

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return FinishOp(opt_, "pastekeep.put", op_start_us, ClosedError());

  rocksdb::ColumnFamilyHandle* cf = FindBucketLocked(bucket);
  if (!cf) {
    return FinishOp(opt_, "pastekeep.put", op_start_us,
                    rocksdb::Status::NotFound("bucket not found"));
  }

  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;

  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
    if (!txn) {
      return FinishOp(opt_, "pastekeep.put", op_start_us,
                      rocksdb::Status::IOError("BeginTransaction returned null"));
    }

    rocksdb::Status s = txn->Put(cf, ToSlice(key), ToSlice(value_bytes));
    if (!s.ok()) {
      if (internal::IsRetryableTxnStatus(s)) {
        EmitCounter(opt_, "pastekeep.txn.retry_total", 1);
        continue;
      }
      return FinishOp(opt_, "pastekeep.put", op_start_us, s);
    }

    s = txn->Commit();
    if (s.ok()) return FinishOp(opt_, "pastekeep.put", op_start_us, s);

    if (internal::IsRetryableTxnStatus(s)) {
      EmitCounter(opt_, "pastekeep.txn.retry_total", 1);
      continue;
    }
    return FinishOp(opt_, "pastekeep.put", op_start_us, s);
  }

  return FinishOp(opt_, "pastekeep.put", op_start_us,
                  rocksdb::Status::TimedOut("Put exceeded max_retries"));
}

rocksdb::Status Store::GetEncoded(std::string_view bucket, std::string_view key,
                                  std::string* bytes_out) const {
  EmitCounter(opt_, "pastekeep.get.calls", 1);
  const uint64_t op_start_us = internal::NowMicros();

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return FinishOp(opt_, "pastekeep.get", op_start_us, ClosedError());

  rocksdb::ColumnFamilyHandle* cf = FindBucketLocked(bucket);
  if (!cf) {
    return FinishOp(opt_, "pastekeep.get", op_start_us,
                    rocksdb::Status::NotFound("bucket not found"));
  }

  rocksdb::ReadOptions ro;
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, cf));
  rocksdb::Status s = SeekExact(it.get(), key, bytes_out);
  if (s.ok() && bytes_out) {
    EmitHistogram(opt_, "pastekeep.get.value_bytes", static_cast<uint64_t>(bytes_out->size()));
  }
  return FinishOp(opt_, "pastekeep.get", op_start_us, s);
}

rocksdb::Status Store::Delete(std::string_view bucket, std::string_view key) {
  EmitCounter(opt_, "pastekeep.delete.calls", 1);
  const uint64_t op_start_us = internal::NowMicros();

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return FinishOp(opt_, "pastekeep.delete", op_start_us, ClosedError());

  rocksdb::ColumnFamilyHandle* cf = FindBucketLocked(bucket);
  if (!cf) {
    return FinishOp(opt_, "pastekeep.delete", op_start_us,
                    rocksdb::Status::NotFound("bucket not found"));
  }

  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;
  rocksdb::ReadOptions ro;

  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;

  for (int attempt = 0; attempt < opt_.max_retries; ++attempt) {
    std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
    if (!txn) {
      return FinishOp(opt_, "pastekeep.delete", op_start_us,
                      rocksdb::Status::IOError("BeginTransaction returned null"));
    }

    // Lock the key and confirm it exists in one step.
    std::string existing;
    rocksdb::Status s = txn->GetForUpdate(ro, cf, ToSlice(key), &existing);
    if (s.IsNotFound()) return FinishOp(opt_, "pastekeep.delete", op_start_us, s);
    if (!s.ok()) {
      if (internal::IsRetryableTxnStatus(s)) {
        EmitCounter(opt_, "pastekeep.txn.retry_total", 1);
        continue;
      }
      return FinishOp(opt_, "pastekeep.delete", op_start_us, s);
    }

    s = txn->Delete(cf, ToSlice(key));
    if (!s.ok()) return FinishOp(opt_, "pastekeep.delete", op_start_us, s);

    s = txn->Commit();
    if (s.ok()) return FinishOp(opt_, "pastekeep.delete", op_start_us, s);

    if (internal::IsRetryableTxnStatus(s)) {
      EmitCounter(opt_, "pastekeep.txn.retry_total", 1);
      continue;
    }
    return FinishOp(opt_, "pastekeep.delete", op_start_us, s);
  }

  return FinishOp(opt_, "pastekeep.delete", op_start_us,
                  rocksdb::Status::TimedOut("Delete exceeded max_retries"));
}

rocksdb::Status Store::ListBuckets(std::vector<std::string>* out_buckets) const {
  if (!out_buckets) return rocksdb::Status::InvalidArgument("out_buckets is null");

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return ClosedError();

  out_buckets->clear();
  out_buckets->reserve(buckets_.size());
  for (const auto& entry : buckets_) {
    out_buckets->push_back(entry.first);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status Store::ListKeys(std::string_view bucket,
                                std::vector<std::string>* out_keys,
                                uint64_t limit,
                                std::string_view prefix) const {
  if (!out_keys) return rocksdb::Status::InvalidArgument("out_keys is null");

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return ClosedError();

  rocksdb::ColumnFamilyHandle* cf = FindBucketLocked(bucket);
  if (!cf) return rocksdb::Status::NotFound("bucket not found");

  out_keys->clear();

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  const rocksdb::Slice prefix_slice = ToSlice(prefix);

  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, cf));
    if (prefix.empty()) {
      it->SeekToFirst();
    } else {
      it->Seek(prefix_slice);
    }

    for (; it->Valid(); it->Next()) {
      if (!prefix.empty() && !it->key().starts_with(prefix_slice)) break;
      out_keys->emplace_back(it->key().data(), it->key().size());
      if (limit != 0 && out_keys->size() >= limit) break;
    }

    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return iter_status;
}

rocksdb::Status Store::CountKeys(std::string_view bucket, uint64_t* out_key_count) const {
  if (!out_key_count) return rocksdb::Status::InvalidArgument("out_key_count is null");

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return ClosedError();

  rocksdb::ColumnFamilyHandle* cf = FindBucketLocked(bucket);
  if (!cf) return rocksdb::Status::NotFound("bucket not found");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  uint64_t count = 0;
  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, cf));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++count;
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (!iter_status.ok()) return iter_status;

  *out_key_count = count;
  return rocksdb::Status::OK();
}

// --------------------------
// Update / View
// --------------------------

rocksdb::Status Store::Update(const TxnFn& fn) {
  const uint64_t op_start_us = internal::NowMicros();

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return FinishOp(opt_, "pastekeep.update", op_start_us, ClosedError());

  rocksdb::WriteOptions wo;
  wo.sync = opt_.sync_writes;

  rocksdb::TransactionOptions to;
  to.lock_timeout = opt_.lock_timeout_ms;
  to.set_snapshot = true;

  std::unique_ptr<rocksdb::Transaction> txn(db_->BeginTransaction(wo, to));
  if (!txn) {
    return FinishOp(opt_, "pastekeep.update", op_start_us,
                    rocksdb::Status::IOError("BeginTransaction returned null"));
  }

  Transaction handle(this, txn.get(), txn->GetSnapshot());
  rocksdb::Status s = fn(&handle);
  if (!s.ok()) {
    rocksdb::Status rs = txn->Rollback();
    if (!rs.ok()) s = rocksdb::Status::Incomplete(s.ToString(), "rollback: " + rs.ToString());
    return FinishOp(opt_, "pastekeep.update", op_start_us, s);
  }

  return FinishOp(opt_, "pastekeep.update", op_start_us, txn->Commit());
}

rocksdb::Status Store::View(const TxnFn& fn) const {
  const uint64_t op_start_us = internal::NowMicros();

  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!db_) return FinishOp(opt_, "pastekeep.view", op_start_us, ClosedError());

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::Status s;
  {
    Transaction handle(this, nullptr, snapshot);
    s = fn(&handle);
  }
  db_->ReleaseSnapshot(snapshot);
  return FinishOp(opt_, "pastekeep.view", op_start_us, s);
}

rocksdb::ColumnFamilyHandle* Transaction::Bucket(std::string_view bucket) const {
  return store_->FindBucketLocked(bucket);
}

rocksdb::Status Transaction::PutEncoded(std::string_view bucket, std::string_view key,
                                        std::string_view value_bytes) {
  if (read_only()) return rocksdb::Status::NotSupported("write in read-only transaction");

  rocksdb::ColumnFamilyHandle* cf = Bucket(bucket);
  if (!cf) return rocksdb::Status::NotFound("bucket not found");

  return txn_->Put(cf, ToSlice(key), ToSlice(value_bytes));
}

rocksdb::Status Transaction::GetEncoded(std::string_view bucket, std::string_view key,
                                        std::string* bytes_out) const {
  rocksdb::ColumnFamilyHandle* cf = Bucket(bucket);
  if (!cf) return rocksdb::Status::NotFound("bucket not found");

  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot_;
  std::unique_ptr<rocksdb::Iterator> it(txn_ ? txn_->GetIterator(ro, cf)
                                             : store_->db_->NewIterator(ro, cf));
  return SeekExact(it.get(), key, bytes_out);
}

rocksdb::Status Transaction::Delete(std::string_view bucket, std::string_view key) {
  if (read_only()) return rocksdb::Status::NotSupported("write in read-only transaction");

  rocksdb::ColumnFamilyHandle* cf = Bucket(bucket);
  if (!cf) return rocksdb::Status::NotFound("bucket not found");

  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot_;
  std::string existing;
  rocksdb::Status s = txn_->GetForUpdate(ro, cf, ToSlice(key), &existing);
  if (!s.ok()) return s;

  return txn_->Delete(cf, ToSlice(key));
}

bool Store::IsOpen() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return db_ != nullptr;
}

rocksdb::Status Store::Close() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return CloseLocked();
}

rocksdb::Status Store::CloseLocked() {
  if (!db_) return rocksdb::Status::OK();

  rocksdb::Status result;
  for (auto& entry : buckets_) {
    rocksdb::Status s = db_->DestroyColumnFamilyHandle(entry.second);
    if (result.ok() && !s.ok()) result = s;
  }
  buckets_.clear();

  if (default_cf_) {
    rocksdb::Status s = db_->DestroyColumnFamilyHandle(default_cf_);
    if (result.ok() && !s.ok()) result = s;
    default_cf_ = nullptr;
  }

  rocksdb::Status s = db_->Close();
  if (result.ok() && !s.ok()) result = s;

  delete db_;
  db_ = nullptr;
  return result;
}

}  // namespace pastekeep
