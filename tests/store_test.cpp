// Unit tests for pastekeep/store.hpp
// Tests: buckets, typed Put/Get/Delete, listing, reopen, locking, close

#include <gtest/gtest.h>

#include <pastekeep/store.hpp>
#include <pastekeep/test_utils.hpp>

#include <sys/stat.h>

#include <chrono>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace pastekeep {
namespace {

// =============================================================================
// Test Fixture
// =============================================================================

class StoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Create unique test directory for each test
    test_dir_ = std::filesystem::temp_directory_path() / ("pastekeep_test_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_);
    db_path_ = (test_dir_ / "test_db").string();
  }

  void TearDown() override {
    // Close store before cleanup
    store_.reset();
    // Clean up test directory
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  rocksdb::Status OpenStore(const Options& opt = Options{}) {
    return Store::Open(db_path_, &store_, opt);
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::string db_path_;
  std::unique_ptr<Store> store_;
};

// =============================================================================
// Open/Close Tests
// =============================================================================

TEST_F(StoreTest, OpenCreatesNewDatabase) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(std::filesystem::is_directory(db_path_));
  EXPECT_TRUE(store_->IsOpen());
}

TEST_F(StoreTest, OpenCreatesDirectoryWithRestrictedMode) {
  ASSERT_TRUE(OpenStore().ok());
  struct stat st {};
  ASSERT_EQ(::stat(db_path_.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0750u);
}

TEST_F(StoreTest, OpenFailsWhenParentIsMissing) {
  db_path_ = (test_dir_ / "missing" / "db").string();
  auto s = OpenStore();
  EXPECT_FALSE(s.ok());
}

TEST_F(StoreTest, OpenRejectsEmptyPath) {
  std::unique_ptr<Store> store;
  EXPECT_TRUE(Store::Open("", &store).IsInvalidArgument());
}

TEST_F(StoreTest, ReopenKeepsBucketsAndValues) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", 42).ok());
  ASSERT_TRUE(store_->Put("q", "y", std::string("hello")).ok());
  ASSERT_TRUE(store_->Close().ok());
  store_.reset();

  ASSERT_TRUE(OpenStore().ok());
  std::vector<std::string> buckets;
  ASSERT_TRUE(store_->ListBuckets(&buckets).ok());
  EXPECT_EQ(buckets, (std::vector<std::string>{"p", "q"}));

  int n = 0;
  ASSERT_TRUE(store_->Get("p", "x", &n).ok());
  EXPECT_EQ(n, 42);
  std::string str;
  ASSERT_TRUE(store_->Get("q", "y", &str).ok());
  EXPECT_EQ(str, "hello");
}

TEST_F(StoreTest, SecondOpenTimesOutWhileLocked) {
  ASSERT_TRUE(OpenStore().ok());

  Options opt;
  opt.open_timeout_ms = 50;
  std::unique_ptr<Store> second;
  auto start = std::chrono::steady_clock::now();
  auto s = Store::Open(db_path_, &second, opt);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(s.IsTimedOut()) << s.ToString();
  EXPECT_EQ(second, nullptr);
  EXPECT_GE(elapsed, std::chrono::milliseconds(50));
}

TEST_F(StoreTest, OpenSucceedsAfterHolderCloses) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Close().ok());

  std::unique_ptr<Store> second;
  EXPECT_TRUE(Store::Open(db_path_, &second).ok());
}

TEST_F(StoreTest, CloseIsIdempotent) {
  ASSERT_TRUE(OpenStore().ok());
  EXPECT_TRUE(store_->Close().ok());
  EXPECT_TRUE(store_->Close().ok());
  EXPECT_FALSE(store_->IsOpen());
}

TEST_F(StoreTest, OperationsAfterCloseFailWithClosed) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", 1).ok());
  ASSERT_TRUE(store_->Close().ok());

  int n = 0;
  EXPECT_TRUE(IsClosed(store_->Put("p", "x", 2)));
  EXPECT_TRUE(IsClosed(store_->Get("p", "x", &n)));
  EXPECT_TRUE(IsClosed(store_->Delete("p", "x")));
  EXPECT_TRUE(IsClosed(store_->AddBucket("r")));

  std::vector<std::string> out;
  EXPECT_TRUE(IsClosed(store_->ListKeys("p", &out)));
  EXPECT_TRUE(IsClosed(store_->ListBuckets(&out)));
}

// =============================================================================
// Bucket Tests
// =============================================================================

TEST_F(StoreTest, AddBucketIsIdempotent) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());
  ASSERT_TRUE(store_->Put("p", "x", 42).ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());

  int n = 0;
  ASSERT_TRUE(store_->Get("p", "x", &n).ok());
  EXPECT_EQ(n, 42);
}

TEST_F(StoreTest, DefaultIsAnOrdinaryBucketName) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("default", "k", 7).ok());
  int n = 0;
  ASSERT_TRUE(store_->Get("default", "k", &n).ok());
  EXPECT_EQ(n, 7);
}

TEST_F(StoreTest, BucketIsolation) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("a", "k", 1).ok());
  ASSERT_TRUE(store_->AddBucket("b").ok());

  int n = 0;
  EXPECT_TRUE(store_->Get("b", "k", &n).IsNotFound());
  EXPECT_TRUE(store_->Get("never", "k", &n).IsNotFound());
}

// =============================================================================
// Put/Get/Delete Tests
// =============================================================================

TEST_F(StoreTest, BasicScenario) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());
  ASSERT_TRUE(store_->Put("p", "x", 42).ok());

  int n = 0;
  ASSERT_TRUE(store_->Get("p", "x", &n).ok());
  EXPECT_EQ(n, 42);

  ASSERT_TRUE(store_->Delete("p", "x").ok());
  EXPECT_TRUE(store_->Get("p", "x", &n).IsNotFound());
}

TEST_F(StoreTest, RoundTripsValueShapes) {
  ASSERT_TRUE(OpenStore().ok());

  ASSERT_TRUE(store_->Put("v", "bool", true).ok());
  ASSERT_TRUE(store_->Put("v", "i64", int64_t{-9000000000}).ok());
  ASSERT_TRUE(store_->Put("v", "u64", uint64_t{18000000000000000000ull}).ok());
  ASSERT_TRUE(store_->Put("v", "dbl", 2.5).ok());
  ASSERT_TRUE(store_->Put("v", "str", "literal").ok());
  ASSERT_TRUE(store_->Put("v", "vec", std::vector<std::string>{"a", "b"}).ok());
  ASSERT_TRUE(store_->Put("v", "map", std::map<std::string, int>{{"x", 1}, {"y", 2}}).ok());

  bool b = false;
  int64_t i = 0;
  uint64_t u = 0;
  double d = 0;
  std::string str;
  std::vector<std::string> vec;
  std::map<std::string, int> m;

  ASSERT_TRUE(store_->Get("v", "bool", &b).ok());
  ASSERT_TRUE(store_->Get("v", "i64", &i).ok());
  ASSERT_TRUE(store_->Get("v", "u64", &u).ok());
  ASSERT_TRUE(store_->Get("v", "dbl", &d).ok());
  ASSERT_TRUE(store_->Get("v", "str", &str).ok());
  ASSERT_TRUE(store_->Get("v", "vec", &vec).ok());
  ASSERT_TRUE(store_->Get("v", "map", &m).ok());

  EXPECT_TRUE(b);
  EXPECT_EQ(i, -9000000000);
  EXPECT_EQ(u, 18000000000000000000ull);
  EXPECT_DOUBLE_EQ(d, 2.5);
  EXPECT_EQ(str, "literal");
  EXPECT_EQ(vec, (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(m, (std::map<std::string, int>{{"x", 1}, {"y", 2}}));
}

TEST_F(StoreTest, EmptyKeyIsValid) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "", 5).ok());
  int n = 0;
  ASSERT_TRUE(store_->Get("p", "", &n).ok());
  EXPECT_EQ(n, 5);
}

TEST_F(StoreTest, GetMissingKeyIsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());
  int n = 0;
  EXPECT_TRUE(store_->Get("p", "nope", &n).IsNotFound());
  EXPECT_TRUE(store_->Delete("p", "nope").IsNotFound());
}

TEST_F(StoreTest, GetDoesNotMatchKeyPrefix) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "abc", 1).ok());
  int n = 0;
  EXPECT_TRUE(store_->Get("p", "ab", &n).IsNotFound());
  EXPECT_TRUE(store_->Get("p", "abcd", &n).IsNotFound());
}

TEST_F(StoreTest, PutAbsentValueIsBadValue) {
  ASSERT_TRUE(OpenStore().ok());

  std::optional<int> empty;
  std::shared_ptr<std::string> null_ptr;
  EXPECT_TRUE(IsBadValue(store_->Put("p", "x", nullptr)));
  EXPECT_TRUE(IsBadValue(store_->Put("p", "x", empty)));
  EXPECT_TRUE(IsBadValue(store_->Put("p", "x", null_ptr)));
  EXPECT_TRUE(IsBadValue(store_->Put("p", "x", Json::Value())));

  int n = 0;
  EXPECT_TRUE(store_->Get("p", "x", &n).IsNotFound());
}

TEST_F(StoreTest, PutAbsentValueKeepsExistingValue) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", 1).ok());
  EXPECT_TRUE(IsBadValue(store_->Put("p", "x", nullptr)));

  int n = 0;
  ASSERT_TRUE(store_->Get("p", "x", &n).ok());
  EXPECT_EQ(n, 1);
}

TEST_F(StoreTest, OverwriteLastWriteWins) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", std::vector<int>{1, 2, 3}).ok());
  ASSERT_TRUE(store_->Put("p", "x", std::vector<int>{9}).ok());

  std::vector<int> v;
  ASSERT_TRUE(store_->Get("p", "x", &v).ok());
  EXPECT_EQ(v, std::vector<int>{9});
}

TEST_F(StoreTest, DeleteTwiceReportsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", 1).ok());
  EXPECT_TRUE(store_->Delete("p", "x").ok());
  EXPECT_TRUE(store_->Delete("p", "x").IsNotFound());
}

TEST_F(StoreTest, GetWrongShapeIsDecodeErrorAndLeavesDestination) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", std::string("not a number")).ok());

  int n = 17;
  auto s = store_->Get("p", "x", &n);
  EXPECT_TRUE(IsDecodeError(s)) << s.ToString();
  EXPECT_EQ(n, 17);
}

TEST_F(StoreTest, GetWithNullDestinationChecksPresence) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "x", 1).ok());
  EXPECT_TRUE(store_->Get("p", "x", nullptr).ok());
  EXPECT_TRUE(store_->Contains("p", "x").ok());
  EXPECT_TRUE(store_->Contains("p", "y").IsNotFound());
}

TEST_F(StoreTest, NonFiniteFloatIsEncodeError) {
  ASSERT_TRUE(OpenStore().ok());
  auto s = store_->Put("p", "x", std::numeric_limits<double>::quiet_NaN());
  EXPECT_TRUE(IsEncodeError(s)) << s.ToString();
}

TEST_F(StoreTest, CorruptBytesAreDecodeError) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());
  ASSERT_TRUE(store_->PutEncoded("p", "x", "garbage").ok());

  int n = 0;
  EXPECT_TRUE(IsDecodeError(store_->Get("p", "x", &n)));
}

// =============================================================================
// Listing Tests
// =============================================================================

TEST_F(StoreTest, ListKeysSortedWithPrefixAndLimit) {
  ASSERT_TRUE(OpenStore().ok());
  for (const char* k : {"b2", "a1", "b1", "c1", "b3"}) {
    ASSERT_TRUE(store_->Put("p", k, 0).ok());
  }

  std::vector<std::string> keys;
  ASSERT_TRUE(store_->ListKeys("p", &keys).ok());
  EXPECT_EQ(keys, (std::vector<std::string>{"a1", "b1", "b2", "b3", "c1"}));

  ASSERT_TRUE(store_->ListKeys("p", &keys, 0, "b").ok());
  EXPECT_EQ(keys, (std::vector<std::string>{"b1", "b2", "b3"}));

  ASSERT_TRUE(store_->ListKeys("p", &keys, 2, "b").ok());
  EXPECT_EQ(keys, (std::vector<std::string>{"b1", "b2"}));

  uint64_t count = 0;
  ASSERT_TRUE(store_->CountKeys("p", &count).ok());
  EXPECT_EQ(count, 5u);
}

TEST_F(StoreTest, ListKeysOfMissingBucketIsNotFound) {
  ASSERT_TRUE(OpenStore().ok());
  std::vector<std::string> keys;
  EXPECT_TRUE(store_->ListKeys("nope", &keys).IsNotFound());
  uint64_t count = 0;
  EXPECT_TRUE(store_->CountKeys("nope", &count).IsNotFound());
}

// =============================================================================
// Update/View Tests
// =============================================================================

TEST_F(StoreTest, UpdateCommitsAllWrites) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());
  ASSERT_TRUE(store_->Put("p", "gone", 0).ok());

  auto s = store_->Update([](Transaction* txn) {
    rocksdb::Status st = txn->Put("p", "a", 1);
    if (!st.ok()) return st;
    st = txn->Put("p", "b", 2);
    if (!st.ok()) return st;

    // Own writes are visible inside the transaction.
    int a = 0;
    st = txn->Get("p", "a", &a);
    if (!st.ok()) return st;
    if (a != 1) return rocksdb::Status::Corruption("own write not visible");

    return txn->Delete("p", "gone");
  });
  ASSERT_TRUE(s.ok()) << s.ToString();

  int n = 0;
  ASSERT_TRUE(store_->Get("p", "a", &n).ok());
  EXPECT_EQ(n, 1);
  ASSERT_TRUE(store_->Get("p", "b", &n).ok());
  EXPECT_EQ(n, 2);
  EXPECT_TRUE(store_->Contains("p", "gone").IsNotFound());
}

TEST_F(StoreTest, UpdateErrorRollsBack) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());

  auto s = store_->Update([](Transaction* txn) {
    rocksdb::Status st = txn->Put("p", "a", 1);
    if (!st.ok()) return st;
    return rocksdb::Status::Aborted("changed my mind");
  });
  EXPECT_TRUE(s.IsAborted());
  EXPECT_TRUE(store_->Contains("p", "a").IsNotFound());
}

TEST_F(StoreTest, UpdateDoesNotCreateBuckets) {
  ASSERT_TRUE(OpenStore().ok());
  auto s = store_->Update([](Transaction* txn) { return txn->Put("nope", "a", 1); });
  EXPECT_TRUE(s.IsNotFound());

  std::vector<std::string> buckets;
  ASSERT_TRUE(store_->ListBuckets(&buckets).ok());
  EXPECT_TRUE(buckets.empty());
}

TEST_F(StoreTest, UpdateRejectsAbsentValue) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->AddBucket("p").ok());
  auto s = store_->Update([](Transaction* txn) { return txn->Put("p", "a", nullptr); });
  EXPECT_TRUE(IsBadValue(s));
}

TEST_F(StoreTest, ViewIsReadOnlySnapshot) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Put("p", "a", 1).ok());

  auto s = store_->View([this](Transaction* txn) {
    if (!txn->read_only()) return rocksdb::Status::Corruption("expected read-only");

    // A write committed after the snapshot is not visible. It runs on another
    // thread since callbacks must not re-enter the store.
    rocksdb::Status st;
    std::thread writer([this, &st] { st = store_->PutEncoded("p", "b", "\x01" "2"); });
    writer.join();
    if (!st.ok()) return st;
    if (!txn->Get("p", "b", nullptr).IsNotFound()) {
      return rocksdb::Status::Corruption("snapshot saw a later write");
    }

    if (!txn->Put("p", "c", 3).IsNotSupported()) {
      return rocksdb::Status::Corruption("write allowed in view");
    }

    int a = 0;
    st = txn->Get("p", "a", &a);
    if (!st.ok()) return st;
    return a == 1 ? rocksdb::Status::OK() : rocksdb::Status::Corruption("wrong value");
  });
  EXPECT_TRUE(s.ok()) << s.ToString();
  EXPECT_TRUE(store_->Contains("p", "b").ok());
}

TEST_F(StoreTest, UpdateAndViewAfterCloseFail) {
  ASSERT_TRUE(OpenStore().ok());
  ASSERT_TRUE(store_->Close().ok());

  bool called = false;
  auto fn = [&called](Transaction*) {
    called = true;
    return rocksdb::Status::OK();
  };
  EXPECT_TRUE(IsClosed(store_->Update(fn)));
  EXPECT_TRUE(IsClosed(store_->View(fn)));
  EXPECT_FALSE(called);
}

// =============================================================================
// Metrics Tests
// =============================================================================

TEST_F(StoreTest, EmitsOperationMetrics) {
  auto metrics = std::make_shared<testing::RecordingMetrics>();
  Options opt;
  opt.metrics = metrics;
  ASSERT_TRUE(OpenStore(opt).ok());

  ASSERT_TRUE(store_->Put("p", "x", 1).ok());
  int n = 0;
  ASSERT_TRUE(store_->Get("p", "x", &n).ok());
  EXPECT_TRUE(store_->Get("p", "y", &n).IsNotFound());

  EXPECT_EQ(metrics->CounterValue("pastekeep.bucket.created_total"), 1u);
  EXPECT_EQ(metrics->CounterValue("pastekeep.put.calls"), 1u);
  EXPECT_EQ(metrics->CounterValue("pastekeep.put.ok_total"), 1u);
  EXPECT_EQ(metrics->CounterValue("pastekeep.get.calls"), 2u);
  EXPECT_EQ(metrics->CounterValue("pastekeep.get.not_found_total"), 1u);
  EXPECT_EQ(metrics->HistogramCount("pastekeep.get.latency_us"), 2u);
}

// =============================================================================
// Concurrency Tests
// =============================================================================

TEST_F(StoreTest, ConcurrentWritersAndReaders) {
  Options opt;
  opt.sync_writes = false;
  ASSERT_TRUE(OpenStore(opt).ok());

  constexpr int kThreads = 8;
  constexpr int kOpsPerThread = 100;
  testing::TestResultCollector results;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      const std::string bucket = "b" + std::to_string(t % 3);
      for (int i = 0; i < kOpsPerThread; ++i) {
        const std::string key = "t" + std::to_string(t) + "_" + std::to_string(i);
        auto s = store_->Put(bucket, key, i);
        PASTEKEEP_CHECK_AND_RECORD(results, s.ok(), "put " + key + ": " + s.ToString());

        int n = -1;
        s = store_->Get(bucket, key, &n);
        PASTEKEEP_CHECK_AND_RECORD(results, s.ok() && n == i, "get " + key + ": " + s.ToString());
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_TRUE(results.AllSucceeded());
  for (const auto& msg : results.GetFailureMessages()) ADD_FAILURE() << msg;

  uint64_t total = 0;
  for (int b = 0; b < 3; ++b) {
    uint64_t count = 0;
    ASSERT_TRUE(store_->CountKeys("b" + std::to_string(b), &count).ok());
    total += count;
  }
  EXPECT_EQ(total, static_cast<uint64_t>(kThreads * kOpsPerThread));
}

TEST_F(StoreTest, ConcurrentOverwritesLeaveOneValue) {
  Options opt;
  opt.sync_writes = false;
  ASSERT_TRUE(OpenStore(opt).ok());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 50; ++i) {
        store_->Put("p", "shared", t).PermitUncheckedError();
      }
    });
  }
  for (auto& th : threads) th.join();

  int n = -1;
  ASSERT_TRUE(store_->Get("p", "shared", &n).ok());
  EXPECT_GE(n, 0);
  EXPECT_LT(n, 4);
}

}  // namespace
}  // namespace pastekeep
