#include <pastekeep/dedup_cache.hpp>
#include <pastekeep/store.hpp>

#include <chrono>
#include <iostream>

int main() {
  pastekeep::Options opt;
  std::unique_ptr<pastekeep::Store> db;

  auto s = pastekeep::Store::Open("./pastekeep_db", &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  s = db->AddBucket("p");
  if (!s.ok()) std::cerr << "AddBucket failed: " << s.ToString() << "\n";

  s = db->Put("p", "x", 42);
  if (!s.ok()) std::cerr << "Put x failed: " << s.ToString() << "\n";

  int n = 0;
  s = db->Get("p", "x", &n);
  if (!s.ok()) {
    std::cerr << "Get x failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "x=" << n << "\n";

  // Absent values are refused before anything is written.
  s = db->Put("p", "y", nullptr);
  std::cout << "put nullptr: " << (pastekeep::IsBadValue(s) ? "bad value" : s.ToString()) << "\n";

  // Asking for the wrong shape is a decode error, not a crash.
  std::string str;
  s = db->Get("p", "x", &str);
  std::cout << "get x as string: " << (pastekeep::IsDecodeError(s) ? "decode error" : s.ToString())
            << "\n";

  s = db->Delete("p", "x");
  if (!s.ok()) std::cerr << "Delete x failed: " << s.ToString() << "\n";

  s = db->Get("p", "x", &n);
  std::cout << "after delete: " << (s.IsNotFound() ? "not found" : s.ToString()) << "\n";

  // Dedup cache with a one hour window.
  using namespace std::chrono_literals;
  pastekeep::DedupCache cache;
  auto t0 = pastekeep::DedupCache::Clock::now();
  cache.Mark("abc", t0);
  std::cout << "seen at t0+30m: " << cache.Seen("abc") << "\n";
  cache.Evict(t0 + 2h, 1h);
  std::cout << "seen after evict at t0+2h: " << cache.Seen("abc") << "\n";

  s = db->Close();
  if (!s.ok()) {
    std::cerr << "Close failed: " << s.ToString() << "\n";
    return 1;
  }

  std::cout << "done\n";
  return 0;
}
