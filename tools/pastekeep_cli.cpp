#include <pastekeep/store.hpp>

#include <json/json.h>

#include <iostream>
#include <memory>
#include <string>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " <db_path> put <bucket> <key> <json>\n"
      << "  " << argv0 << " <db_path> get <bucket> <key>\n"
      << "  " << argv0 << " <db_path> del <bucket> <key>\n"
      << "  " << argv0 << " <db_path> buckets\n"
      << "  " << argv0 << " <db_path> keys <bucket> [prefix] [limit]\n"
      << "  " << argv0 << " <db_path> count <bucket>\n";
}

static bool ParseJson(const std::string& text, Json::Value* out, std::string* errors) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), out, errors);
}

int main(int argc, char** argv) {
  if (argc < 3) { usage(argv[0]); return 2; }

  std::string db_path = argv[1];
  std::string cmd = argv[2];

  pastekeep::Options opt;
  std::unique_ptr<pastekeep::Store> db;
  auto s = pastekeep::Store::Open(db_path, &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  if (cmd == "put") {
    if (argc != 6) { usage(argv[0]); return 2; }
    Json::Value value;
    std::string errors;
    if (!ParseJson(argv[5], &value, &errors)) {
      std::cerr << "Invalid JSON value: " << errors << "\n";
      return 2;
    }
    s = db->Put(argv[3], argv[4], value);
    if (!s.ok()) {
      std::cerr << "Put failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "get") {
    if (argc != 5) { usage(argv[0]); return 2; }
    Json::Value v;
    s = db->Get(argv[3], argv[4], &v);
    if (!s.ok()) {
      std::cerr << "Get failed: " << s.ToString() << "\n";
      return 1;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::cout << Json::writeString(writer, v) << "\n";
    return 0;
  } else if (cmd == "del") {
    if (argc != 5) { usage(argv[0]); return 2; }
    s = db->Delete(argv[3], argv[4]);
    if (!s.ok() && !s.IsNotFound()) {
      std::cerr << "Delete failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "buckets") {
    if (argc != 3) { usage(argv[0]); return 2; }
    std::vector<std::string> out;
    s = db->ListBuckets(&out);
    if (!s.ok()) {
      std::cerr << "ListBuckets failed: " << s.ToString() << "\n";
      return 1;
    }
    for (const auto& b : out) {
      std::cout << b << "\n";
    }
    return 0;
  } else if (cmd == "keys") {
    // keys <bucket> [prefix] [limit]
    if (argc < 4 || argc > 6) { usage(argv[0]); return 2; }
    std::string prefix;
    uint64_t limit = 0;
    if (argc >= 5) {
      prefix = argv[4];
    }
    if (argc == 6) {
      try {
        limit = static_cast<uint64_t>(std::stoull(argv[5]));
      } catch (const std::exception&) {
        std::cerr << "Invalid limit: " << argv[5] << "\n";
        return 2;
      }
    }

    std::vector<std::string> out;
    s = db->ListKeys(argv[3], &out, limit, prefix);
    if (!s.ok()) {
      std::cerr << "ListKeys failed: " << s.ToString() << "\n";
      return 1;
    }
    for (const auto& k : out) {
      std::cout << k << "\n";
    }
    return 0;
  } else if (cmd == "count") {
    if (argc != 4) { usage(argv[0]); return 2; }
    uint64_t keys = 0;
    s = db->CountKeys(argv[3], &keys);
    if (!s.ok()) {
      std::cerr << "CountKeys failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "keys=" << keys << "\n";
    return 0;
  } else {
    usage(argv[0]);
    return 2;
  }
}
