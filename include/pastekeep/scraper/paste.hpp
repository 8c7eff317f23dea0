#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <rocksdb/status.h>

namespace pastekeep::scraper {

/**
 * One entry of the scraping API's listing, plus the downloaded body.
 *
 * `key` is the opaque identifier used for deduplication and as the store key.
 */
struct Paste {
  std::string key;
  std::string scrape_url;
  std::string full_url;
  int64_t date = 0;    // seconds since epoch
  uint64_t size = 0;   // bytes, as reported by the listing
  int64_t expire = 0;  // seconds since epoch, 0 = never
  std::string title;
  std::string syntax;
  std::string user;

  // Filled by PasteProcessor::Download().
  std::string content;
};

// Typed store hooks (see pastekeep/codec.hpp).
rocksdb::Status ToJson(const Paste& paste, Json::Value* out);
rocksdb::Status FromJson(const Json::Value& in, Paste* out);

/**
 * Parse a listing payload: a JSON array of objects.
 *
 * Numeric fields may arrive as strings or numbers; unparseable numbers read
 * as 0. Entries without a non-empty string "key" are skipped and counted in
 * *skipped (if non-null). Returns false with *error set when the payload is
 * not a JSON array.
 */
bool ParsePasteList(std::string_view body,
                    std::vector<Paste>* out,
                    std::string* error,
                    size_t* skipped = nullptr);

}  // namespace pastekeep::scraper
