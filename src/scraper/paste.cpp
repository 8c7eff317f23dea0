#include <pastekeep/scraper/paste.hpp>

#include <pastekeep/codec.hpp>

#include <cerrno>
#include <cstdlib>
#include <memory>

namespace pastekeep::scraper {

namespace {

std::string StringField(const Json::Value& obj, const char* name) {
  const Json::Value& v = obj[name];
  return v.isString() ? v.asString() : std::string();
}

// The listing sends numbers as strings ("date": "1442911802").
int64_t LenientInt(const Json::Value& v) {
  if (v.isInt64()) return v.asInt64();
  if (!v.isString()) return 0;

  const std::string s = v.asString();
  if (s.empty()) return 0;
  errno = 0;
  char* end = nullptr;
  long long parsed = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') return 0;
  return static_cast<int64_t>(parsed);
}

}  // namespace

rocksdb::Status ToJson(const Paste& paste, Json::Value* out) {
  rocksdb::Status s;
  if (!(s = EncodeField(out, "key", paste.key)).ok()) return s;
  if (!(s = EncodeField(out, "scrape_url", paste.scrape_url)).ok()) return s;
  if (!(s = EncodeField(out, "full_url", paste.full_url)).ok()) return s;
  if (!(s = EncodeField(out, "date", paste.date)).ok()) return s;
  if (!(s = EncodeField(out, "size", paste.size)).ok()) return s;
  if (!(s = EncodeField(out, "expire", paste.expire)).ok()) return s;
  if (!(s = EncodeField(out, "title", paste.title)).ok()) return s;
  if (!(s = EncodeField(out, "syntax", paste.syntax)).ok()) return s;
  if (!(s = EncodeField(out, "user", paste.user)).ok()) return s;
  return EncodeField(out, "content", paste.content);
}

rocksdb::Status FromJson(const Json::Value& in, Paste* out) {
  Paste p;
  rocksdb::Status s;
  if (!(s = DecodeField(in, "key", &p.key)).ok()) return s;
  if (!(s = DecodeField(in, "scrape_url", &p.scrape_url)).ok()) return s;
  if (!(s = DecodeField(in, "full_url", &p.full_url)).ok()) return s;
  if (!(s = DecodeField(in, "date", &p.date)).ok()) return s;
  if (!(s = DecodeField(in, "size", &p.size)).ok()) return s;
  if (!(s = DecodeField(in, "expire", &p.expire)).ok()) return s;
  if (!(s = DecodeField(in, "title", &p.title)).ok()) return s;
  if (!(s = DecodeField(in, "syntax", &p.syntax)).ok()) return s;
  if (!(s = DecodeField(in, "user", &p.user)).ok()) return s;
  if (!(s = DecodeField(in, "content", &p.content)).ok()) return s;
  *out = std::move(p);
  return rocksdb::Status::OK();
}

bool ParsePasteList(std::string_view body,
                    std::vector<Paste>* out,
                    std::string* error,
                    size_t* skipped) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
    if (error) *error = "invalid JSON: " + errors;
    return false;
  }
  if (!root.isArray()) {
    if (error) *error = "expected a JSON array of pastes";
    return false;
  }

  std::vector<Paste> pastes;
  pastes.reserve(root.size());
  size_t dropped = 0;

  for (const auto& item : root) {
    if (!item.isObject() || !item["key"].isString() || item["key"].asString().empty()) {
      ++dropped;
      continue;
    }

    Paste p;
    p.key = item["key"].asString();
    p.scrape_url = StringField(item, "scrape_url");
    p.full_url = StringField(item, "full_url");
    p.date = LenientInt(item["date"]);
    int64_t size = LenientInt(item["size"]);
    p.size = size > 0 ? static_cast<uint64_t>(size) : 0;
    p.expire = LenientInt(item["expire"]);
    p.title = StringField(item, "title");
    p.syntax = StringField(item, "syntax");
    p.user = StringField(item, "user");
    pastes.push_back(std::move(p));
  }

  if (skipped) *skipped = dropped;
  *out = std::move(pastes);
  return true;
}

}  // namespace pastekeep::scraper
