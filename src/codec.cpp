#include <pastekeep/codec.hpp>

#include <memory>

namespace pastekeep::internal {

std::string WriteEnvelope(const Json::Value& root) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["commentStyle"] = "None";
  // Keep string bytes as they are; the default escapes invalid UTF-8 as U+FFFD.
  builder["emitUTF8"] = true;

  std::string out(1, kValueFormatV1);
  out.append(Json::writeString(builder, root));
  return out;
}

rocksdb::Status ReadEnvelope(std::string_view bytes, Json::Value* root) {
  if (bytes.empty()) return DecodeError("empty value");
  if (bytes.front() != kValueFormatV1) return DecodeError("unknown value format");

  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["failIfExtra"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  const char* begin = bytes.data() + 1;
  const char* end = bytes.data() + bytes.size();
  std::string errors;
  if (!reader->parse(begin, end, root, &errors)) {
    return DecodeError("malformed value: " + errors);
  }
  return rocksdb::Status::OK();
}

}  // namespace pastekeep::internal
