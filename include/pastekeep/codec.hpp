#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <json/json.h>
#include <rocksdb/status.h>

#include <pastekeep/status.hpp>

namespace pastekeep {

/**
 * Value encoding for the typed store.
 *
 * Every stored value is a one-byte format tag followed by compact JSON text.
 * The mapping from a C++ type to JSON is chosen at compile time through
 * Codec<T>:
 *
 *   static rocksdb::Status Encode(const T& value, Json::Value* out);
 *   static rocksdb::Status Decode(const Json::Value& in, T* out);
 *
 * Built-in codecs cover bool, integers, enums, floating point, strings,
 * vectors, string-keyed maps, optionals, smart pointers and Json::Value.
 * Record types opt in by providing, in their own namespace,
 *
 *   rocksdb::Status ToJson(const Record&, Json::Value*);
 *   rocksdb::Status FromJson(const Json::Value&, Record*);
 *
 * Decode never silently converts between JSON kinds: a string does not decode
 * into an integer, a real does not decode into an integer, and integers are
 * range-checked against the destination type.
 */
template <typename T, typename Enable = void>
struct Codec;

namespace internal {

constexpr char kValueFormatV1 = '\x01';

// Serialize a JSON document into the on-disk value format.
std::string WriteEnvelope(const Json::Value& root);

// Parse the on-disk value format. Any framing or JSON problem is a decode error.
rocksdb::Status ReadEnvelope(std::string_view bytes, Json::Value* root);

template <typename T, typename = void>
struct HasJsonHooks : std::false_type {};

template <typename T>
struct HasJsonHooks<
    T, std::void_t<decltype(ToJson(std::declval<const T&>(), std::declval<Json::Value*>())),
                   decltype(FromJson(std::declval<const Json::Value&>(), std::declval<T*>()))>>
    : std::true_type {};

inline bool IsJsonInteger(const Json::Value& v) {
  return v.type() == Json::intValue || v.type() == Json::uintValue;
}

inline std::string StateOf(const rocksdb::Status& s) {
  const char* state = s.getState();
  return state ? std::string(state) : s.ToString();
}

}  // namespace internal

// -----------------------------------------------------------------------------
// Absent values. Put() rejects these with BadValue before touching the engine.
// -----------------------------------------------------------------------------

template <typename T>
bool IsAbsent(const T&) {
  return false;
}

inline bool IsAbsent(std::nullptr_t) { return true; }

template <typename T>
bool IsAbsent(T* p) {
  return p == nullptr;
}

template <typename T>
bool IsAbsent(const std::optional<T>& v) {
  return !v.has_value();
}

template <typename T>
bool IsAbsent(const std::shared_ptr<T>& p) {
  return p == nullptr;
}

template <typename T, typename D>
bool IsAbsent(const std::unique_ptr<T, D>& p) {
  return p == nullptr;
}

inline bool IsAbsent(const Json::Value& v) { return v.isNull(); }

// -----------------------------------------------------------------------------
// Record types (ADL hooks)
// -----------------------------------------------------------------------------

template <typename T, typename Enable>
struct Codec {
  static_assert(internal::HasJsonHooks<T>::value,
                "no pastekeep::Codec for this type; provide ToJson/FromJson hooks");

  static rocksdb::Status Encode(const T& value, Json::Value* out) {
    *out = Json::Value(Json::objectValue);
    return ToJson(value, out);
  }

  static rocksdb::Status Decode(const Json::Value& in, T* out) {
    if (!in.isObject()) return DecodeError("expected object");
    return FromJson(in, out);
  }
};

// -----------------------------------------------------------------------------
// Scalars
// -----------------------------------------------------------------------------

template <>
struct Codec<std::nullptr_t> {
  static rocksdb::Status Encode(std::nullptr_t, Json::Value*) { return BadValueError(); }
};

template <>
struct Codec<bool> {
  static rocksdb::Status Encode(bool value, Json::Value* out) {
    *out = Json::Value(value);
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, bool* out) {
    if (!in.isBool()) return DecodeError("expected bool");
    *out = in.asBool();
    return rocksdb::Status::OK();
  }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T> &&
                                 !std::is_same_v<T, bool>>> {
  static rocksdb::Status Encode(T value, Json::Value* out) {
    *out = Json::Value(static_cast<Json::Int64>(value));
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, T* out) {
    if (!internal::IsJsonInteger(in)) return DecodeError("expected integer");
    if (!in.isInt64()) return DecodeError("integer out of range");
    const Json::Int64 v = in.asInt64();
    if (v < static_cast<Json::Int64>(std::numeric_limits<T>::min()) ||
        v > static_cast<Json::Int64>(std::numeric_limits<T>::max())) {
      return DecodeError("integer out of range");
    }
    *out = static_cast<T>(v);
    return rocksdb::Status::OK();
  }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                                 !std::is_same_v<T, bool>>> {
  static rocksdb::Status Encode(T value, Json::Value* out) {
    *out = Json::Value(static_cast<Json::UInt64>(value));
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, T* out) {
    if (!internal::IsJsonInteger(in)) return DecodeError("expected unsigned integer");
    if (!in.isUInt64()) return DecodeError("unsigned integer out of range");
    const Json::UInt64 v = in.asUInt64();
    if (v > static_cast<Json::UInt64>(std::numeric_limits<T>::max())) {
      return DecodeError("unsigned integer out of range");
    }
    *out = static_cast<T>(v);
    return rocksdb::Status::OK();
  }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
  static rocksdb::Status Encode(T value, Json::Value* out) {
    if (!std::isfinite(value)) return EncodeError("non-finite floating point value");
    *out = Json::Value(static_cast<double>(value));
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, T* out) {
    if (!in.isDouble()) return DecodeError("expected number");
    *out = static_cast<T>(in.asDouble());
    return rocksdb::Status::OK();
  }
};

template <typename T>
struct Codec<T, std::enable_if_t<std::is_enum_v<T>>> {
  using Underlying = std::underlying_type_t<T>;

  static rocksdb::Status Encode(T value, Json::Value* out) {
    return Codec<Underlying>::Encode(static_cast<Underlying>(value), out);
  }

  static rocksdb::Status Decode(const Json::Value& in, T* out) {
    Underlying raw{};
    rocksdb::Status s = Codec<Underlying>::Decode(in, &raw);
    if (!s.ok()) return s;
    *out = static_cast<T>(raw);
    return rocksdb::Status::OK();
  }
};

template <>
struct Codec<std::string> {
  static rocksdb::Status Encode(const std::string& value, Json::Value* out) {
    *out = Json::Value(value);
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, std::string* out) {
    if (!in.isString()) return DecodeError("expected string");
    *out = in.asString();
    return rocksdb::Status::OK();
  }
};

// String literals and C strings are write-only shapes; read them back as
// std::string.
template <>
struct Codec<const char*> {
  static rocksdb::Status Encode(const char* value, Json::Value* out) {
    if (value == nullptr) {
      *out = Json::Value(Json::nullValue);
    } else {
      *out = Json::Value(value);
    }
    return rocksdb::Status::OK();
  }
};

template <std::size_t N>
struct Codec<char[N]> {
  static rocksdb::Status Encode(const char (&value)[N], Json::Value* out) {
    return Codec<const char*>::Encode(value, out);
  }
};

template <>
struct Codec<Json::Value> {
  static rocksdb::Status Encode(const Json::Value& value, Json::Value* out) {
    *out = value;
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, Json::Value* out) {
    *out = in;
    return rocksdb::Status::OK();
  }
};

// -----------------------------------------------------------------------------
// Wrappers and containers
// -----------------------------------------------------------------------------

template <typename T>
struct Codec<std::optional<T>> {
  static rocksdb::Status Encode(const std::optional<T>& value, Json::Value* out) {
    if (!value) {
      *out = Json::Value(Json::nullValue);
      return rocksdb::Status::OK();
    }
    return Codec<T>::Encode(*value, out);
  }

  static rocksdb::Status Decode(const Json::Value& in, std::optional<T>* out) {
    if (in.isNull()) {
      out->reset();
      return rocksdb::Status::OK();
    }
    T inner{};
    rocksdb::Status s = Codec<T>::Decode(in, &inner);
    if (!s.ok()) return s;
    *out = std::move(inner);
    return rocksdb::Status::OK();
  }
};

template <typename T>
struct Codec<std::shared_ptr<T>> {
  static rocksdb::Status Encode(const std::shared_ptr<T>& value, Json::Value* out) {
    if (!value) {
      *out = Json::Value(Json::nullValue);
      return rocksdb::Status::OK();
    }
    return Codec<std::remove_const_t<T>>::Encode(*value, out);
  }

  static rocksdb::Status Decode(const Json::Value& in, std::shared_ptr<T>* out) {
    if (in.isNull()) {
      out->reset();
      return rocksdb::Status::OK();
    }
    auto inner = std::make_shared<std::remove_const_t<T>>();
    rocksdb::Status s = Codec<std::remove_const_t<T>>::Decode(in, inner.get());
    if (!s.ok()) return s;
    *out = std::move(inner);
    return rocksdb::Status::OK();
  }
};

template <typename T>
struct Codec<std::unique_ptr<T>> {
  static rocksdb::Status Encode(const std::unique_ptr<T>& value, Json::Value* out) {
    if (!value) {
      *out = Json::Value(Json::nullValue);
      return rocksdb::Status::OK();
    }
    return Codec<T>::Encode(*value, out);
  }

  static rocksdb::Status Decode(const Json::Value& in, std::unique_ptr<T>* out) {
    if (in.isNull()) {
      out->reset();
      return rocksdb::Status::OK();
    }
    auto inner = std::make_unique<T>();
    rocksdb::Status s = Codec<T>::Decode(in, inner.get());
    if (!s.ok()) return s;
    *out = std::move(inner);
    return rocksdb::Status::OK();
  }
};

template <typename T, typename A>
struct Codec<std::vector<T, A>> {
  static rocksdb::Status Encode(const std::vector<T, A>& value, Json::Value* out) {
    *out = Json::Value(Json::arrayValue);
    for (const auto& elem : value) {
      Json::Value item;
      rocksdb::Status s = Codec<T>::Encode(elem, &item);
      if (!s.ok()) return s;
      out->append(std::move(item));
    }
    return rocksdb::Status::OK();
  }

  static rocksdb::Status Decode(const Json::Value& in, std::vector<T, A>* out) {
    if (!in.isArray()) return DecodeError("expected array");
    std::vector<T, A> result;
    result.reserve(in.size());
    for (Json::ArrayIndex i = 0; i < in.size(); ++i) {
      T elem{};
      rocksdb::Status s = Codec<T>::Decode(in[i], &elem);
      if (!s.ok()) return s;
      result.push_back(std::move(elem));
    }
    *out = std::move(result);
    return rocksdb::Status::OK();
  }
};

namespace internal {

template <typename Map>
rocksdb::Status EncodeStringMap(const Map& value, Json::Value* out) {
  using Mapped = typename Map::mapped_type;
  *out = Json::Value(Json::objectValue);
  for (const auto& [k, v] : value) {
    rocksdb::Status s = Codec<Mapped>::Encode(v, &(*out)[k]);
    if (!s.ok()) return s;
  }
  return rocksdb::Status::OK();
}

template <typename Map>
rocksdb::Status DecodeStringMap(const Json::Value& in, Map* out) {
  using Mapped = typename Map::mapped_type;
  if (!in.isObject()) return DecodeError("expected object");
  Map result;
  for (auto it = in.begin(); it != in.end(); ++it) {
    Mapped v{};
    rocksdb::Status s = Codec<Mapped>::Decode(*it, &v);
    if (!s.ok()) return s;
    result.emplace(it.name(), std::move(v));
  }
  *out = std::move(result);
  return rocksdb::Status::OK();
}

}  // namespace internal

template <typename T, typename C, typename A>
struct Codec<std::map<std::string, T, C, A>> {
  static rocksdb::Status Encode(const std::map<std::string, T, C, A>& value, Json::Value* out) {
    return internal::EncodeStringMap(value, out);
  }

  static rocksdb::Status Decode(const Json::Value& in, std::map<std::string, T, C, A>* out) {
    return internal::DecodeStringMap(in, out);
  }
};

template <typename T, typename H, typename E, typename A>
struct Codec<std::unordered_map<std::string, T, H, E, A>> {
  static rocksdb::Status Encode(const std::unordered_map<std::string, T, H, E, A>& value,
                                Json::Value* out) {
    return internal::EncodeStringMap(value, out);
  }

  static rocksdb::Status Decode(const Json::Value& in,
                                std::unordered_map<std::string, T, H, E, A>* out) {
    return internal::DecodeStringMap(in, out);
  }
};

// -----------------------------------------------------------------------------
// Record helpers
// -----------------------------------------------------------------------------

template <typename T>
rocksdb::Status EncodeField(Json::Value* obj, const char* name, const T& value) {
  return Codec<T>::Encode(value, &(*obj)[name]);
}

template <typename T>
rocksdb::Status DecodeField(const Json::Value& obj, const char* name, T* out) {
  if (!obj.isMember(name)) return DecodeError(std::string("missing field '") + name + "'");
  rocksdb::Status s = Codec<T>::Decode(obj[name], out);
  if (!s.ok()) return DecodeError(std::string("field '") + name + "': " + internal::StateOf(s));
  return s;
}

// Optional fields may be missing entirely.
template <typename T>
rocksdb::Status DecodeField(const Json::Value& obj, const char* name, std::optional<T>* out) {
  if (!obj.isMember(name)) {
    out->reset();
    return rocksdb::Status::OK();
  }
  rocksdb::Status s = Codec<std::optional<T>>::Decode(obj[name], out);
  if (!s.ok()) return DecodeError(std::string("field '") + name + "': " + internal::StateOf(s));
  return s;
}

// -----------------------------------------------------------------------------
// Byte-level entry points used by Store
// -----------------------------------------------------------------------------

template <typename T>
rocksdb::Status EncodeValue(const T& value, std::string* bytes_out) {
  Json::Value root;
  rocksdb::Status s = Codec<T>::Encode(value, &root);
  if (!s.ok()) return s;
  *bytes_out = internal::WriteEnvelope(root);
  return rocksdb::Status::OK();
}

template <typename T>
rocksdb::Status DecodeValue(std::string_view bytes, T* out) {
  Json::Value root;
  rocksdb::Status s = internal::ReadEnvelope(bytes, &root);
  if (!s.ok()) return s;
  return Codec<T>::Decode(root, out);
}

}  // namespace pastekeep
