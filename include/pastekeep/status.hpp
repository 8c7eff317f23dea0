#pragma once

#include <string>
#include <string_view>

#include <rocksdb/status.h>

namespace pastekeep {

// Store errors travel as rocksdb::Status. NotFound and engine errors use the
// plain RocksDB codes; the kinds below are tagged so callers can branch.

inline constexpr std::string_view kBadValueMessage = "bad value";
inline constexpr std::string_view kDecodeErrorMessage = "decode error";
inline constexpr std::string_view kEncodeErrorMessage = "encode error";
inline constexpr std::string_view kClosedMessage = "store is closed";

/** Put() was handed an absent value (nullptr, empty optional, ...). */
inline rocksdb::Status BadValueError() {
  return rocksdb::Status::InvalidArgument(
      rocksdb::Slice(kBadValueMessage.data(), kBadValueMessage.size()));
}

/** Stored bytes do not match the shape requested by Get(). */
inline rocksdb::Status DecodeError(std::string_view detail) {
  return rocksdb::Status::Corruption(
      rocksdb::Slice(kDecodeErrorMessage.data(), kDecodeErrorMessage.size()),
      rocksdb::Slice(detail.data(), detail.size()));
}

/** A present value could not be encoded (e.g. NaN). */
inline rocksdb::Status EncodeError(std::string_view detail) {
  return rocksdb::Status::InvalidArgument(
      rocksdb::Slice(kEncodeErrorMessage.data(), kEncodeErrorMessage.size()),
      rocksdb::Slice(detail.data(), detail.size()));
}

inline rocksdb::Status ClosedError() {
  return rocksdb::Status::ShutdownInProgress(
      rocksdb::Slice(kClosedMessage.data(), kClosedMessage.size()));
}

namespace internal {

inline bool StateStartsWith(const rocksdb::Status& s, std::string_view prefix) {
  const char* state = s.getState();
  if (state == nullptr) return false;
  return std::string_view(state).substr(0, prefix.size()) == prefix;
}

}  // namespace internal

inline bool IsBadValue(const rocksdb::Status& s) {
  return s.IsInvalidArgument() && internal::StateStartsWith(s, kBadValueMessage);
}

inline bool IsDecodeError(const rocksdb::Status& s) {
  return s.IsCorruption() && internal::StateStartsWith(s, kDecodeErrorMessage);
}

inline bool IsEncodeError(const rocksdb::Status& s) {
  return s.IsInvalidArgument() && internal::StateStartsWith(s, kEncodeErrorMessage);
}

inline bool IsClosed(const rocksdb::Status& s) {
  return s.IsShutdownInProgress();
}

}  // namespace pastekeep
