#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "reqkit/Result.hpp"
#include "reqkit/dispatch/Decode.hpp"

namespace reqkit {

// ---- fromJson building blocks ----
// User types provide `bool fromJson(const rapidjson::Value&, T&)` in their own
// namespace; it is found by argument-dependent lookup.

inline bool fromJson(const rapidjson::Value& v, bool& out) {
  if (!v.IsBool()) return false;
  out = v.GetBool();
  return true;
}

inline bool fromJson(const rapidjson::Value& v, int& out) {
  if (!v.IsInt()) return false;
  out = v.GetInt();
  return true;
}

inline bool fromJson(const rapidjson::Value& v, std::int64_t& out) {
  if (!v.IsInt64()) return false;
  out = v.GetInt64();
  return true;
}

inline bool fromJson(const rapidjson::Value& v, double& out) {
  if (!v.IsNumber()) return false;
  out = v.GetDouble();
  return true;
}

inline bool fromJson(const rapidjson::Value& v, std::string& out) {
  if (!v.IsString()) return false;
  out.assign(v.GetString(), v.GetStringLength());
  return true;
}

template <typename T>
bool fromJson(const rapidjson::Value& v, std::vector<T>& out) {
  if (!v.IsArray()) return false;
  out.clear();
  out.reserve(v.Size());
  for (const auto& e : v.GetArray()) {
    T item{};
    if (!fromJson(e, item)) return false;
    out.push_back(std::move(item));
  }
  return true;
}

/// Typed decoding of a response body. T must be default-constructible.
template <typename T>
struct Decoder {
  static Result<T> decode(const std::string& bytes) {
    auto doc = parseDocument(bytes);
    if (!doc) return Error{ErrorKind::Decode, doc.error().message, "object"};

    T out{};
    if (!fromJson(static_cast<const rapidjson::Value&>(**doc), out)) {
      return Error{ErrorKind::Decode, "document does not match the declared response type", "object"};
    }
    return out;
  }
};

// Raw bytes: the default response type of Request.
template <>
struct Decoder<std::string> {
  static Result<std::string> decode(const std::string& bytes) { return bytes; }
};

} // namespace reqkit
