#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "reqkit/Method.hpp"

namespace reqkit {

// Ordered multimap. Duplicate names are kept; the last one is authoritative.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Case-insensitive lookup of the last value stored under `name`.
std::optional<std::string> lastHeaderValue(const HeaderList& headers, const std::string& name);

/// Canonical result of folding a parameter tree.
struct RequestDescriptor {
  Method      method{Method::Get};
  std::string target;   // absolute URL, query included
  HeaderList  headers;
  std::string body;

  std::optional<std::string> headerValue(const std::string& name) const {
    return lastHeaderValue(headers, name);
  }

  /// Headers collapsed so every name appears once with its authoritative value,
  /// in the position of its first occurrence.
  HeaderList effectiveHeaders() const;
};

bool operator==(const RequestDescriptor& a, const RequestDescriptor& b);
inline bool operator!=(const RequestDescriptor& a, const RequestDescriptor& b) { return !(a == b); }

} // namespace reqkit
