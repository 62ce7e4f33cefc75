#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "reqkit/RequestDescriptor.hpp"

namespace reqkit {

enum class CachePolicy : int {
  UseProtocol = 0,   // whatever the response headers say
  ReloadIgnoringCache,
  ReturnCacheElseLoad,
  ReturnCacheDontLoad
};

const char* toString(CachePolicy p) noexcept;

/// Transport-level options, folded from session-affecting nodes.
struct SessionConfig {
  HeaderList                               defaultHeaders;
  std::optional<std::chrono::milliseconds> timeout;   // unset -> Client default
  CachePolicy                              cachePolicy{CachePolicy::UseProtocol};
  bool                                     followRedirects{false};
  std::map<std::string, std::string>       options;   // anything else, by key

  std::optional<std::string> option(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

bool operator==(const SessionConfig& a, const SessionConfig& b);
inline bool operator!=(const SessionConfig& a, const SessionConfig& b) { return !(a == b); }

} // namespace reqkit
