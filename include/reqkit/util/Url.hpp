#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace reqkit::util {

// Absolute http(s) URL split into the pieces a transport needs.
struct Url {
  std::string   scheme;     // "http" or "https", lower-cased
  std::string   host;       // without brackets for IPv6 literals
  std::uint16_t port{0};    // explicit or scheme default
  bool          explicitPort{false};
  std::string   target;     // path + query, never empty ("/" at least)
  std::string   fragment;

  bool secure() const noexcept { return scheme == "https"; }

  // Value for the Host header: host, plus ":port" when it was explicit.
  std::string hostHeader() const;
};

std::optional<Url> parseUrl(const std::string& s);

} // namespace reqkit::util
