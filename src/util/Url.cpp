#include "reqkit/util/Url.hpp"
#include "reqkit/util/Encoding.hpp"

#include <cctype>
#include <cstdlib>

namespace reqkit::util {

std::string Url::hostHeader() const {
  const bool v6 = host.find(':') != std::string::npos;
  std::string h = v6 ? "[" + host + "]" : host;
  if (explicitPort) h += ":" + std::to_string(port);
  return h;
}

std::optional<Url> parseUrl(const std::string& s) {
  const auto schemeEnd = s.find("://");
  if (schemeEnd == std::string::npos || schemeEnd == 0) return std::nullopt;

  Url u;
  u.scheme = toLower(s.substr(0, schemeEnd));
  if (u.scheme != "http" && u.scheme != "https") return std::nullopt;
  u.port = u.scheme == "https" ? 443 : 80;

  const std::size_t authStart = schemeEnd + 3;
  std::size_t authEnd = s.find_first_of("/?#", authStart);
  if (authEnd == std::string::npos) authEnd = s.size();

  std::string authority = s.substr(authStart, authEnd - authStart);
  // userinfo is not supported; use an authorization node instead
  if (authority.find('@') != std::string::npos) return std::nullopt;
  if (authority.empty()) return std::nullopt;

  std::string portStr;
  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    u.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') return std::nullopt;
      portStr = authority.substr(close + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      u.host = authority.substr(0, colon);
      portStr = authority.substr(colon + 1);
    } else {
      u.host = authority;
    }
  }
  if (u.host.empty()) return std::nullopt;
  for (unsigned char c : u.host) {
    if (std::isspace(c)) return std::nullopt;
  }

  if (!portStr.empty()) {
    for (unsigned char c : portStr) {
      if (!std::isdigit(c)) return std::nullopt;
    }
    const long p = std::strtol(portStr.c_str(), nullptr, 10);
    if (p <= 0 || p > 65535) return std::nullopt;
    u.port = static_cast<std::uint16_t>(p);
    u.explicitPort = true;
  }

  std::string rest = s.substr(authEnd);
  const auto hash = rest.find('#');
  if (hash != std::string::npos) {
    u.fragment = rest.substr(hash + 1);
    rest.erase(hash);
  }
  if (rest.empty() || rest.front() == '?') rest.insert(rest.begin(), '/');
  for (unsigned char c : rest) {
    if (std::isspace(c)) return std::nullopt;
  }
  u.target = rest;
  return u;
}

} // namespace reqkit::util
