#pragma once

#include <string>

namespace reqkit {

/// Value of an Authorization header: "<type> <key>".
struct Auth {
  std::string type;
  std::string key;

  static Auth basic(const std::string& username, const std::string& password);
  static Auth bearer(const std::string& token);

  std::string value() const { return type + " " + key; }
};

} // namespace reqkit
