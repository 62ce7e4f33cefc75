#pragma once

#include <optional>
#include <string>

namespace reqkit {

enum class Method : int {
  Get = 0,
  Head,
  Post,
  Put,
  Delete,
  Connect,
  Options,
  Trace,
  Patch
};

/// Upper-case verb as sent on the wire ("GET", "POST", ...).
const char* toString(Method m) noexcept;

/// Case-insensitive parse; std::nullopt for unknown verbs.
std::optional<Method> parseMethod(const std::string& s);

} // namespace reqkit
