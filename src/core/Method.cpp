#include "reqkit/Method.hpp"
#include "reqkit/util/Encoding.hpp"

#include <array>
#include <utility>

namespace reqkit {

namespace {
constexpr std::array<std::pair<Method, const char*>, 9> kVerbs{{
  {Method::Get,     "GET"},
  {Method::Head,    "HEAD"},
  {Method::Post,    "POST"},
  {Method::Put,     "PUT"},
  {Method::Delete,  "DELETE"},
  {Method::Connect, "CONNECT"},
  {Method::Options, "OPTIONS"},
  {Method::Trace,   "TRACE"},
  {Method::Patch,   "PATCH"},
}};
} // namespace

const char* toString(Method m) noexcept {
  for (const auto& v : kVerbs) {
    if (v.first == m) return v.second;
  }
  return "GET";
}

std::optional<Method> parseMethod(const std::string& s) {
  for (const auto& v : kVerbs) {
    if (util::iequals(s, v.second)) return v.first;
  }
  return std::nullopt;
}

} // namespace reqkit
