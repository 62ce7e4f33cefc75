#pragma once

#include <string>
#include <string_view>

namespace reqkit::util {

// RFC 3986 unreserved characters pass through; everything else becomes %XX.
std::string percentEncode(std::string_view s);

std::string base64Encode(std::string_view s);

bool isValidUtf8(std::string_view s) noexcept;

bool iequals(std::string_view a, std::string_view b) noexcept;

std::string toLower(std::string_view s);

} // namespace reqkit::util
