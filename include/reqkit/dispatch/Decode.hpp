#pragma once

#include <memory>
#include <string>

#include <rapidjson/document.h>

#include "reqkit/Result.hpp"

namespace reqkit {

using DocumentPtr = std::shared_ptr<const rapidjson::Document>;

/// Body as UTF-8 text. Invalid UTF-8 yields an empty string, not an error.
std::string decodeText(const std::string& bytes);

/// Generic structured document (map / array / scalar tree).
/// Failure is a Decode error with path "document".
Result<DocumentPtr> parseDocument(const std::string& bytes);

} // namespace reqkit
