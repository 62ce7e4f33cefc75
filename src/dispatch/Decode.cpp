#include "reqkit/dispatch/Decode.hpp"
#include "reqkit/util/Encoding.hpp"

#include <rapidjson/error/en.h>

namespace reqkit {

std::string decodeText(const std::string& bytes) {
  return util::isValidUtf8(bytes) ? bytes : std::string{};
}

Result<DocumentPtr> parseDocument(const std::string& bytes) {
  auto doc = std::make_shared<rapidjson::Document>();
  doc->Parse(bytes.data(), bytes.size());
  if (doc->HasParseError()) {
    return Error{ErrorKind::Decode,
                 std::string(rapidjson::GetParseError_En(doc->GetParseError())) +
                   " (offset " + std::to_string(doc->GetErrorOffset()) + ")",
                 "document"};
  }
  return DocumentPtr(std::move(doc));
}

} // namespace reqkit
