#include "reqkit/Auth.hpp"
#include "reqkit/util/Encoding.hpp"

namespace reqkit {

Auth Auth::basic(const std::string& username, const std::string& password) {
  return Auth{"Basic", util::base64Encode(username + ":" + password)};
}

Auth Auth::bearer(const std::string& token) {
  return Auth{"Bearer", token};
}

} // namespace reqkit
