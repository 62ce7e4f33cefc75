#pragma once

#include <string>

#include "reqkit/RequestDescriptor.hpp"

namespace reqkit {

struct Response {
  int         status{0};
  HeaderList  headers;
  std::string body;

  std::optional<std::string> headerValue(const std::string& name) const {
    return lastHeaderValue(headers, name);
  }
};

} // namespace reqkit
