#pragma once

#include <functional>
#include <string>

#include <rapidjson/document.h>

#include "reqkit/Result.hpp"
#include "reqkit/dispatch/Decoder.hpp"

namespace reqkit {

/// At most one consumer per result kind. Empty std::function == not registered.
template <typename T>
struct CallbackSet {
  using DecodeFn = std::function<Result<T>(const std::string&)>;

  std::function<void(const std::string&)>         onData;
  std::function<void(const std::string&)>         onString;
  std::function<void(const rapidjson::Document&)> onJson;
  std::function<void(const T&)>                   onObject;
  std::function<void(int)>                        onStatusCode;
  std::function<void(const Error&)>               onError;

  DecodeFn decode = &Decoder<T>::decode;
};

} // namespace reqkit
