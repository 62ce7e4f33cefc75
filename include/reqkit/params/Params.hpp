#pragma once

#include <chrono>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <rapidjson/document.h>

#include "reqkit/Auth.hpp"
#include "reqkit/Method.hpp"
#include "reqkit/SessionConfig.hpp"
#include "reqkit/params/IParam.hpp"

namespace reqkit::params {

using ValueFn = std::function<std::string()>;

// ---- Target / method ----
Param url(std::string address);
Param method(Method m);

// ---- Headers ----
Param header(std::string name, std::string value);
// Value is computed on every fold (each call and each update trigger).
Param header(std::string name, ValueFn value);

Param accept(std::string mediaType);
Param contentType(std::string mediaType);
Param userAgent(std::string agent);
Param cacheControl(std::string directives);
Param authorization(const Auth& auth);

// ---- Query ----
Param query(std::string name, std::string value);
Param query(std::string name, ValueFn value);
Param query(std::vector<std::pair<std::string, std::string>> items);

// ---- Body ----
Param body(std::string bytes);
// Serialized once, compactly, when the node is built.
Param json(const rapidjson::Value& value);
// application/x-www-form-urlencoded pairs.
Param form(const std::vector<std::pair<std::string, std::string>>& fields);

// ---- Session ----
Param timeout(std::chrono::milliseconds t);
Param cachePolicy(CachePolicy p);
Param sessionHeader(std::string name, std::string value);
Param followRedirects(bool follow);
Param sessionOption(std::string key, std::string value);

// ---- Composition ----
Param combined(std::vector<Param> children);
Param combined(std::initializer_list<Param> children);

} // namespace reqkit::params
