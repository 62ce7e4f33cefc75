#pragma once

#include <string>
#include <utility>
#include <variant>

namespace reqkit {

enum class ErrorKind : int {
  MissingTarget = 0,   // fold: no target node anywhere in the tree
  DuplicateTarget,     // fold: more than one target node
  InvalidTarget,       // fold: target is not an absolute http(s) URL
  InvalidParam,        // fold: a node (e.g. a dynamic value) threw
  Transport,           // network / connection failure
  Decode               // text / document / object decoding failure
};

const char* toString(ErrorKind k) noexcept;

struct Error {
  ErrorKind   kind{ErrorKind::Transport};
  std::string message;
  std::string path;   // node path for build errors, URL for transport, consumer for decode

  bool isBuildError() const noexcept {
    return kind == ErrorKind::MissingTarget ||
           kind == ErrorKind::DuplicateTarget ||
           kind == ErrorKind::InvalidTarget ||
           kind == ErrorKind::InvalidParam;
  }

  std::string describe() const {
    std::string out = toString(kind);
    if (!path.empty()) out += " at " + path;
    return out + ": " + message;
  }
};

template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, Error> _value;
};

} // namespace reqkit
