#include "reqkit/RequestDescriptor.hpp"
#include "reqkit/Result.hpp"
#include "reqkit/SessionConfig.hpp"
#include "reqkit/util/Encoding.hpp"

#include <algorithm>

namespace reqkit {

const char* toString(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::MissingTarget:   return "MissingTarget";
    case ErrorKind::DuplicateTarget: return "DuplicateTarget";
    case ErrorKind::InvalidTarget:   return "InvalidTarget";
    case ErrorKind::InvalidParam:    return "InvalidParam";
    case ErrorKind::Transport:       return "Transport";
    case ErrorKind::Decode:          return "Decode";
  }
  return "Unknown";
}

const char* toString(CachePolicy p) noexcept {
  switch (p) {
    case CachePolicy::UseProtocol:         return "useProtocol";
    case CachePolicy::ReloadIgnoringCache: return "reloadIgnoringCache";
    case CachePolicy::ReturnCacheElseLoad: return "returnCacheElseLoad";
    case CachePolicy::ReturnCacheDontLoad: return "returnCacheDontLoad";
  }
  return "useProtocol";
}

std::optional<std::string> lastHeaderValue(const HeaderList& headers, const std::string& name) {
  for (auto it = headers.rbegin(); it != headers.rend(); ++it) {
    if (util::iequals(it->first, name)) return it->second;
  }
  return std::nullopt;
}

HeaderList RequestDescriptor::effectiveHeaders() const {
  HeaderList out;
  out.reserve(headers.size());
  for (const auto& h : headers) {
    auto it = std::find_if(out.begin(), out.end(), [&](const auto& e) {
      return util::iequals(e.first, h.first);
    });
    if (it == out.end()) {
      out.push_back(h);
    } else {
      it->second = h.second;
    }
  }
  return out;
}

bool operator==(const RequestDescriptor& a, const RequestDescriptor& b) {
  return a.method == b.method && a.target == b.target &&
         a.headers == b.headers && a.body == b.body;
}

bool operator==(const SessionConfig& a, const SessionConfig& b) {
  return a.defaultHeaders == b.defaultHeaders && a.timeout == b.timeout &&
         a.cachePolicy == b.cachePolicy && a.followRedirects == b.followRedirects &&
         a.options == b.options;
}

} // namespace reqkit
