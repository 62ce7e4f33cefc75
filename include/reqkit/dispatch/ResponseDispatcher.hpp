#pragma once

#include <exception>
#include <utility>

#include "reqkit/Response.hpp"
#include "reqkit/Result.hpp"
#include "reqkit/dispatch/CallbackSet.hpp"
#include "reqkit/dispatch/Decode.hpp"
#include "reqkit/util/Logger.hpp"
#include "reqkit/util/Metrics.hpp"

namespace reqkit {

namespace detail {

// A throwing consumer is logged; the remaining consumers still run.
template <typename Fn>
void invokeGuarded(const char* consumer, Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "consumer threw",
                       {{"consumer", consumer}, {"err", ex.what()}});
  }
}

} // namespace detail

/// Fans one result out to every registered consumer that applies.
template <typename T>
class ResponseDispatcher {
public:
  static void dispatch(const Result<Response>& result, const CallbackSet<T>& cbs) {
    if (!result) {
      routeError(result.error(), cbs);
      return;
    }

    const Response& r = *result;

    if (cbs.onData) {
      detail::invokeGuarded("data", [&]{ cbs.onData(r.body); });
    }

    if (cbs.onString) {
      detail::invokeGuarded("string", [&]{ cbs.onString(decodeText(r.body)); });
    }

    if (cbs.onJson) {
      auto doc = parseDocument(r.body);
      if (doc) {
        detail::invokeGuarded("json", [&]{ cbs.onJson(**doc); });
      } else {
        decodeFailed(doc.error(), cbs);
      }
    }

    if (cbs.onObject) {
      auto obj = cbs.decode ? cbs.decode(r.body)
                            : Result<T>(Error{ErrorKind::Decode, "no decoder registered", "object"});
      if (obj) {
        detail::invokeGuarded("object", [&]{ cbs.onObject(*obj); });
      } else {
        decodeFailed(obj.error(), cbs);
      }
    }

    if (cbs.onStatusCode) {
      detail::invokeGuarded("status", [&]{ cbs.onStatusCode(r.status); });
    }
  }

private:
  static void decodeFailed(const Error& err, const CallbackSet<T>& cbs) {
    REQKIT_METRIC_HIT("dispatch.decode_failed");
    util::logger().log(util::LogLevel::Debug, "decode failed",
                       {{"consumer", err.path}, {"err", err.message}});
    routeError(err, cbs);
  }

  static void routeError(const Error& err, const CallbackSet<T>& cbs) {
    if (!cbs.onError) {
      util::logger().log(util::LogLevel::Debug, "error dropped (no error consumer)",
                         {{"err", err.describe()}});
      return;
    }
    detail::invokeGuarded("error", [&]{ cbs.onError(err); });
  }
};

} // namespace reqkit
