#pragma once

#include <functional>

#include "reqkit/RequestDescriptor.hpp"
#include "reqkit/Response.hpp"
#include "reqkit/Result.hpp"
#include "reqkit/SessionConfig.hpp"

namespace reqkit {

/// Performs one HTTP exchange. The completion must be invoked exactly once,
/// from any thread, with either the response or a Transport error.
class ITransport {
public:
  using Completion = std::function<void(Result<Response>)>;

  ITransport() = default;
  virtual ~ITransport() = default;

  ITransport(const ITransport&) = delete;
  ITransport& operator=(const ITransport&) = delete;
  ITransport(ITransport&&) = delete;
  ITransport& operator=(ITransport&&) = delete;

  virtual void perform(const RequestDescriptor& request,
                       const SessionConfig& session,
                       Completion done) = 0;
};

} // namespace reqkit
