#pragma once

#include <memory>

#include "reqkit/transport/ITransport.hpp"

namespace reqkit {

/// One execute() == one transport call, one delivered result.
class Executor {
public:
  using Completion = ITransport::Completion;

  explicit Executor(std::shared_ptr<ITransport> transport);

  void execute(const RequestDescriptor& request,
               const SessionConfig& session,
               Completion done) const;

  ITransport& transport() const noexcept { return *transport_; }

private:
  std::shared_ptr<ITransport> transport_;
};

} // namespace reqkit
