#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

#include "reqkit/update/ITrigger.hpp"

namespace reqkit {

/// Caller-driven event stream. Copies share the same subscribers, so a Signal
/// handed to a request can be kept by the caller and emitted later.
class Signal final : public ITrigger {
public:
  Signal();

  // Delivers one event to every current subscriber, on the calling thread.
  void emit() const;

  std::size_t subscriberCount() const;

  std::shared_ptr<Subscription> subscribe(boost::asio::io_context& ioc, Emit emit) const override;

private:
  struct State {
    std::mutex                    mx;
    std::map<std::uint64_t, Emit> subs;
    std::uint64_t                 nextId{1};
  };

  std::shared_ptr<State> state_;
};

} // namespace reqkit
