#pragma once

#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>

namespace reqkit {

/// Handle to one live subscription on a trigger.
class Subscription {
public:
  Subscription() = default;
  virtual ~Subscription() = default;

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  // Stops future events. Safe from any thread, idempotent.
  virtual void cancel() noexcept = 0;
};

/// A source of discrete "something happened" events.
class ITrigger {
public:
  using Emit = std::function<void()>;

  ITrigger() = default;
  virtual ~ITrigger() = default;

  virtual std::shared_ptr<Subscription> subscribe(boost::asio::io_context& ioc, Emit emit) const = 0;
};

} // namespace reqkit
