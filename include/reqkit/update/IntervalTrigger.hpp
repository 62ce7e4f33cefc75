#pragma once

#include <chrono>

#include "reqkit/update/ITrigger.hpp"

namespace reqkit {

/// Fires every `period` on the io_context, first tick one period after subscribe.
/// Ticks are scheduled against absolute deadlines so they do not drift.
class IntervalTrigger final : public ITrigger {
public:
  explicit IntervalTrigger(std::chrono::milliseconds period);

  std::shared_ptr<Subscription> subscribe(boost::asio::io_context& ioc, Emit emit) const override;

  std::chrono::milliseconds period() const noexcept { return period_; }

private:
  std::chrono::milliseconds period_;
};

} // namespace reqkit
