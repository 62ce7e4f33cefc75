#include "reqkit/update/IntervalTrigger.hpp"
#include "reqkit/util/Logger.hpp"

#include <atomic>
#include <exception>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace reqkit {

namespace net = boost::asio;

namespace {

class IntervalSubscription final : public Subscription,
                                   public std::enable_shared_from_this<IntervalSubscription> {
public:
  IntervalSubscription(net::io_context& ioc, std::chrono::milliseconds period, ITrigger::Emit emit)
    : timer_(net::make_strand(ioc))
    , period_(period)
    , emit_(std::move(emit))
  {}

  // timer_ is only touched on its strand, from here on as well as in cancel().
  void launch() {
    net::post(timer_.get_executor(), [self = shared_from_this()] { self->start(); });
  }

  void cancel() noexcept override {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    try {
      net::post(timer_.get_executor(), [self = shared_from_this()] {
        self->timer_.cancel();
      });
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Warn, "interval cancel failed", {{"err", ex.what()}});
    }
  }

private:
  void start() {
    if (cancelled_.load(std::memory_order_acquire)) return;
    next_ = net::steady_timer::clock_type::now();
    arm();
  }

  void arm() {
    next_ += period_;
    timer_.expires_at(next_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
      if (ec || self->cancelled_.load(std::memory_order_acquire)) return;
      if (self->emit_) self->emit_();
      self->arm();
    });
  }

  net::steady_timer                     timer_;
  std::chrono::milliseconds             period_;
  ITrigger::Emit                        emit_;
  net::steady_timer::time_point         next_;
  std::atomic<bool>                     cancelled_{false};
};

} // namespace

IntervalTrigger::IntervalTrigger(std::chrono::milliseconds period)
  : period_(period.count() > 0 ? period : std::chrono::milliseconds(1))
{}

std::shared_ptr<Subscription> IntervalTrigger::subscribe(net::io_context& ioc, Emit emit) const {
  auto sub = std::make_shared<IntervalSubscription>(ioc, period_, std::move(emit));
  sub->launch();
  return sub;
}

} // namespace reqkit
