#pragma once

#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "reqkit/update/ITrigger.hpp"
#include "reqkit/update/IntervalTrigger.hpp"
#include "reqkit/update/Signal.hpp"

namespace reqkit {

/// Immutable set of triggers. Adding one yields a new source.
class UpdateSource {
public:
  UpdateSource() = default;

  UpdateSource merged(std::shared_ptr<const ITrigger> trigger) const;
  UpdateSource merged(const Signal& signal) const;
  UpdateSource mergedInterval(std::chrono::milliseconds period) const;

  bool empty() const noexcept { return triggers_.empty(); }
  std::size_t size() const noexcept { return triggers_.size(); }
  const std::vector<std::shared_ptr<const ITrigger>>& triggers() const noexcept { return triggers_; }

private:
  std::vector<std::shared_ptr<const ITrigger>> triggers_;
};

/// Every trigger of a source merged into one event stream with one handler.
/// Events are not coalesced: overlapping ticks each reach the handler.
class UpdateStream : public std::enable_shared_from_this<UpdateStream> {
public:
  using Handler = std::function<void(UpdateStream&)>;

  static std::shared_ptr<UpdateStream> start(boost::asio::io_context& ioc,
                                             const UpdateSource& source,
                                             Handler handler);

  // Stops every subscription. Safe to call from inside the handler.
  void cancel() noexcept;

  // cancel(), then waits for handler calls already running on other threads.
  // Must not be called from inside the handler.
  void cancelAndWait() noexcept;

  bool active() const noexcept;
  std::uint64_t delivered() const noexcept;

  ~UpdateStream();

  UpdateStream(const UpdateStream&) = delete;
  UpdateStream& operator=(const UpdateStream&) = delete;

private:
  UpdateStream() = default;

  void deliver();

  mutable std::mutex                          mx_;
  std::condition_variable                     idle_;
  Handler                                     handler_;
  std::vector<std::shared_ptr<Subscription>>  subs_;
  bool                                        active_{true};
  unsigned                                    inFlight_{0};
  std::uint64_t                               delivered_{0};
};

} // namespace reqkit
