#include "reqkit/update/UpdateSource.hpp"
#include "reqkit/util/Logger.hpp"

#include <exception>
#include <utility>

namespace reqkit {

UpdateSource UpdateSource::merged(std::shared_ptr<const ITrigger> trigger) const {
  UpdateSource out = *this;
  if (trigger) out.triggers_.push_back(std::move(trigger));
  return out;
}

UpdateSource UpdateSource::merged(const Signal& signal) const {
  return merged(std::make_shared<const Signal>(signal));
}

UpdateSource UpdateSource::mergedInterval(std::chrono::milliseconds period) const {
  return merged(std::make_shared<const IntervalTrigger>(period));
}

std::shared_ptr<UpdateStream> UpdateStream::start(boost::asio::io_context& ioc,
                                                  const UpdateSource& source,
                                                  Handler handler) {
  std::shared_ptr<UpdateStream> stream(new UpdateStream());
  stream->handler_ = std::move(handler);

  std::weak_ptr<UpdateStream> weak = stream;
  std::vector<std::shared_ptr<Subscription>> subs;
  subs.reserve(source.size());
  for (const auto& trigger : source.triggers()) {
    subs.push_back(trigger->subscribe(ioc, [weak] {
      if (auto s = weak.lock()) s->deliver();
    }));
  }

  {
    std::lock_guard<std::mutex> lk(stream->mx_);
    if (stream->active_) {
      stream->subs_ = std::move(subs);
      return stream;
    }
  }
  // Cancelled by the handler before start() returned.
  for (auto& s : subs) {
    if (s) s->cancel();
  }
  return stream;
}

UpdateStream::~UpdateStream() {
  for (auto& s : subs_) {
    if (s) s->cancel();
  }
}

void UpdateStream::deliver() {
  Handler h;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (!active_) return;
    h = handler_;
    ++inFlight_;
    ++delivered_;
  }

  try {
    if (h) h(*this);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "update handler threw", {{"err", ex.what()}});
  }

  std::lock_guard<std::mutex> lk(mx_);
  if (--inFlight_ == 0) idle_.notify_all();
}

void UpdateStream::cancel() noexcept {
  std::vector<std::shared_ptr<Subscription>> subs;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (!active_) return;
    active_ = false;
    subs.swap(subs_);
  }
  for (auto& s : subs) {
    if (s) s->cancel();
  }
}

void UpdateStream::cancelAndWait() noexcept {
  cancel();
  std::unique_lock<std::mutex> lk(mx_);
  idle_.wait(lk, [this]{ return inFlight_ == 0; });
  handler_ = nullptr;
}

bool UpdateStream::active() const noexcept {
  std::lock_guard<std::mutex> lk(mx_);
  return active_;
}

std::uint64_t UpdateStream::delivered() const noexcept {
  std::lock_guard<std::mutex> lk(mx_);
  return delivered_;
}

} // namespace reqkit
