#include "reqkit/update/Signal.hpp"

#include <utility>
#include <vector>

namespace reqkit {

namespace {

template <typename State>
class SignalSubscription final : public Subscription {
public:
  SignalSubscription(std::weak_ptr<State> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {}

  void cancel() noexcept override {
    auto st = state_.lock();
    if (!st) return;
    std::lock_guard<std::mutex> lk(st->mx);
    st->subs.erase(id_);
  }

private:
  std::weak_ptr<State> state_;
  std::uint64_t        id_;
};

} // namespace

Signal::Signal() : state_(std::make_shared<State>()) {}

void Signal::emit() const {
  // Snapshot so subscribers may cancel (or subscribe) from inside the callback.
  std::vector<Emit> targets;
  {
    std::lock_guard<std::mutex> lk(state_->mx);
    targets.reserve(state_->subs.size());
    for (const auto& [id, fn] : state_->subs) targets.push_back(fn);
  }
  for (auto& fn : targets) {
    if (fn) fn();
  }
}

std::size_t Signal::subscriberCount() const {
  std::lock_guard<std::mutex> lk(state_->mx);
  return state_->subs.size();
}

std::shared_ptr<Subscription> Signal::subscribe(boost::asio::io_context&, Emit emit) const {
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lk(state_->mx);
    id = state_->nextId++;
    state_->subs.emplace(id, std::move(emit));
  }
  return std::make_shared<SignalSubscription<State>>(state_, id);
}

} // namespace reqkit
