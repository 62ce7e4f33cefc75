#pragma once

#include <chrono>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "reqkit/Auth.hpp"
#include "reqkit/Client.hpp"
#include "reqkit/Describe.hpp"
#include "reqkit/dispatch/CallbackSet.hpp"
#include "reqkit/dispatch/ResponseDispatcher.hpp"
#include "reqkit/params/Fold.hpp"
#include "reqkit/params/Params.hpp"
#include "reqkit/update/UpdateSource.hpp"

namespace reqkit {

namespace detail {
// Held by exactly one request value; update streams stop once it is gone.
struct Lifetime {};
} // namespace detail

/// A parameter tree, the consumers of its result and what re-runs it.
///
/// Every builder method is const and returns a new value; the receiver is
/// never modified. Update triggers keep firing while the value returned by the
/// last builder call (or a copy of it) is alive:
///
///   auto todos = Request{params::url("https://api.example.com/todos")}
///                  .onString([](const std::string& s){ ... })
///                  .updateEvery(std::chrono::seconds(5));
///   todos.call();   // runs now and every 5s until `todos` is destroyed
template <typename T>
class AnyRequest {
public:
  using ResponseType = T;

  explicit AnyRequest(Param root)
    : root_(std::move(root))
    , lifetime_(std::make_shared<const detail::Lifetime>())
  {}

  AnyRequest(std::initializer_list<Param> params)
    : AnyRequest(params::combined(params))
  {}

  // ---- consumers (one per kind, last registration wins) ----

  AnyRequest onData(std::function<void(const std::string&)> fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.onData = std::move(fn); });
  }

  AnyRequest onString(std::function<void(const std::string&)> fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.onString = std::move(fn); });
  }

  AnyRequest onJson(std::function<void(const rapidjson::Document&)> fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.onJson = std::move(fn); });
  }

  AnyRequest onObject(std::function<void(const T&)> fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.onObject = std::move(fn); });
  }

  AnyRequest onStatusCode(std::function<void(int)> fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.onStatusCode = std::move(fn); });
  }

  AnyRequest onError(std::function<void(const Error&)> fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.onError = std::move(fn); });
  }

  AnyRequest decodeWith(typename CallbackSet<T>::DecodeFn fn) const {
    return modify([&](AnyRequest& r){ r.callbacks_.decode = std::move(fn); });
  }

  // ---- tree ----

  // The Authorization header goes in front of the existing tree, so an
  // Authorization node already in the tree is visited later and wins.
  AnyRequest withAuthorization(const Auth& auth) const {
    return modify([&](AnyRequest& r){
      r.root_ = params::combined({params::authorization(auth), root_});
    });
  }

  // ---- updates ----

  AnyRequest update(const Signal& signal) const {
    return modify([&](AnyRequest& r){ r.updates_ = updates_.merged(signal); });
  }

  AnyRequest update(std::shared_ptr<const ITrigger> trigger) const {
    return modify([&](AnyRequest& r){ r.updates_ = updates_.merged(std::move(trigger)); });
  }

  AnyRequest updateEvery(std::chrono::milliseconds period) const {
    return modify([&](AnyRequest& r){ r.updates_ = updates_.mergedInterval(period); });
  }

  // ---- execution ----

  void call() const { call(defaultClient()); }

  void call(Client& client) const {
    auto root = root_;
    auto cbs  = callbacks_;
    Client::Job job{
      [root]{ return fold(root); },
      [cbs](const Result<Response>& r){ ResponseDispatcher<T>::dispatch(r, cbs); }
    };
    client.call(std::move(job), updates_, lifetime_);
  }

  // ---- inspection ----

  Result<Folded> build() const { return fold(root_); }

  // Target for GET, "<METHOD> <target>" otherwise; empty if the tree does not fold.
  std::string id() const {
    auto k = identity();
    if (!k) return {};
    if (k->first == Method::Get) return k->second;
    return std::string(toString(k->first)) + " " + k->second;
  }

  std::string prettyJson() const {
    auto f = build();
    if (!f) return f.error().describe();
    return describe(f->request);
  }

  const Param& root() const noexcept { return root_; }
  const CallbackSet<T>& callbacks() const noexcept { return callbacks_; }
  const UpdateSource& updateSource() const noexcept { return updates_; }

  // Method and target only. Body and headers are not part of identity.
  friend bool operator==(const AnyRequest& a, const AnyRequest& b) {
    return a.identity() == b.identity();
  }
  friend bool operator!=(const AnyRequest& a, const AnyRequest& b) { return !(a == b); }

private:
  std::optional<std::pair<Method, std::string>> identity() const {
    auto f = build();
    if (!f) return std::nullopt;
    return std::make_pair(f->request.method, f->request.target);
  }

  template <typename Fn>
  AnyRequest modify(Fn&& fn) const {
    AnyRequest copy = *this;
    fn(copy);
    copy.lifetime_ = std::make_shared<const detail::Lifetime>();
    return copy;
  }

  Param                                  root_;
  CallbackSet<T>                         callbacks_;
  UpdateSource                           updates_;
  std::shared_ptr<const detail::Lifetime> lifetime_;
};

using Request = AnyRequest<std::string>;

} // namespace reqkit
