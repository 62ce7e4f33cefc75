#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "reqkit/Executor.hpp"
#include "reqkit/Response.hpp"
#include "reqkit/Result.hpp"
#include "reqkit/params/Fold.hpp"
#include "reqkit/rt/ThreadPool.hpp"
#include "reqkit/update/UpdateSource.hpp"
#include "reqkit/util/Config.hpp"

namespace reqkit {

/// Runtime behind every call: the io_context and its threads, the dispatch
/// pool, the executor and the update streams still alive.
class Client {
public:
  /// One pipeline run, erased over the response type.
  struct Job {
    std::function<Result<Folded>()>               fold;
    std::function<void(const Result<Response>&)>  dispatch;
  };

  explicit Client(util::Config cfg = {});
  // Transport is injected; the Client still owns the io_context for timers.
  Client(util::Config cfg, std::shared_ptr<ITransport> transport);
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  // Fold, execute, dispatch. Never blocks on the network and never throws:
  // a fold that throws is reported to the error consumer as InvalidParam.
  void call(const Job& job);

  // call(job) now, then again on every event of `updates` while `lifetime`
  // is alive. The first event after it expires cancels the stream.
  void call(Job job, const UpdateSource& updates, std::weak_ptr<const void> lifetime);

  // Waits until every queued callback has run. For tests and the CLI.
  void drain();

  // Cancels update streams, stops the io_context, joins threads. Idempotent.
  void shutdown();

  std::size_t activeUpdateStreams() const;

  boost::asio::io_context& ioContext() noexcept { return ioc_; }
  const util::Config& config() const noexcept { return cfg_; }
  const Executor& executor() const noexcept { return *executor_; }

private:
  struct Tracked {
    std::shared_ptr<UpdateStream> stream;
    std::weak_ptr<const void>     lifetime;
  };

  void startIoThreads();
  void pruneStreams();
  static Result<Folded> runFold(const Job& job);

  util::Config                                      cfg_;
  boost::asio::io_context                           ioc_;
  std::optional<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>      work_;
  std::vector<std::thread>                          ioThreads_;
  std::shared_ptr<rt::ThreadPool>                   pool_;
  std::unique_ptr<Executor>                         executor_;

  mutable std::mutex                                mx_;
  std::vector<Tracked>                              streams_;
  bool                                              stopped_{false};
};

/// Process-wide client. Configured from the file named by REQKIT_CONFIG, if set.
Client& defaultClient();

} // namespace reqkit
