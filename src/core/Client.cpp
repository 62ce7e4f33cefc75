#include "reqkit/Client.hpp"
#include "reqkit/transport/BeastTransport.hpp"
#include "reqkit/util/Logger.hpp"
#include "reqkit/util/Metrics.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <utility>

namespace reqkit {

using util::logger;
using util::LogLevel;

Client::Client(util::Config cfg)
  : cfg_(std::move(cfg))
  , work_(boost::asio::make_work_guard(ioc_))
  , pool_(std::make_shared<rt::ThreadPool>(cfg_.dispatchThreads))
  , executor_(std::make_unique<Executor>(std::make_shared<BeastTransport>(ioc_, cfg_)))
{
  startIoThreads();
}

Client::Client(util::Config cfg, std::shared_ptr<ITransport> transport)
  : cfg_(std::move(cfg))
  , work_(boost::asio::make_work_guard(ioc_))
  , pool_(std::make_shared<rt::ThreadPool>(cfg_.dispatchThreads))
  , executor_(std::make_unique<Executor>(std::move(transport)))
{
  startIoThreads();
}

Client::~Client() {
  shutdown();
  // An io thread that ran shutdown() itself was not joined there.
  for (auto& t : ioThreads_) {
    if (!t.joinable()) continue;
    if (t.get_id() == std::this_thread::get_id()) t.detach();
    else t.join();
  }
}

Result<Folded> Client::runFold(const Job& job) {
  if (!job.fold) return Error{ErrorKind::MissingTarget, "no request tree", "root"};
  try {
    return job.fold();
  } catch (const std::exception& ex) {
    return Error{ErrorKind::InvalidParam, ex.what(), "root"};
  }
}

void Client::startIoThreads() {
  const unsigned n = cfg_.ioThreads == 0 ? 1u : cfg_.ioThreads;
  ioThreads_.reserve(n);
  for (unsigned i = 0; i < n; ++i) {
    ioThreads_.emplace_back([this] {
      for (;;) {
        try {
          ioc_.run();
          return;
        } catch (const std::exception& ex) {
          logger().log(LogLevel::Error, "io thread: handler threw", {{"err", ex.what()}});
        }
      }
    });
  }
  logger().log(LogLevel::Info, "client started",
               {{"ioThreads", std::to_string(n)},
                {"dispatchThreads", std::to_string(pool_->size())}});
}

void Client::call(const Job& job) {
  REQKIT_METRIC_HIT("requests.submitted");

  auto pool = pool_;
  auto dispatch = job.dispatch;

  Result<Folded> folded = runFold(job);

  if (!folded) {
    // Build errors never reach the executor; the consumer still hears about
    // them on the dispatch pool, never inside call().
    REQKIT_METRIC_HIT("requests.build_failed");
    logger().log(LogLevel::Warn, "request build failed", {{"err", folded.error().describe()}});
    Result<Response> failure(folded.error());
    pool->post([dispatch, failure] {
      if (dispatch) dispatch(failure);
    });
    return;
  }

  util::Logger::Scoped scope({{"target", folded->request.target}});
  executor_->execute(folded->request, folded->session,
                     [pool, dispatch](Result<Response> r) {
    pool->post([dispatch, r = std::move(r)] {
      if (dispatch) dispatch(r);
    });
  });
}

void Client::call(Job job, const UpdateSource& updates, std::weak_ptr<const void> lifetime) {
  call(job);
  if (updates.empty()) return;

  std::weak_ptr<const void> weakLifetime = lifetime;

  auto stream = UpdateStream::start(ioc_, updates,
      [this, job = std::move(job), lifetime = std::move(lifetime)](UpdateStream& s) {
    if (lifetime.expired()) {
      logger().log(LogLevel::Info, "request released; update stream cancelled");
      s.cancel();
      return;
    }
    REQKIT_METRIC_HIT("updates.triggered");
    call(job);
  });

  std::lock_guard<std::mutex> lk(mx_);
  if (stopped_) {
    stream->cancel();
    return;
  }
  pruneStreams();
  streams_.push_back(Tracked{std::move(stream), std::move(weakLifetime)});
  REQKIT_METRIC_SET("updates.streams", static_cast<double>(streams_.size()));
  logger().log(LogLevel::Info, "update stream started",
               {{"triggers", std::to_string(updates.size())}});
}

// Drops finished streams and those whose request is gone. A stream driven
// only by a Signal would otherwise wait for the next emit to notice.
void Client::pruneStreams() {
  auto dead = std::stable_partition(streams_.begin(), streams_.end(), [](const Tracked& t) {
    return t.stream->active() && !t.lifetime.expired();
  });
  for (auto it = dead; it != streams_.end(); ++it) it->stream->cancel();
  streams_.erase(dead, streams_.end());
}

std::size_t Client::activeUpdateStreams() const {
  std::lock_guard<std::mutex> lk(mx_);
  return static_cast<std::size_t>(std::count_if(streams_.begin(), streams_.end(),
      [](const Tracked& t){ return t.stream->active(); }));
}

void Client::drain() {
  pool_->drain();
}

void Client::shutdown() {
  std::vector<Tracked> streams;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopped_) return;
    stopped_ = true;
    streams.swap(streams_);
  }

  for (auto& t : streams) t.stream->cancelAndWait();
  REQKIT_METRIC_SET("updates.streams", 0.0);

  work_.reset();
  ioc_.stop();
  for (auto& t : ioThreads_) {
    if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
  }
  pool_->shutdown();

  logger().log(LogLevel::Info, "client stopped");
}

Client& defaultClient() {
  static Client client([] {
    util::Config cfg;
    if (const char* path = std::getenv("REQKIT_CONFIG")) {
      if (!cfg.loadFromFile(path)) {
        logger().log(LogLevel::Warn, "config: failed to load", {{"path", path}});
      }
    }
    cfg.applyLogging();
    return cfg;
  }());
  return client;
}

} // namespace reqkit
