#include "reqkit/Executor.hpp"
#include "reqkit/util/Logger.hpp"
#include "reqkit/util/Metrics.hpp"

#include <atomic>
#include <exception>
#include <stdexcept>

namespace reqkit {

using util::logger;
using util::LogLevel;

Executor::Executor(std::shared_ptr<ITransport> transport)
  : transport_(std::move(transport))
{
  if (!transport_) throw std::invalid_argument("Executor: null transport");
}

void Executor::execute(const RequestDescriptor& request,
                       const SessionConfig& session,
                       Completion done) const
{
  auto delivered = std::make_shared<std::atomic<bool>>(false);
  auto target = request.target;

  // Single-shot: whatever the transport does, `done` sees one value.
  Completion once = [delivered, target, done = std::move(done)](Result<Response> r) {
    if (delivered->exchange(true, std::memory_order_acq_rel)) {
      logger().log(LogLevel::Warn, "transport delivered more than once; dropped", {{"url", target}});
      return;
    }
    if (r) {
      REQKIT_METRIC_HIT("transport.ok");
      REQKIT_METRIC_INC("transport.bytes_in", static_cast<double>(r->body.size()));
      logger().log(LogLevel::Debug, "response",
                   {{"url", target}, {"status", std::to_string(r->status)},
                    {"bytes", std::to_string(r->body.size())}});
    } else {
      REQKIT_METRIC_HIT("transport.failed");
      logger().log(LogLevel::Warn, "transport failed", {{"url", target}, {"err", r.error().message}});
    }
    if (done) done(std::move(r));
  };

  logger().log(LogLevel::Debug, "execute",
               {{"method", toString(request.method)}, {"url", request.target}});

  try {
    transport_->perform(request, session, once);
  } catch (const std::exception& ex) {
    once(Error{ErrorKind::Transport, ex.what(), target});
  }
}

} // namespace reqkit
