#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace reqkit {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;

  // Snapshots (cheap copies) for debug output.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util

#define REQKIT_METRIC_INC(name, d) ::reqkit::util::MetricRegistry::instance().increment((name), (d))
#define REQKIT_METRIC_HIT(name)    ::reqkit::util::MetricRegistry::instance().increment((name), 1.0)
#define REQKIT_METRIC_SET(name, v) ::reqkit::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace reqkit
