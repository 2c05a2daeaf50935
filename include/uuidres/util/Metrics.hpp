#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace uuidres {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  // 0.0 when the name was never touched.
  double counter(const std::string& name) const;
  double gauge(const std::string& name) const;

  // Snapshots (cheap copies) for debug/admin endpoints.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util

#define UUIDRES_METRIC_INC(name, d) ::uuidres::util::MetricRegistry::instance().increment((name), (d))
#define UUIDRES_METRIC_HIT(name)    ::uuidres::util::MetricRegistry::instance().increment((name), 1.0)
#define UUIDRES_METRIC_SET(name, v) ::uuidres::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace uuidres
