#ifndef RANGECACHE_SRC_KY_METRICS_METRICS_H
#define RANGECACHE_SRC_KY_METRICS_METRICS_H

#include <atomic>
#include <cstdint>
#include <string>

// NOTE: using #host -- impossible without macro
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define VISIT_METRICS(host) visitor.Visit(std::string(#host), host)

namespace ky::metrics {

using MetricValueType = intmax_t;

using Metric = std::atomic<MetricValueType>;

class MetricVisitor;

/***
 * Anything that exposes counters, possibly nested in other containers.
 */
class MetricContainer {
public:
  virtual ~MetricContainer() = default;

  virtual void Accept(MetricVisitor &visitor) = 0;
};

/***
 * Walks the counters of a container. Nested containers are reported through
 * the second overload, which is expected to recurse via `Accept`.
 */
class MetricVisitor {
public:
  virtual ~MetricVisitor() = default;

  virtual void Visit(const std::string &name, Metric &value) = 0;

  virtual void Visit(const std::string &name, MetricContainer &container) = 0;
};

}  // namespace ky::metrics

#endif  // RANGECACHE_SRC_KY_METRICS_METRICS_H
