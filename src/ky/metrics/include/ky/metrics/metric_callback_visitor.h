#ifndef RANGECACHE_SRC_KY_METRICS_INCLUDE_KY_METRICS_METRIC_CALLBACK_VISITOR_H
#define RANGECACHE_SRC_KY_METRICS_INCLUDE_KY_METRICS_METRIC_CALLBACK_VISITOR_H

#include <ky/metrics/metrics.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace ky::metrics {

/***
 * Flattens a container into `//outer/inner/name` keys.
 */
class MetricCallbackVisitor final : private MetricVisitor {
public:
  using Callback = std::function<void(const std::string &key, Metric &value)>;

  explicit MetricCallbackVisitor(std::string root = {});

  void Snapshot(Callback callback, MetricContainer &container);

  std::map<std::string, MetricValueType> Collect(MetricContainer &container);

private:
  std::string root_;
  Callback callback_;
  std::vector<std::string> context_;

  void Visit(const std::string &name, MetricContainer &container) override;
  void Visit(const std::string &name, Metric &value) override;
};

}  // namespace ky::metrics

#endif  // RANGECACHE_SRC_KY_METRICS_INCLUDE_KY_METRICS_METRIC_CALLBACK_VISITOR_H
