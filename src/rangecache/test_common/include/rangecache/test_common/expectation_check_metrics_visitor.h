#ifndef RANGECACHE_SRC_TEST_COMMON_EXPECTATION_CHECK_METRICS_VISITOR_H
#define RANGECACHE_SRC_TEST_COMMON_EXPECTATION_CHECK_METRICS_VISITOR_H

#include <gtest/gtest.h>
#include <ky/metrics/metrics.h>

#include <map>
#include <string>

namespace rangecache {

/***
 * Checks the metrics of `host` against `{"//nested/name", value}` pairs.
 * Expectations that name no metric fail the test on destruction.
 */
class ExpectationCheckMetricVisitor final : public ky::metrics::MetricVisitor {
  std::map<std::string, ky::metrics::MetricValueType> expectations_;
  std::map<std::string, ky::metrics::MetricValueType> unchecked_;
  std::string context_;

public:
  ExpectationCheckMetricVisitor(
      ky::metrics::MetricContainer &host,
      std::map<std::string, ky::metrics::MetricValueType> &&expectations);

  ~ExpectationCheckMetricVisitor() override;

  void Visit(const std::string &name, ky::metrics::Metric &value) override;

  void Visit(const std::string &name, ky::metrics::MetricContainer &container)
      override;
};

}  // namespace rangecache

#endif  // RANGECACHE_SRC_TEST_COMMON_EXPECTATION_CHECK_METRICS_VISITOR_H
