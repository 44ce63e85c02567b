#include <ky/metrics/metric_callback_visitor.h>

#include <sstream>
#include <utility>

namespace ky::metrics {

MetricCallbackVisitor::MetricCallbackVisitor(std::string root)
    : root_(std::move(root)) {}

void MetricCallbackVisitor::Visit(
    const std::string &name,
    MetricContainer &container) {
  context_.push_back(name);
  container.Accept(*this);
  context_.pop_back();
}

void MetricCallbackVisitor::Visit(const std::string &name, Metric &value) {
  std::stringstream s;
  s << "//";
  for (const auto &term : context_) {
    s << term << "/";
  }
  s << name;
  callback_(s.str(), value);
}

void MetricCallbackVisitor::Snapshot(
    Callback callback,
    MetricContainer &container) {
  callback_ = std::move(callback);
  context_.clear();
  if (!root_.empty()) {
    context_.push_back(root_);
  }
  container.Accept(*this);
}

std::map<std::string, MetricValueType> MetricCallbackVisitor::Collect(
    MetricContainer &container) {
  std::map<std::string, MetricValueType> result;
  Snapshot(
      [&result](const std::string &key, Metric &value) {
        result[key] = value;
      },
      container);
  return result;
}

}  // namespace ky::metrics
