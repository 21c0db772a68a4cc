#include "ingestvault/utilities/metrics.h"
#include <algorithm>
#include <sstream>
#include <vector>

namespace ingestvault {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const std::map<std::string, std::string> &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(
    const std::string &name, double value,
    const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(
    const std::string &name,
    const std::map<std::string, std::string> &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(
    const std::string &name,
    const std::map<std::string, std::string> &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(
    const std::map<std::string, std::string> &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  // Sorted output keeps dumps diffable between runs.
  std::vector<std::pair<std::string, double>> lines;
  for (const auto &kv : gauges_)
    lines.emplace_back(kv.first, kv.second);
  for (const auto &kv : counters_)
    lines.emplace_back(kv.first, kv.second);
  for (const auto &kv : histograms_) {
    auto name_end = kv.first.find('{');
    std::string name = kv.first.substr(0, name_end);
    std::string labels =
        name_end == std::string::npos ? "" : kv.first.substr(name_end);
    lines.emplace_back(name + "_sum" + labels, kv.second.sum);
    lines.emplace_back(name + "_count" + labels,
                       static_cast<double>(kv.second.count));
  }
  std::sort(lines.begin(), lines.end());

  std::ostringstream oss;
  for (const auto &line : lines) {
    oss << line.first << ' ' << line.second << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}

} // namespace ingestvault
