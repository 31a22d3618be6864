#include "rld/MetricsCollector.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>

namespace rld {

MetricsCollector& MetricsCollector::instance() {
  static MetricsCollector instance;
  return instance;
}

void MetricsCollector::registerCounter(const std::string& name,
                                       const std::string& help) {
  static const std::regex validName("[a-zA-Z_][a-zA-Z0-9_]*");
  if (!std::regex_match(name, validName)) {
    throw std::invalid_argument("Invalid metric name: '" + name + "'");
  }

  std::lock_guard lock(mutex_);
  if (counters_.count(name)) {
    throw std::runtime_error("Metric already registered: " + name);
  }
  counters_[name].help = help;
}

bool MetricsCollector::isRegistered(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return counters_.count(name) != 0;
}

void MetricsCollector::incrementCounter(const std::string& name,
                                        double value) {
  incrementCounter(name, MetricLabels{}, value);
}

void MetricsCollector::incrementCounter(const std::string& name,
                                        const MetricLabels& labels,
                                        double value) {
  std::lock_guard lock(mutex_);
  if (auto it = counters_.find(name); it != counters_.end()) {
    it->second.series[labels] += value;
  }
}

double MetricsCollector::counterValue(const std::string& name,
                                      const MetricLabels& labels) const {
  std::lock_guard lock(mutex_);
  auto it = counters_.find(name);
  if (it == counters_.end()) return 0.0;
  auto series = it->second.series.find(labels);
  return series == it->second.series.end() ? 0.0 : series->second;
}

void MetricsCollector::recordTaskTime(const std::string& name,
                                      std::chrono::milliseconds duration) {
  std::lock_guard lock(mutex_);
  auto& task = taskTimes_[name];
  task.sumMs += static_cast<std::uint64_t>(duration.count());
  task.count += 1;
}

std::string MetricsCollector::formatLabels(const MetricLabels& labels) {
  if (labels.empty()) return "";

  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : labels) {
    if (!first) out += ",";
    first = false;
    out += key + "=\"";
    for (char c : value) {
      if (c == '\\' || c == '"') out += '\\';
      if (c == '\n') {
        out += "\\n";
        continue;
      }
      out += c;
    }
    out += "\"";
  }
  out += "}";
  return out;
}

std::string MetricsCollector::exportPrometheus() const {
  std::stringstream ss;
  std::lock_guard lock(mutex_);

  for (const auto& [name, counter] : counters_) {
    if (!counter.help.empty()) {
      ss << "# HELP " << name << " " << counter.help << "\n";
    }
    ss << "# TYPE " << name << " counter\n";
    for (const auto& [labels, value] : counter.series) {
      ss << name << formatLabels(labels) << " " << value << "\n";
    }
  }

  for (const auto& [name, task] : taskTimes_) {
    ss << "# TYPE " << name << " summary\n";
    ss << name << "_sum " << task.sumMs << "\n";
    ss << name << "_count " << task.count << "\n";
  }

  return ss.str();
}

void MetricsCollector::reset() {
  std::lock_guard lock(mutex_);
  counters_.clear();
  taskTimes_.clear();
}

}  // namespace rld
