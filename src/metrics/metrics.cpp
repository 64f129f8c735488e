#include "metrics/metrics.hpp"

namespace agentbus::metrics {

void MetricsCollector::increment(const std::string& name, const Labels& labels, uint64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name][labels] += by;
}

uint64_t MetricsCollector::value(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        return 0;
    }
    auto series = it->second.find(labels);
    return series == it->second.end() ? 0 : series->second;
}

uint64_t MetricsCollector::total(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        return 0;
    }
    uint64_t sum = 0;
    for (const auto& [labels, count] : it->second) {
        sum += count;
    }
    return sum;
}

nlohmann::json MetricsCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, series] : counters_) {
        for (const auto& [labels, count] : series) {
            out[series_name(name, labels)] = count;
        }
    }
    return out;
}

void MetricsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
}

std::string MetricsCollector::series_name(const std::string& name, const Labels& labels) {
    if (labels.empty()) {
        return name;
    }
    std::string out = name + "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            out += ",";
        }
        out += key + "=" + value;
        first = false;
    }
    return out + "}";
}

} // namespace agentbus::metrics
