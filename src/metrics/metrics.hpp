#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace agentbus::metrics {

using Labels = std::map<std::string, std::string>;

// Labelled counters; the in-process stand-in for the metrics backend
class MetricsCollector {
public:
    void increment(const std::string& name, const Labels& labels = {}, uint64_t by = 1);

    // Current value of one labelled series (0 if never incremented)
    uint64_t value(const std::string& name, const Labels& labels = {}) const;

    // Sum over every label set of a counter
    uint64_t total(const std::string& name) const;

    // {"message_dropped{reason=no_handler}": 3, ...}
    nlohmann::json snapshot() const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<Labels, uint64_t>> counters_;

    static std::string series_name(const std::string& name, const Labels& labels);
};

} // namespace agentbus::metrics
