#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace apicache {

// Counter and gauge names exported on /metrics.
namespace metric {
constexpr const char* requests_total = "requests_total";
constexpr const char* cache_hits_total = "cache_hits_total";
constexpr const char* cache_misses_total = "cache_misses_total";
constexpr const char* cache_writes_total = "cache_writes_total";
constexpr const char* cache_store_errors_total = "cache_store_errors_total";
constexpr const char* rate_limited_total = "rate_limited_total";
constexpr const char* upstream_retries_total = "upstream_retries_total";
constexpr const char* upstream_failures_total = "upstream_failures_total";
constexpr const char* rate_limiters_active = "rate_limiters_active";
constexpr const char* upstream_connections_open = "upstream_connections_open";
constexpr const char* upstream_connections_idle = "upstream_connections_idle";
}

// Process-wide counters and gauges, exported in Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Counters only increase.
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    // Clears every series. Tests only.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }

        return ss.str();
    }

private:
    MetricsRegistry() = default;

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}
