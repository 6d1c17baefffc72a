#pragma once

#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace netguard {

// Names of everything the transport core records.
namespace metric {
inline constexpr const char* kConnectionsAccepted = "netguard_connections_accepted_total";
inline constexpr const char* kConnectionsRejected = "netguard_connections_rejected_total";
inline constexpr const char* kFramesReceived = "netguard_frames_received_total";
inline constexpr const char* kFramesSent = "netguard_frames_sent_total";
inline constexpr const char* kPayloadsRejected = "netguard_payloads_rejected_total";
inline constexpr const char* kCryptoFailures = "netguard_crypto_failures_total";
inline constexpr const char* kTransportErrors = "netguard_transport_errors_total";
inline constexpr const char* kActiveSessions = "netguard_active_sessions";
}

// Process-wide counters and gauges, exported in Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry registry;
        return registry;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return it != counters_.end() ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void add_to_gauge(const std::string& name, double delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += delta;
    }

    double get_gauge(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return it != gauges_.end() ? it->second : 0.0;
    }

    // Tests only.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Text exposition format 0.0.4: one "# TYPE" line per metric, counters
     * before gauges, each group sorted by name.
     */
    std::string collect_prometheus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream out;
        write_group(out, counters_, "counter");
        write_group(out, gauges_, "gauge");
        return out.str();
    }

private:
    MetricsRegistry() = default;

    static void write_group(std::ostringstream& out, const std::map<std::string, double>& values,
                            const char* type) {
        for (const auto& [name, value] : values) {
            out << "# TYPE " << name << " " << type << "\n" << name << " " << value << "\n";
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    mutable std::mutex mutex_;
};

// Raises a gauge for the lifetime of the object.
class ScopedGauge {
public:
    explicit ScopedGauge(std::string name) : name_(std::move(name)) {
        MetricsRegistry::instance().add_to_gauge(name_, 1.0);
    }
    ~ScopedGauge() { MetricsRegistry::instance().add_to_gauge(name_, -1.0); }

    ScopedGauge(const ScopedGauge&) = delete;
    ScopedGauge& operator=(const ScopedGauge&) = delete;

private:
    std::string name_;
};

}
