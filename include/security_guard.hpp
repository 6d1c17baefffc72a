#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "bytes.hpp"
#include "clock.hpp"
#include "transport_config.hpp"

namespace netguard {

class Connection;


// Admission capability consulted by endpoints and channels.
// All operations must be safe to call concurrently from independent workers.
class AdmissionControl {
public:
    virtual ~AdmissionControl() = default;

    // Decides whether a new connection from source_ip is admissible.
    virtual bool admit_connection(const std::string& source_ip) = 0;

    // Decides whether byte_count more bytes from source_ip are admissible.
    virtual bool admit_data(const std::string& source_ip, std::uint64_t byte_count) = 0;

    // Rejects empty payloads and payloads over the single-message ceiling.
    virtual bool validate_payload(const Bytes& data) const = 0;
    virtual bool validate_length(std::uint64_t length) const = 0;

    // Bounds every subsequent blocking operation on the connection.
    virtual void apply_timeout(Connection& conn) const = 0;

    virtual std::chrono::seconds socket_timeout() const = 0;
};


// Per-source-IP sliding-window rate limiter and payload validator.
// Each IP's counters sit behind their own mutex; the map itself is guarded by
// a shared mutex taken exclusively only to insert a new IP.
class SecurityGuard : public AdmissionControl {
public:
    explicit SecurityGuard(const SecurityPolicy& policy,
                           std::shared_ptr<Clock> clock = SteadyClock::shared());
    ~SecurityGuard() override = default;

    SecurityGuard(const SecurityGuard&) = delete;
    SecurityGuard& operator=(const SecurityGuard&) = delete;

    bool admit_connection(const std::string& source_ip) override;
    bool admit_data(const std::string& source_ip, std::uint64_t byte_count) override;
    bool validate_payload(const Bytes& data) const override;
    bool validate_length(std::uint64_t length) const override;
    void apply_timeout(Connection& conn) const override;
    std::chrono::seconds socket_timeout() const override;

    const SecurityPolicy& policy() const { return policy_; }

    // Number of distinct source IPs seen so far.
    std::size_t tracked_ip_count() const;

    // Connections / bytes currently counted inside the window for source_ip.
    std::size_t connections_in_window(const std::string& source_ip);
    std::uint64_t bytes_in_window(const std::string& source_ip);

private:
    struct RateState {
        std::mutex mutex;
        std::deque<Clock::time_point> connection_timestamps;
        std::deque<std::pair<Clock::time_point, std::uint64_t>> data_events;
        std::uint64_t bytes_total = 0;  // sum over data_events
    };

    std::shared_ptr<RateState> state_for(const std::string& source_ip);
    void prune(RateState& state, Clock::time_point now) const;

    SecurityPolicy policy_;
    std::shared_ptr<Clock> clock_;
    std::chrono::seconds window_;

    std::unordered_map<std::string, std::shared_ptr<RateState>> states_;
    mutable std::shared_mutex states_mutex_;
};

}
