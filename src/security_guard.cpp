#include "security_guard.hpp"
#include "connection.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace netguard {

SecurityGuard::SecurityGuard(const SecurityPolicy& policy, std::shared_ptr<Clock> clock)
    : policy_(policy)
    , clock_(std::move(clock))
    , window_(static_cast<std::chrono::seconds::rep>(policy.window_seconds))
{
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, "internal",
                        "SecurityGuard max_connections=" + std::to_string(policy_.max_connections_per_window) +
                        " max_bytes=" + std::to_string(policy_.max_bytes_per_window) +
                        " timeout=" + std::to_string(policy_.socket_timeout_seconds) +
                        " window=" + std::to_string(policy_.window_seconds));
}

// Returns the state for source_ip, creating it on first sight.
std::shared_ptr<SecurityGuard::RateState> SecurityGuard::state_for(const std::string& source_ip) {
    {
        std::shared_lock lock(states_mutex_);
        auto it = states_.find(source_ip);
        if (it != states_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(states_mutex_);
    auto& slot = states_[source_ip];
    if (!slot) {
        slot = std::make_shared<RateState>();
    }
    return slot;
}

// Drops events older than the window. Caller holds state.mutex.
void SecurityGuard::prune(RateState& state, Clock::time_point now) const {
    while (!state.connection_timestamps.empty() &&
           now - state.connection_timestamps.front() > window_) {
        state.connection_timestamps.pop_front();
    }
    while (!state.data_events.empty() &&
           now - state.data_events.front().first > window_) {
        state.bytes_total -= state.data_events.front().second;
        state.data_events.pop_front();
    }
}

bool SecurityGuard::admit_connection(const std::string& source_ip) {
    auto state = state_for(source_ip);
    std::lock_guard<std::mutex> lock(state->mutex);

    auto now = clock_->now();
    prune(*state, now);

    if (state->connection_timestamps.size() >= policy_.max_connections_per_window) {
        MetricsRegistry::instance().increment_counter(metric::kConnectionsRejected);
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT, source_ip,
                            "Connection rate limit exceeded: " + std::to_string(state->connection_timestamps.size()) +
                            " connections in " + std::to_string(policy_.window_seconds) + " seconds");
        return false;
    }

    state->connection_timestamps.push_back(now);
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::CONNECTION_ACCEPTED, source_ip,
                        "Allowed connection (" + std::to_string(state->connection_timestamps.size()) + "/" +
                        std::to_string(policy_.max_connections_per_window) + ")");
    return true;
}

bool SecurityGuard::admit_data(const std::string& source_ip, std::uint64_t byte_count) {
    auto state = state_for(source_ip);
    std::lock_guard<std::mutex> lock(state->mutex);

    auto now = clock_->now();
    prune(*state, now);

    if (byte_count > policy_.max_bytes_per_window ||
        state->bytes_total > policy_.max_bytes_per_window - byte_count) {
        MetricsRegistry::instance().increment_counter(metric::kPayloadsRejected);
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT, source_ip,
                            "Data rate limit exceeded: " + std::to_string(state->bytes_total) + " + " +
                            std::to_string(byte_count) + " bytes in " +
                            std::to_string(policy_.window_seconds) + " seconds");
        return false;
    }

    state->data_events.emplace_back(now, byte_count);
    state->bytes_total += byte_count;
    return true;
}

bool SecurityGuard::validate_payload(const Bytes& data) const {
    return validate_length(data.size());
}

bool SecurityGuard::validate_length(std::uint64_t length) const {
    if (length == 0) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            "internal", "Empty payload");
        return false;
    }
    if (length > policy_.max_bytes_per_window) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            "internal", "Payload size " + std::to_string(length) +
                            " exceeds maximum allowed " + std::to_string(policy_.max_bytes_per_window));
        return false;
    }
    return true;
}

void SecurityGuard::apply_timeout(Connection& conn) const {
    conn.set_timeout(socket_timeout());
}

std::chrono::seconds SecurityGuard::socket_timeout() const {
    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(policy_.socket_timeout_seconds));
}

std::size_t SecurityGuard::tracked_ip_count() const {
    std::shared_lock lock(states_mutex_);
    return states_.size();
}

std::size_t SecurityGuard::connections_in_window(const std::string& source_ip) {
    auto state = state_for(source_ip);
    std::lock_guard<std::mutex> lock(state->mutex);
    prune(*state, clock_->now());
    return state->connection_timestamps.size();
}

std::uint64_t SecurityGuard::bytes_in_window(const std::string& source_ip) {
    auto state = state_for(source_ip);
    std::lock_guard<std::mutex> lock(state->mutex);
    prune(*state, clock_->now());
    return state->bytes_total;
}

}
