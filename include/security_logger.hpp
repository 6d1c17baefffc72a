#pragma once

#include <atomic>
#include <string>

namespace netguard {

// Logs transport and security events using blinded IP identifiers (salted hash).
class SecurityLogger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        CONNECTION_ACCEPTED,
        CONNECTION_REJECTED,
        RATE_LIMIT_HIT,
        INVALID_INPUT,
        CRYPTO_FAILURE,
        TRANSPORT_ERROR,
        CONFIG_ERROR,
        LIFECYCLE
    };

    /**
     * Records an event with a blinded peer identifier.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param remote_addr The source IP address (blinded before logging unless
     *                    it is "internal" or "unknown").
     * @param message Optional descriptive message (sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "");

    // Events below this level are dropped. Default INFO.
    static void set_min_level(Level level);
    static Level min_level();

    // Reads NETGUARD_LOG_LEVEL (debug|info|warn|error|crit) if set.
    static void configure_from_env();

    // Parses a level name; returns false on an unknown name.
    static bool parse_level(const std::string& name, Level& out);

    static std::string sanitize_log_message(const std::string& msg);
    static std::string level_to_string(Level level);
    static std::string event_to_string(EventType event);

private:
    static std::string blind_address(const std::string& remote_addr);

    static std::atomic<int> min_level_;
};

}
