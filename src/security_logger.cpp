#include "security_logger.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace netguard {

std::atomic<int> SecurityLogger::min_level_{static_cast<int>(SecurityLogger::Level::INFO)};

namespace {

std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    struct tm gmt;
    gmtime_r(&time_t, &gmt);

    std::stringstream ss;
    ss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

}

void SecurityLogger::log(Level level, EventType event, const std::string& remote_addr,
                         const std::string& message) {
    if (static_cast<int>(level) < min_level_.load(std::memory_order_relaxed)) {
        return;
    }

    std::stringstream ss;
    ss << "[" << utc_timestamp() << " UTC] "
       << "[" << level_to_string(level) << "] "
       << "[" << event_to_string(event) << "] "
       << "ip=" << blind_address(remote_addr);

    if (!message.empty()) {
        ss << " msg=\"" << sanitize_log_message(message) << "\"";
    }

    std::lock_guard<std::mutex> lock(output_mutex());
    if (level == Level::ERROR || level == Level::CRITICAL) {
        std::cerr << ss.str() << "\n";
    } else {
        std::cout << ss.str() << "\n";
    }
}

// Salt rotates every 6 hours so a later salt compromise cannot reverse earlier
// IP-to-hash mappings.
std::string SecurityLogger::blind_address(const std::string& remote_addr) {
    if (remote_addr == "unknown" || remote_addr == "internal") {
        return remote_addr;
    }

    static std::mutex salt_mutex;
    static std::string log_salt;
    static std::chrono::steady_clock::time_point last_rotation;

    std::string salt;
    {
        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() ||
            std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }
        salt = log_salt;
    }

    std::string data = remote_addr + salt;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream hs;
    for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    return "anon_" + hs.str();
}

void SecurityLogger::set_min_level(Level level) {
    min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

SecurityLogger::Level SecurityLogger::min_level() {
    return static_cast<Level>(min_level_.load(std::memory_order_relaxed));
}

void SecurityLogger::configure_from_env() {
    if (const char* env_level = std::getenv("NETGUARD_LOG_LEVEL")) {
        Level level;
        if (parse_level(env_level, level)) {
            set_min_level(level);
        } else {
            log(Level::WARNING, EventType::CONFIG_ERROR, "internal",
                "Unknown NETGUARD_LOG_LEVEL value: " + std::string(env_level));
        }
    }
}

bool SecurityLogger::parse_level(const std::string& name, Level& out) {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "debug") out = Level::DEBUG;
    else if (lower == "info") out = Level::INFO;
    else if (lower == "warn" || lower == "warning") out = Level::WARNING;
    else if (lower == "error") out = Level::ERROR;
    else if (lower == "crit" || lower == "critical") out = Level::CRITICAL;
    else return false;
    return true;
}

std::string SecurityLogger::level_to_string(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARNING: return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string SecurityLogger::event_to_string(EventType event) {
    switch (event) {
        case EventType::CONNECTION_ACCEPTED: return "CONNECTION_ACCEPTED";
        case EventType::CONNECTION_REJECTED: return "CONNECTION_REJECTED";
        case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT_HIT";
        case EventType::INVALID_INPUT: return "INVALID_INPUT";
        case EventType::CRYPTO_FAILURE: return "CRYPTO_FAILURE";
        case EventType::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case EventType::CONFIG_ERROR: return "CONFIG_ERROR";
        case EventType::LIFECYCLE: return "LIFECYCLE";
        default: return "UNKNOWN_EVENT";
    }
}

// Escapes non-printable characters and quotes to ensure log integrity
std::string SecurityLogger::sanitize_log_message(const std::string& msg) {
    std::string result;
    result.reserve(msg.size());
    for (char c : msg) {
        if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
            result += ' ';
        } else if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    return result;
}

}
