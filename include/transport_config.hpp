#pragma once

#include <cstdint>
#include <string>
#include <boost/json.hpp>

#include "config_source.hpp"

namespace netguard {

enum class Role {
    Client,
    Server
};

std::string role_to_string(Role role);


// Flood and slowloris mitigation limits, applied per source IP.
struct SecurityPolicy {
    std::uint64_t max_connections_per_window = 10;
    std::uint64_t max_bytes_per_window = 1024 * 1024;  // 1MB, also the single-message ceiling
    std::uint64_t socket_timeout_seconds = 10;
    std::uint64_t window_seconds = 60;
};

struct EndpointConfig {
    Role role = Role::Client;
    std::string host;
    std::uint16_t port = 0;
    int backlog = 5;
    SecurityPolicy security;
};

struct CipherConfig {
    std::string type;
    boost::json::object params;
};

// Parses the "security" object. Missing keys keep their defaults; present
// keys must be positive integers. Throws ConfigurationError.
SecurityPolicy parse_security_policy(const boost::json::object& obj);

// Parses a full settings object ({role, host, port, security?, backlog?}).
// Throws ConfigurationError.
EndpointConfig parse_endpoint_config(const boost::json::object& settings);

// Parses the "crypto" member of a settings object. Throws ConfigurationError.
CipherConfig parse_cipher_config(const boost::json::object& settings);

// Fetches and parses the settings object for (network, service_name, version).
// Absent entry or malformed JSON is a ConfigurationError.
boost::json::object load_settings(const ConfigSource& source,
                                  const std::string& service_name,
                                  const std::string& version);

EndpointConfig load_endpoint_config(const ConfigSource& source,
                                    const std::string& service_name,
                                    const std::string& version);

CipherConfig load_cipher_config(const ConfigSource& source,
                                const std::string& service_name,
                                const std::string& version);

}
