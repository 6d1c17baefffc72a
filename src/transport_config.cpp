#include "transport_config.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "security_logger.hpp"

#include <initializer_list>
#include <limits>

namespace json = boost::json;

namespace netguard {

namespace {

[[noreturn]] void config_fail(const std::string& message) {
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                        "internal", message);
    throw ConfigurationError(message);
}

// Returns true and sets `out` when `v` holds a non-negative integer.
bool as_unsigned(const json::value& v, std::uint64_t& out) {
    if (v.is_uint64()) {
        out = v.as_uint64();
        return true;
    }
    if (v.is_int64() && v.as_int64() >= 0) {
        out = static_cast<std::uint64_t>(v.as_int64());
        return true;
    }
    return false;
}

// Looks up the first present key among `names` (canonical name first, then aliases).
const json::value* find_any(const json::object& obj, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (const json::value* v = obj.if_contains(name)) {
            return v;
        }
    }
    return nullptr;
}

void read_positive(const json::object& obj, std::initializer_list<const char*> names,
                   std::uint64_t& field) {
    const json::value* v = find_any(obj, names);
    if (!v) return;

    std::uint64_t value = 0;
    if (!as_unsigned(*v, value) || value == 0) {
        config_fail(std::string("security.") + *names.begin() + " must be a positive integer");
    }
    field = value;
}

}

std::string role_to_string(Role role) {
    return role == Role::Server ? "server" : "client";
}

SecurityPolicy parse_security_policy(const json::object& obj) {
    SecurityPolicy policy;
    read_positive(obj, {"max_connections_per_window", "max_connections_per_ip"},
                  policy.max_connections_per_window);
    read_positive(obj, {"max_bytes_per_window", "max_data_per_ip"}, policy.max_bytes_per_window);
    read_positive(obj, {"socket_timeout_seconds", "timeout"}, policy.socket_timeout_seconds);
    read_positive(obj, {"window_seconds", "rate_window"}, policy.window_seconds);

    // Doubles as the single-message ceiling, which must leave room for cipher padding
    // within the int lengths OpenSSL accepts.
    constexpr std::uint64_t max_message = std::numeric_limits<int>::max() - 16;
    if (policy.max_bytes_per_window > max_message) {
        config_fail("security.max_bytes_per_window exceeds " + std::to_string(max_message));
    }
    return policy;
}

EndpointConfig parse_endpoint_config(const json::object& settings) {
    EndpointConfig config;

    const json::value* role = settings.if_contains("role");
    if (!role || !role->is_string()) {
        config_fail("Role must be 'client' or 'server'");
    }
    if (role->as_string() == "server") {
        config.role = Role::Server;
    } else if (role->as_string() == "client") {
        config.role = Role::Client;
    } else {
        config_fail("Role must be 'client' or 'server', got '" + std::string(role->as_string()) + "'");
    }

    const json::value* host = settings.if_contains("host");
    if (!host || !host->is_string() || host->as_string().empty()) {
        config_fail("Host must be a non-empty string");
    }
    config.host = std::string(host->as_string());

    const json::value* port = settings.if_contains("port");
    std::uint64_t port_value = 0;
    if (!port || !as_unsigned(*port, port_value) || port_value > 65535) {
        config_fail("Port must be an integer between 0 and 65535");
    }
    config.port = static_cast<std::uint16_t>(port_value);

    if (const json::value* backlog = settings.if_contains("backlog")) {
        std::uint64_t backlog_value = 0;
        if (!as_unsigned(*backlog, backlog_value) || backlog_value == 0 || backlog_value > 4096) {
            config_fail("Backlog must be an integer between 1 and 4096");
        }
        config.backlog = static_cast<int>(backlog_value);
    }

    if (const json::value* security = settings.if_contains("security")) {
        if (!security->is_object()) {
            config_fail("Security settings must be an object");
        }
        config.security = parse_security_policy(security->as_object());
    }

    return config;
}

CipherConfig parse_cipher_config(const json::object& settings) {
    const json::value* crypto = settings.if_contains("crypto");
    if (!crypto || !crypto->is_object()) {
        config_fail("Crypto configuration not found");
    }

    const json::value* type = crypto->as_object().if_contains("type");
    if (!type || !type->is_string() || type->as_string().empty()) {
        config_fail("Crypto type must be a non-empty string");
    }

    CipherConfig config;
    config.type = std::string(type->as_string());

    if (const json::value* params = crypto->as_object().if_contains("params")) {
        if (!params->is_object()) {
            config_fail("Crypto params must be an object");
        }
        config.params = params->as_object();
    }
    return config;
}

json::object load_settings(const ConfigSource& source,
                           const std::string& service_name,
                           const std::string& version) {
    auto text = source.lookup(kNetworkDomain, service_name, version);
    if (!text) {
        config_fail("Configuration not found for " + service_name + ":" + version);
    }

    json::value parsed;
    try {
        parsed = InputValidator::safe_parse_json(*text);
    } catch (const std::exception& e) {
        config_fail("Invalid configuration for " + service_name + ":" + version + ": " + e.what());
    }

    if (!parsed.is_object()) {
        config_fail("Configuration for " + service_name + ":" + version + " is not an object");
    }
    return parsed.as_object();
}

EndpointConfig load_endpoint_config(const ConfigSource& source,
                                    const std::string& service_name,
                                    const std::string& version) {
    return parse_endpoint_config(load_settings(source, service_name, version));
}

CipherConfig load_cipher_config(const ConfigSource& source,
                                const std::string& service_name,
                                const std::string& version) {
    return parse_cipher_config(load_settings(source, service_name, version));
}

}
