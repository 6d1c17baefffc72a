#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <csignal>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>

#include "config_source.hpp"
#include "errors.hpp"
#include "security_logger.hpp"
#include "transport_config.hpp"
#include "transport_node.hpp"

namespace net = boost::asio;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --config <file> --service <name> [options]\n"
              << "Options:\n"
              << "  --config, -c <file>     Delimited config file (service_type,service_name,version,settings)\n"
              << "  --service, -s <name>    Service name under the 'network' domain\n"
              << "  --version, -v <ver>     Configuration version (default 1.0)\n"
              << "  --message, -m <text>    Client: message to send (default: one per stdin line)\n"
              << "  --log-level, -l <lvl>   debug|info|warn|error|crit\n"
              << "  --help, -h              Show this help\n";
}

int run_server(netguard::InMemoryConfigSource& source, const std::string& service, const std::string& version) {
    using netguard::SecurityLogger;

    netguard::TransportNode node(source, service, service, version);
    if (!node.start_server()) {
        return 1;
    }
    std::cout << "[*] Serving " << service << ":" << version << " on port " << node.server_port() << "\n";

    // Captured SIGINT and SIGTERM to perform a clean shutdown
    net::io_context ioc;
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&node](const boost::system::error_code&, int) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Initiating graceful shutdown");
        node.stop();
    });

    // Leave the event loop if the accept loop died on its own.
    net::steady_timer watchdog(ioc, std::chrono::seconds(1));
    std::function<void(const boost::system::error_code&)> on_watchdog;
    on_watchdog = [&](const boost::system::error_code& ec) {
        if (ec) return;
        if (!node.is_running()) {
            signals.cancel();
            return;
        }
        watchdog.expires_after(std::chrono::seconds(1));
        watchdog.async_wait(on_watchdog);
    };
    watchdog.async_wait(on_watchdog);

    ioc.run();
    watchdog.cancel();
    node.stop();
    return 0;
}

int run_client(netguard::InMemoryConfigSource& source, const std::string& service, const std::string& version,
               const std::string& message, bool have_message) {
    netguard::TransportNode node(source, service, service, version);

    auto exchange = [&node](const std::string& text) {
        auto response = node.send(netguard::to_bytes(text));
        if (!response) {
            std::cerr << "[!] Exchange failed\n";
            return false;
        }
        if (response->empty()) {
            std::cout << "[*] No response\n";
        } else {
            std::cout << netguard::to_string(*response) << "\n";
        }
        return true;
    };

    if (have_message) {
        return exchange(message) ? 0 : 1;
    }

    int status = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        if (!exchange(line)) status = 1;
    }
    return status;
}

}

int main(int argc, char* argv[]) {
    using netguard::SecurityLogger;
    try {
        SecurityLogger::configure_from_env();

        std::string config_path;
        std::string service;
        std::string version = "1.0";
        std::string message;
        bool have_message = false;

        // --- Environment Variable Defaults ---
        if (const char* e = std::getenv("NETGUARD_CONFIG")) config_path = e;
        if (const char* e = std::getenv("NETGUARD_SERVICE")) service = e;
        if (const char* e = std::getenv("NETGUARD_VERSION")) version = e;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next_value = [&](const std::string& name) -> std::string {
                if (i + 1 >= argc) {
                    throw netguard::ConfigurationError("Missing value for " + name);
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" || arg == "-c") {
                config_path = next_value(arg);
            } else if (arg == "--service" || arg == "-s") {
                service = next_value(arg);
            } else if (arg == "--version" || arg == "-v") {
                version = next_value(arg);
            } else if (arg == "--message" || arg == "-m") {
                message = next_value(arg);
                have_message = true;
            } else if (arg == "--log-level" || arg == "-l") {
                SecurityLogger::Level level;
                std::string value = next_value(arg);
                if (!SecurityLogger::parse_level(value, level)) {
                    throw netguard::ConfigurationError("Unknown log level: " + value);
                }
                SecurityLogger::set_min_level(level);
            } else {
                std::cerr << "[!] Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (config_path.empty() || service.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        netguard::InMemoryConfigSource source;
        if (!source.load_delimited_file(config_path)) {
            std::cerr << "[!] Could not load configuration from " << config_path << "\n";
            return 1;
        }

        auto endpoint_config = netguard::load_endpoint_config(source, service, version);
        if (endpoint_config.role == netguard::Role::Server) {
            return run_server(source, service, version);
        }
        return run_client(source, service, version, message, have_message);

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
