#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "config_source.hpp"
#include "connection.hpp"
#include "security_guard.hpp"
#include "transport_config.hpp"

namespace netguard {

enum class EndpointState {
    Unbound,
    Listening,
    Connecting,
    Connected,
    Failed
};

std::string state_to_string(EndpointState state);


// Role-based socket factory.
// Server: binds and listens on construction; connect() accepts exactly one
// admitted peer and closes the listening socket. Client: connect() opens a
// new outbound connection bounded by the socket timeout.
// A socket failure moves the endpoint to Failed for good; retrying is the
// caller's business (build a new Endpoint).
class Endpoint {
public:
    /**
     * Resolves role, address and security policy for (network, service_name, version).
     * @param guard Admission capability; a SecurityGuard built from the
     *              configured policy is used when null.
     * @throws ConfigurationError on missing/invalid settings or an unresolvable host.
     * @throws TransportError if a server cannot bind or listen.
     */
    Endpoint(const ConfigSource& source, const std::string& service_name,
             const std::string& version = "1.0",
             std::shared_ptr<AdmissionControl> guard = nullptr);

    explicit Endpoint(EndpointConfig config, std::shared_ptr<AdmissionControl> guard = nullptr);

    ~Endpoint();

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    // Single-shot: a server accepts one admitted peer then closes its listener
    // (re-opened by the next call); a client connects.
    std::unique_ptr<Connection> connect();

    // Persistent listener, server only: blocks until a peer is admitted and
    // leaves the listening socket open.
    std::unique_ptr<Connection> accept();

    // One accept attempt bounded by the socket timeout, server only.
    // Returns null when the wait timed out or the peer was rejected.
    std::unique_ptr<Connection> try_accept();

    /**
     * Unframed inbound read: up to max_bytes from conn, charged against the
     * peer's byte window and checked against the payload ceiling.
     * @return The bytes read, or nullopt when the peer closed or the data was
     *         refused; a refusal also closes conn.
     * @throws TransportError on timeout or socket failure.
     */
    std::optional<Bytes> receive_stream(Connection& conn, std::size_t max_bytes);

    // Unframed outbound write. Returns false, without touching the socket,
    // when the payload is invalid or the peer's byte window is exhausted.
    bool send_stream(Connection& conn, const Bytes& data);

    // Closes the listening socket, if any.
    void close();

    Role role() const { return config_.role; }
    const EndpointConfig& config() const { return config_; }
    EndpointState state() const { return state_.load(); }
    std::uint16_t local_port() const { return bound_port_; }
    std::shared_ptr<AdmissionControl> guard() const { return guard_; }

private:
    void resolve();
    void open_listener();
    void ensure_usable() const;
    void require_server(const char* op) const;
    [[noreturn]] void fail_transport(const std::string& what, const boost::system::error_code& ec);
    std::unique_ptr<Connection> connect_client();

    EndpointConfig config_;
    std::shared_ptr<AdmissionControl> guard_;

    net::io_context ioc_{1};
    tcp::acceptor acceptor_;
    tcp::resolver::results_type resolved_;
    tcp::endpoint bind_endpoint_;
    std::uint16_t bound_port_ = 0;

    std::atomic<EndpointState> state_{EndpointState::Unbound};
};

}
