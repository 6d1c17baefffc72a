#include "endpoint.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <boost/asio/steady_timer.hpp>

namespace netguard {

std::string state_to_string(EndpointState state) {
    switch (state) {
        case EndpointState::Unbound: return "unbound";
        case EndpointState::Listening: return "listening";
        case EndpointState::Connecting: return "connecting";
        case EndpointState::Connected: return "connected";
        case EndpointState::Failed: return "failed";
        default: return "unknown";
    }
}

Endpoint::Endpoint(const ConfigSource& source, const std::string& service_name,
                   const std::string& version, std::shared_ptr<AdmissionControl> guard)
    : Endpoint(load_endpoint_config(source, service_name, version), std::move(guard))
{
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, "internal",
                        "Initialized endpoint for " + service_name + ":" + version +
                        " (role: " + role_to_string(config_.role) + ")");
}

Endpoint::Endpoint(EndpointConfig config, std::shared_ptr<AdmissionControl> guard)
    : config_(std::move(config))
    , guard_(std::move(guard))
    , acceptor_(ioc_)
{
    if (!guard_) {
        guard_ = std::make_shared<SecurityGuard>(config_.security);
    }

    resolve();

    if (config_.role == Role::Server) {
        bind_endpoint_ = resolved_.begin()->endpoint();
        // "localhost" may resolve to ::1 first; clients commonly dial 127.0.0.1.
        for (const auto& entry : resolved_) {
            if (entry.endpoint().address().is_v4()) {
                bind_endpoint_ = entry.endpoint();
                break;
            }
        }
        open_listener();
    }
}

Endpoint::~Endpoint() {
    close();
}

void Endpoint::resolve() {
    boost::system::error_code ec;
    tcp::resolver resolver(ioc_);
    resolved_ = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec || resolved_.empty()) {
        std::string reason = ec ? ec.message() : "no addresses";
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR, "internal",
                            "Cannot resolve " + config_.host + ":" + std::to_string(config_.port) + ": " + reason);
        throw ConfigurationError("Cannot resolve host '" + config_.host + "': " + reason);
    }
}

void Endpoint::fail_transport(const std::string& what, const boost::system::error_code& ec) {
    state_ = EndpointState::Failed;
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    MetricsRegistry::instance().increment_counter(metric::kTransportErrors);
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::TRANSPORT_ERROR, "internal",
                        what + ": " + ec.message());
    throw TransportError(what + ": " + ec.message());
}

void Endpoint::open_listener() {
    boost::system::error_code ec;

    acceptor_.open(bind_endpoint_.protocol(), ec);
    if (ec) {
        fail_transport("Failed to open acceptor", ec);
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        fail_transport("Failed to set SO_REUSEADDR", ec);
    }

    acceptor_.bind(bind_endpoint_, ec);
    if (ec) {
        fail_transport("Failed to bind", ec);
    }

    acceptor_.listen(config_.backlog, ec);
    if (ec) {
        fail_transport("Failed to listen", ec);
    }

    auto local = acceptor_.local_endpoint(ec);
    if (ec) {
        fail_transport("Failed to read bound address", ec);
    }
    bound_port_ = local.port();
    // A re-opened single-shot listener keeps the port it got the first time.
    bind_endpoint_.port(bound_port_);

    state_ = EndpointState::Listening;
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, "internal",
                        "Server listening on " + config_.host + ":" + std::to_string(bound_port_));
}

void Endpoint::ensure_usable() const {
    if (state_ == EndpointState::Failed) {
        throw TransportError("Endpoint is in failed state");
    }
}

void Endpoint::require_server(const char* op) const {
    if (config_.role != Role::Server) {
        throw ConfigurationError(std::string(op) + " requires the server role");
    }
}

std::unique_ptr<Connection> Endpoint::try_accept() {
    require_server("accept");
    ensure_usable();
    if (!acceptor_.is_open()) {
        open_listener();
    }

    auto conn = std::make_unique<Connection>();
    boost::system::error_code accept_ec = net::error::would_block;
    bool timed_out = false;

    net::steady_timer timer(ioc_);
    timer.expires_after(guard_->socket_timeout());

    acceptor_.async_accept(conn->socket(), [&](boost::system::error_code ec) {
        accept_ec = ec;
        timer.cancel();
    });
    timer.async_wait([&](boost::system::error_code ec) {
        if (!ec) {
            timed_out = true;
            boost::system::error_code ignored;
            acceptor_.cancel(ignored);
        }
    });

    ioc_.restart();
    ioc_.run();

    if (accept_ec) {
        if (timed_out) {
            SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "Accept timeout, continuing to listen");
            return nullptr;
        }
        fail_transport("Accept failed", accept_ec);
    }

    conn->on_accepted();
    if (!guard_->admit_connection(conn->remote_ip())) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                            conn->remote_ip(), "Rejected connection due to rate limiting");
        conn->close();
        return nullptr;
    }

    guard_->apply_timeout(*conn);
    MetricsRegistry::instance().increment_counter(metric::kConnectionsAccepted);
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::CONNECTION_ACCEPTED,
                        conn->remote_ip(), "Accepted connection");
    return conn;
}

std::unique_ptr<Connection> Endpoint::accept() {
    for (;;) {
        if (auto conn = try_accept()) {
            return conn;
        }
    }
}

std::unique_ptr<Connection> Endpoint::connect_client() {
    ensure_usable();
    state_ = EndpointState::Connecting;

    auto conn = std::make_unique<Connection>();
    guard_->apply_timeout(*conn);
    try {
        conn->connect(resolved_);
    } catch (const TransportError&) {
        state_ = EndpointState::Failed;
        throw;
    }

    state_ = EndpointState::Connected;
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, conn->remote_ip(),
                        "Connected to " + config_.host + ":" + std::to_string(config_.port));
    return conn;
}

std::unique_ptr<Connection> Endpoint::connect() {
    if (config_.role == Role::Client) {
        return connect_client();
    }

    auto conn = accept();
    close();
    state_ = EndpointState::Connected;
    return conn;
}

std::optional<Bytes> Endpoint::receive_stream(Connection& conn, std::size_t max_bytes) {
    Bytes data = conn.read_some(max_bytes);
    if (data.empty()) {
        return std::nullopt;
    }

    if (!guard_->admit_data(conn.remote_ip(), data.size())) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                            conn.remote_ip(), "Data rate exceeded on stream read");
        MetricsRegistry::instance().increment_counter(metric::kPayloadsRejected);
        conn.close();
        return std::nullopt;
    }
    if (!guard_->validate_payload(data)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            conn.remote_ip(), "Invalid stream payload of " + std::to_string(data.size()) + " bytes");
        MetricsRegistry::instance().increment_counter(metric::kPayloadsRejected);
        conn.close();
        return std::nullopt;
    }
    return data;
}

bool Endpoint::send_stream(Connection& conn, const Bytes& data) {
    if (!guard_->validate_payload(data)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            conn.remote_ip(), "Refusing to send invalid payload of " +
                            std::to_string(data.size()) + " bytes");
        MetricsRegistry::instance().increment_counter(metric::kPayloadsRejected);
        return false;
    }
    if (!guard_->admit_data(conn.remote_ip(), data.size())) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT,
                            conn.remote_ip(), "Data rate exceeded on stream write");
        MetricsRegistry::instance().increment_counter(metric::kPayloadsRejected);
        return false;
    }
    conn.write_all(data);
    return true;
}

void Endpoint::close() {
    if (!acceptor_.is_open()) return;

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (state_ == EndpointState::Listening) {
        state_ = EndpointState::Unbound;
    }
}

}
