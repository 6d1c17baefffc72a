#include "transport_node.hpp"
#include "errors.hpp"
#include "security_logger.hpp"

#include <iterator>

namespace netguard {

TransportNode::TransportNode(const ConfigSource& source,
                             std::string server_service,
                             std::string client_service,
                             std::string version)
    : source_(source)
    , server_service_(std::move(server_service))
    , client_service_(std::move(client_service))
    , version_(std::move(version))
{}

TransportNode::~TransportNode() {
    stop();
}

bool TransportNode::start_server() {
    if (running_) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Network server already running");
        return true;
    }

    // A loop that stopped on its own leaves its thread and workers behind.
    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }
    reap_workers(true);

    try {
        auto cipher = load_cipher(source_, server_service_, version_);
        auto endpoint = std::make_unique<Endpoint>(source_, server_service_, version_, server_guard_);
        if (endpoint->role() != Role::Server) {
            throw ConfigurationError("Service '" + server_service_ + "' is not configured as a server");
        }
        auto channel = std::make_unique<SecureChannel>(*endpoint, std::move(cipher));
        if (handler_) {
            channel->set_handler(handler_);
        }
        server_endpoint_ = std::move(endpoint);
        server_channel_ = std::move(channel);
    } catch (const Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE, "internal",
                            std::string("Failed to start network server: ") + e.what());
        return false;
    }

    running_ = true;
    acceptor_thread_ = std::thread(&TransportNode::accept_loop, this);
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                        "Started network server " + server_service_ + ":" + version_ +
                        " on port " + std::to_string(server_endpoint_->local_port()));
    return true;
}

void TransportNode::accept_loop() {
    while (running_) {
        std::unique_ptr<Connection> conn;
        try {
            conn = server_endpoint_->try_accept();
        } catch (const TransportError& e) {
            SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::TRANSPORT_ERROR,
                                "internal", std::string("Accept loop terminated: ") + e.what());
            running_ = false;
            break;
        }

        reap_workers(false);
        if (!conn) continue;

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([this, done, c = std::move(conn)]() {
            const std::string peer = c->remote_ip();
            try {
                SessionEnd end = server_channel_->serve(*c);
                SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, peer,
                                    "Session ended: " + session_end_to_string(end));
            } catch (const std::exception& e) {
                SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE, peer,
                                    std::string("Session handler failed: ") + e.what());
            }
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::move(worker), std::move(done)});
    }
    server_endpoint_->close();
}

// Joins finished workers, or every worker when `all` is set.
void TransportNode::reap_workers(bool all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end(); ) {
            if (all || it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

void TransportNode::stop() {
    bool was_running = running_.exchange(false);
    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }
    reap_workers(true);
    if (was_running) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Network server stopped");
    }
}

std::uint16_t TransportNode::server_port() const {
    return server_endpoint_ ? server_endpoint_->local_port() : 0;
}

std::size_t TransportNode::active_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    std::size_t count = 0;
    for (const auto& w : workers_) {
        if (!w.done->load()) ++count;
    }
    return count;
}

// Builds (or rebuilds after a failure) the client side. Caller holds client_mutex_.
bool TransportNode::ensure_client() {
    if (client_endpoint_ && client_endpoint_->state() != EndpointState::Failed) {
        return true;
    }
    try {
        auto cipher = load_cipher(source_, client_service_, version_);
        auto endpoint = std::make_unique<Endpoint>(source_, client_service_, version_);
        if (endpoint->role() != Role::Client) {
            throw ConfigurationError("Service '" + client_service_ + "' is not configured as a client");
        }
        client_channel_ = std::make_unique<SecureChannel>(*endpoint, std::move(cipher));
        client_endpoint_ = std::move(endpoint);
        return true;
    } catch (const Error& e) {
        client_channel_.reset();
        client_endpoint_.reset();
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE, "internal",
                            std::string("Network client components not initialized: ") + e.what());
        return false;
    }
}

std::optional<Bytes> TransportNode::send(const Bytes& data) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    if (!ensure_client()) {
        return std::nullopt;
    }

    try {
        auto conn = client_channel_->open();
        Bytes response = client_channel_->send_and_receive(*conn, data);
        conn->close();
        SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Sent " + std::to_string(data.size()) + " bytes, received " +
                            std::to_string(response.size()) + " bytes");
        return response;
    } catch (const Error& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::TRANSPORT_ERROR, "internal",
                            std::string("Failed to send network data: ") + e.what());
        return std::nullopt;
    }
}

}
