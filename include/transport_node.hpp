#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "bytes.hpp"
#include "config_source.hpp"
#include "endpoint.hpp"
#include "secure_channel.hpp"

namespace netguard {


// Runs both sides of one deployment: a persistent server listener with one
// worker thread per admitted connection, and a client that opens a fresh
// connection per exchange.
class TransportNode {
public:
    TransportNode(const ConfigSource& source,
                  std::string server_service = "server",
                  std::string client_service = "client",
                  std::string version = "1.0");
    ~TransportNode();

    TransportNode(const TransportNode&) = delete;
    TransportNode& operator=(const TransportNode&) = delete;

    // Binds the server and starts the accept loop on its own thread.
    // Returns false (and logs) if the server side cannot be initialized.
    // Also restarts a node whose accept loop died: the old loop and its
    // workers are joined before the server side is rebuilt.
    bool start_server();

    // Stops accepting and joins the acceptor and every worker. The acceptor
    // notices within one socket timeout.
    void stop();

    bool is_running() const { return running_.load(); }

    // Port the server is bound to, 0 before start_server().
    std::uint16_t server_port() const;

    // Handler applied by server workers; set before start_server().
    void set_handler(SecureChannel::Handler handler) { handler_ = std::move(handler); }

    // Admission capability for the server endpoint; set before start_server().
    // Null (the default) builds a SecurityGuard from the configured policy.
    void set_admission_control(std::shared_ptr<AdmissionControl> guard) { server_guard_ = std::move(guard); }

    /**
     * One client exchange over a new connection.
     * @return The decrypted response (empty = no reply), or nullopt on any error.
     */
    std::optional<Bytes> send(const Bytes& data);

    std::size_t active_workers();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void reap_workers(bool all);
    bool ensure_client();

    const ConfigSource& source_;
    std::string server_service_;
    std::string client_service_;
    std::string version_;
    SecureChannel::Handler handler_;
    std::shared_ptr<AdmissionControl> server_guard_;

    std::unique_ptr<Endpoint> server_endpoint_;
    std::unique_ptr<SecureChannel> server_channel_;
    std::thread acceptor_thread_;
    std::list<Worker> workers_;
    std::mutex workers_mutex_;
    std::atomic<bool> running_{false};

    std::unique_ptr<Endpoint> client_endpoint_;
    std::unique_ptr<SecureChannel> client_channel_;
    std::mutex client_mutex_;
};

}
