#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <cstdint>
#include <string>

#include "bytes.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace netguard {


// One TCP connection exclusively owned by one worker.
// Every blocking operation is bounded by the configured timeout; a timeout,
// reset or short read closes the socket and raises TransportError.
class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void set_timeout(std::chrono::seconds timeout) { timeout_ = timeout; }
    std::chrono::seconds timeout() const { return timeout_; }

    // Client side: connects to the first reachable endpoint.
    void connect(const tcp::resolver::results_type& endpoints);

    // Server side: the acceptor fills this socket, then calls on_accepted().
    tcp::socket& socket() { return stream_.socket(); }
    void on_accepted();

    /**
     * Reads exactly n bytes.
     * @return n bytes, or an empty buffer if the peer closed before the first byte.
     */
    Bytes read_exact(std::size_t n);

    // Reads whatever is available, at most max bytes; empty when the peer closed.
    Bytes read_some(std::size_t max);

    void write_all(const Bytes& data);

    void close();
    bool is_open() const;

    const std::string& remote_ip() const { return remote_ip_; }
    std::uint16_t remote_port() const { return remote_port_; }

private:
    void run_pending();
    [[noreturn]] void fail(const std::string& op, const beast::error_code& ec);
    void capture_remote();

    net::io_context ioc_{1};
    beast::tcp_stream stream_;
    std::chrono::seconds timeout_{10};
    std::string remote_ip_ = "unknown";
    std::uint16_t remote_port_ = 0;
};

}
