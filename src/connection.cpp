#include "connection.hpp"
#include "errors.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace netguard {

Connection::Connection()
    : stream_(ioc_)
{}

Connection::~Connection() {
    close();
}

// Drives the private io_context until the single outstanding operation completes.
void Connection::run_pending() {
    ioc_.restart();
    ioc_.run();
}

void Connection::fail(const std::string& op, const beast::error_code& ec) {
    close();
    MetricsRegistry::instance().increment_counter(metric::kTransportErrors);
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::TRANSPORT_ERROR,
                        remote_ip_, op + " failed: " + ec.message());
    throw TransportError(op + " failed: " + ec.message());
}

void Connection::capture_remote() {
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        remote_ip_ = ep.address().to_string();
        remote_port_ = ep.port();
    } else {
        remote_ip_ = "unknown";
        remote_port_ = 0;
    }
}

void Connection::connect(const tcp::resolver::results_type& endpoints) {
    beast::error_code result;
    stream_.expires_after(timeout_);
    stream_.async_connect(endpoints, [&result](beast::error_code ec, const tcp::endpoint&) {
        result = ec;
    });
    run_pending();

    if (result) {
        fail("connect", result);
    }
    stream_.expires_never();
    capture_remote();
}

void Connection::on_accepted() {
    capture_remote();
}

Bytes Connection::read_exact(std::size_t n) {
    Bytes buffer(n);
    if (n == 0) return buffer;

    beast::error_code result;
    std::size_t transferred = 0;
    stream_.expires_after(timeout_);
    net::async_read(stream_, net::buffer(buffer),
                    [&result, &transferred](beast::error_code ec, std::size_t bytes) {
                        result = ec;
                        transferred = bytes;
                    });
    run_pending();
    stream_.expires_never();

    if (result == net::error::eof && transferred == 0) {
        return {};
    }
    if (result) {
        fail("read", result);
    }
    return buffer;
}

Bytes Connection::read_some(std::size_t max) {
    Bytes buffer(max);
    if (max == 0) return buffer;

    beast::error_code result;
    std::size_t transferred = 0;
    stream_.expires_after(timeout_);
    stream_.async_read_some(net::buffer(buffer),
                            [&result, &transferred](beast::error_code ec, std::size_t bytes) {
                                result = ec;
                                transferred = bytes;
                            });
    run_pending();
    stream_.expires_never();

    if (result == net::error::eof) {
        return {};
    }
    if (result) {
        fail("read", result);
    }
    buffer.resize(transferred);
    return buffer;
}

void Connection::write_all(const Bytes& data) {
    if (data.empty()) return;

    beast::error_code result;
    stream_.expires_after(timeout_);
    net::async_write(stream_, net::buffer(data),
                     [&result](beast::error_code ec, std::size_t) {
                         result = ec;
                     });
    run_pending();
    stream_.expires_never();

    if (result) {
        fail("write", result);
    }
}

void Connection::close() {
    if (!stream_.socket().is_open()) return;

    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.socket().close(ec);
}

bool Connection::is_open() const {
    return stream_.socket().is_open();
}

}
