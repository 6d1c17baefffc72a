#include "secure_channel.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace netguard {

std::string session_end_to_string(SessionEnd end) {
    switch (end) {
        case SessionEnd::PeerClosed: return "peer_closed";
        case SessionEnd::Rejected: return "rejected";
        case SessionEnd::TransportFailure: return "transport_failure";
        case SessionEnd::CryptoFailure: return "crypto_failure";
        default: return "unknown";
    }
}

SecureChannel::SecureChannel(Endpoint& endpoint, std::shared_ptr<const CipherPlugin> cipher)
    : endpoint_(endpoint)
    , guard_(endpoint.guard())
    , cipher_(std::move(cipher))
{
    if (!cipher_) {
        throw ConfigurationError("SecureChannel requires a cipher");
    }
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, "internal",
                        "Initialized SecureChannel (" + role_to_string(endpoint_.role()) + ", " +
                        cipher_->name() + ")");
}

std::unique_ptr<Connection> SecureChannel::open() {
    return endpoint_.connect();
}

SecureChannel::ReadStatus SecureChannel::read_frame(Connection& conn, Bytes& ciphertext) {
    Bytes header = conn.read_exact(kFrameHeaderSize);
    if (header.empty()) {
        return ReadStatus::Closed;
    }

    std::uint32_t length = decode_frame_length(header.data());

    // Rejections close the socket without a reply so a flooding peer cannot
    // tell them apart from a dead one.
    if (!guard_->validate_length(length) || !guard_->admit_data(conn.remote_ip(), length)) {
        MetricsRegistry::instance().increment_counter(metric::kPayloadsRejected);
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CONNECTION_REJECTED,
                            conn.remote_ip(), "Rejected frame of " + std::to_string(length) +
                            " bytes, closing connection");
        conn.close();
        return ReadStatus::Rejected;
    }

    ciphertext = conn.read_exact(length);
    if (ciphertext.empty()) {
        conn.close();
        MetricsRegistry::instance().increment_counter(metric::kTransportErrors);
        throw TransportError("Peer closed mid-frame");
    }

    MetricsRegistry::instance().increment_counter(metric::kFramesReceived);
    return ReadStatus::Frame;
}

void SecureChannel::write_frame(Connection& conn, const Bytes& ciphertext) {
    conn.write_all(encode_frame(ciphertext));
    MetricsRegistry::instance().increment_counter(metric::kFramesSent);
}

Bytes SecureChannel::send_and_receive(Connection& conn, const Bytes& plaintext) {
    Bytes ciphertext = cipher_->encrypt(plaintext);
    if (!guard_->validate_payload(ciphertext)) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::INVALID_INPUT,
                            conn.remote_ip(), "Invalid data to send");
        return {};
    }

    write_frame(conn, ciphertext);
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, conn.remote_ip(),
                        "Sent " + std::to_string(ciphertext.size()) + " encrypted bytes");

    Bytes response_ciphertext;
    switch (read_frame(conn, response_ciphertext)) {
        case ReadStatus::Closed:
            SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE,
                                conn.remote_ip(), "No response received");
            conn.close();
            return {};
        case ReadStatus::Rejected:
            return {};
        case ReadStatus::Frame:
            break;
    }

    try {
        Bytes response = cipher_->decrypt(response_ciphertext);
        SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE, conn.remote_ip(),
                            "Received " + std::to_string(response.size()) + " decrypted bytes");
        return response;
    } catch (const CryptoError&) {
        conn.close();
        throw;
    }
}

SessionEnd SecureChannel::serve(Connection& conn) {
    ScopedGauge active(metric::kActiveSessions);

    const std::string peer = conn.remote_ip();
    for (;;) {
        try {
            Bytes ciphertext;
            ReadStatus status = read_frame(conn, ciphertext);
            if (status == ReadStatus::Closed) {
                SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE,
                                    peer, "Client disconnected");
                conn.close();
                return SessionEnd::PeerClosed;
            }
            if (status == ReadStatus::Rejected) {
                return SessionEnd::Rejected;
            }

            Bytes request = cipher_->decrypt(ciphertext);
            Bytes response = handler_ ? handler_(request) : request;
            write_frame(conn, cipher_->encrypt(response));
        } catch (const CryptoError& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CRYPTO_FAILURE,
                                peer, std::string("Closing session: ") + e.what());
            conn.close();
            return SessionEnd::CryptoFailure;
        } catch (const TransportError& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::TRANSPORT_ERROR,
                                peer, std::string("Server transmission error: ") + e.what());
            conn.close();
            return SessionEnd::TransportFailure;
        } catch (...) {
            conn.close();
            throw;
        }
    }
}

}
