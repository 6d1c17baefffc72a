#pragma once

#include <functional>
#include <memory>
#include <string>

#include "bytes.hpp"
#include "cipher_plugin.hpp"
#include "connection.hpp"
#include "endpoint.hpp"
#include "security_guard.hpp"

namespace netguard {

// Why a server session ended. Reported to the local caller only; the peer
// never learns which path was taken.
enum class SessionEnd {
    PeerClosed,
    Rejected,
    TransportFailure,
    CryptoFailure
};

std::string session_end_to_string(SessionEnd end);


// Length-prefixed encrypted framing over connections produced by an Endpoint.
// Holds no per-connection state, so one channel may serve many workers.
class SecureChannel {
public:
    // Maps a decrypted request to the plaintext response. Echo by default.
    using Handler = std::function<Bytes(const Bytes& request)>;

    SecureChannel(Endpoint& endpoint, std::shared_ptr<const CipherPlugin> cipher);

    // Opens a connection through the endpoint (accept or connect by role).
    std::unique_ptr<Connection> open();

    /**
     * Client exchange: encrypts and frames `plaintext`, then waits for one
     * framed response.
     * @return The decrypted response; empty if the peer closed without
     *         replying or the exchange was silently rejected.
     * @throws TransportError on read/write failure.
     * @throws CryptoError if the response does not decrypt.
     */
    Bytes send_and_receive(Connection& conn, const Bytes& plaintext);

    /**
     * Server loop: reads frames, decrypts, applies the handler and answers
     * with one frame per request until the peer closes or anything fails.
     * Always closes the connection before returning.
     */
    SessionEnd serve(Connection& conn);

    void set_handler(Handler handler) { handler_ = std::move(handler); }

    const CipherPlugin& cipher() const { return *cipher_; }

private:
    enum class ReadStatus {
        Frame,
        Closed,    // peer closed before a header byte
        Rejected   // failed validation or rate check; connection already closed
    };

    // Reads one inbound frame after the length and rate checks.
    ReadStatus read_frame(Connection& conn, Bytes& ciphertext);
    void write_frame(Connection& conn, const Bytes& ciphertext);

    Endpoint& endpoint_;
    std::shared_ptr<AdmissionControl> guard_;
    std::shared_ptr<const CipherPlugin> cipher_;
    Handler handler_;
};

}
