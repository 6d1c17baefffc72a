#include <gtest/gtest.h>
#include "cipher_plugin.hpp"
#include "endpoint.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "secure_channel.hpp"

#include <boost/beast/core/detail/base64.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>

using namespace netguard;
namespace json = boost::json;

namespace {

std::string b64(const std::string& raw) {
    std::string out(boost::beast::detail::base64::encoded_size(raw.size()), '\0');
    out.resize(boost::beast::detail::base64::encode(out.data(), raw.data(), raw.size()));
    return out;
}

EndpointConfig server_config(std::uint64_t max_bytes = 1024 * 1024, std::uint64_t timeout = 2) {
    EndpointConfig config;
    config.role = Role::Server;
    config.host = "127.0.0.1";
    config.port = 0;
    config.security.max_bytes_per_window = max_bytes;
    config.security.socket_timeout_seconds = timeout;
    return config;
}

EndpointConfig client_config(std::uint16_t port, std::uint64_t timeout = 2) {
    EndpointConfig config;
    config.role = Role::Client;
    config.host = "127.0.0.1";
    config.port = port;
    config.security.socket_timeout_seconds = timeout;
    return config;
}

std::shared_ptr<const CipherPlugin> cipher_of(const std::string& type, json::object params) {
    CipherConfig config;
    config.type = type;
    config.params = std::move(params);
    return make_cipher(config);
}

std::shared_ptr<const CipherPlugin> xor42() {
    return cipher_of("xor", json::object{{"byte", 42}});
}

std::shared_ptr<const CipherPlugin> cbc(const std::string& key) {
    return cipher_of("aes-cbc", json::object{{"key", b64(key)}, {"iv", b64("fedcba9876543210")}});
}

std::shared_ptr<const CipherPlugin> gcm(const std::string& key) {
    return cipher_of("aes-gcm", json::object{{"key", b64(key)}, {"nonce", b64("nonce-12byte")}});
}

// True when the peer hung up instead of answering. A close with unread
// request bytes may surface as a reset rather than a clean EOF.
bool hung_up(SecureChannel& channel, Connection& conn, const Bytes& request) {
    try {
        return channel.send_and_receive(conn, request).empty();
    } catch (const TransportError&) {
        return true;
    }
}

// Server endpoint + channel running one session on a background thread.
struct ServerFixture {
    Endpoint endpoint;
    SecureChannel channel;
    std::future<SessionEnd> session;

    ServerFixture(std::shared_ptr<const CipherPlugin> cipher, EndpointConfig config = server_config())
        : endpoint(std::move(config))
        , channel(endpoint, std::move(cipher))
    {}

    void serve_one() {
        session = std::async(std::launch::async, [this]() {
            auto conn = channel.open();
            return channel.serve(*conn);
        });
    }

    std::uint16_t port() const { return endpoint.local_port(); }
};

}

TEST(SecureChannelTest, XorEchoRoundTrip) {
    ServerFixture server(xor42());
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, xor42());
    auto conn = channel.open();

    Bytes response = channel.send_and_receive(*conn, to_bytes("Hello, Server!"));
    EXPECT_EQ(to_string(response), "Hello, Server!");

    conn->close();
    EXPECT_EQ(server.session.get(), SessionEnd::PeerClosed);
}

TEST(SecureChannelTest, AesCbcEchoRoundTrip) {
    const std::string key = "0123456789abcdef0123456789abcdef";
    ServerFixture server(cbc(key));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, cbc(key));
    auto conn = channel.open();

    EXPECT_EQ(to_string(channel.send_and_receive(*conn, to_bytes("block aligned!!!"))), "block aligned!!!");
    conn->close();
    EXPECT_EQ(server.session.get(), SessionEnd::PeerClosed);
}

TEST(SecureChannelTest, AesGcmSeveralExchangesOnOneConnection) {
    const std::string key = "0123456789abcdef";
    ServerFixture server(gcm(key));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, gcm(key));
    auto conn = channel.open();

    Bytes big(70000);
    for (std::size_t i = 0; i < big.size(); ++i) big[i] = static_cast<std::uint8_t>(i % 253);

    EXPECT_EQ(channel.send_and_receive(*conn, to_bytes("first")), to_bytes("first"));
    EXPECT_EQ(channel.send_and_receive(*conn, big), big);
    EXPECT_EQ(channel.send_and_receive(*conn, Bytes{}), Bytes{});

    conn->close();
    EXPECT_EQ(server.session.get(), SessionEnd::PeerClosed);
}

TEST(SecureChannelTest, HandlerTransformsResponse) {
    ServerFixture server(xor42());
    server.channel.set_handler([](const Bytes& request) {
        Bytes out = request;
        std::transform(out.begin(), out.end(), out.begin(),
                       [](std::uint8_t c) { return static_cast<std::uint8_t>(std::toupper(c)); });
        return out;
    });
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, xor42());
    auto conn = channel.open();

    EXPECT_EQ(to_string(channel.send_and_receive(*conn, to_bytes("shout"))), "SHOUT");
    conn->close();
    server.session.get();
}

TEST(SecureChannelTest, WireFormatIsLengthPrefixedCiphertext) {
    Endpoint server(server_config());
    Endpoint client(client_config(server.local_port()));
    SecureChannel channel(client, xor42());

    auto peer_future = std::async(std::launch::async, [&server]() { return server.accept(); });
    auto conn = channel.open();
    auto peer = peer_future.get();

    // Answer with a raw frame of XOR'd "ok".
    auto reply = std::async(std::launch::async, [&peer]() {
        Bytes header = peer->read_exact(kFrameHeaderSize);
        std::uint32_t length = decode_frame_length(header.data());
        Bytes body = peer->read_exact(length);
        peer->write_all(encode_frame(Bytes{'o' ^ 42, 'k' ^ 42}));
        return std::make_pair(header, body);
    });

    Bytes response = channel.send_and_receive(*conn, to_bytes("AB"));
    auto [header, body] = reply.get();

    EXPECT_EQ(header, (Bytes{0, 0, 0, 2}));
    EXPECT_EQ(body, (Bytes{'A' ^ 42, 'B' ^ 42}));
    EXPECT_EQ(to_string(response), "ok");
}

TEST(SecureChannelTest, PeerClosingWithoutReplyGivesEmptyResponse) {
    Endpoint server(server_config());
    Endpoint client(client_config(server.local_port()));
    SecureChannel channel(client, xor42());

    auto peer_future = std::async(std::launch::async, [&server]() { return server.accept(); });
    auto conn = channel.open();
    auto peer = peer_future.get();

    auto drop = std::async(std::launch::async, [&peer]() {
        Bytes header = peer->read_exact(kFrameHeaderSize);
        peer->read_exact(decode_frame_length(header.data()));
        peer->close();
    });

    EXPECT_TRUE(channel.send_and_receive(*conn, to_bytes("anyone there?")).empty());
    drop.get();
}

TEST(SecureChannelTest, OversizedFrameClosesSilently) {
    ServerFixture server(xor42(), server_config(64));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, xor42());
    auto conn = channel.open();

    EXPECT_TRUE(hung_up(channel, *conn, Bytes(100, 'x')));
    EXPECT_EQ(server.session.get(), SessionEnd::Rejected);
}

TEST(SecureChannelTest, DataRateCeilingAcrossFrames) {
    ServerFixture server(xor42(), server_config(100));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, xor42());
    auto conn = channel.open();

    EXPECT_EQ(channel.send_and_receive(*conn, Bytes(60, 'a')), Bytes(60, 'a'));
    EXPECT_TRUE(hung_up(channel, *conn, Bytes(60, 'b')));
    EXPECT_EQ(server.session.get(), SessionEnd::Rejected);
}

TEST(SecureChannelTest, EmptyPlaintextUnderXorIsNotSent) {
    Endpoint client(client_config(9));
    SecureChannel channel(client, xor42());
    Connection unconnected;
    EXPECT_TRUE(channel.send_and_receive(unconnected, Bytes{}).empty());
}

TEST(SecureChannelTest, MismatchedKeysEndServerSession) {
    ServerFixture server(gcm("0123456789abcdef"));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    SecureChannel channel(client, gcm("fedcba9876543210"));
    auto conn = channel.open();

    EXPECT_TRUE(hung_up(channel, *conn, to_bytes("secret")));
    EXPECT_EQ(server.session.get(), SessionEnd::CryptoFailure);
}

TEST(SecureChannelTest, UndecryptableResponseRaisesCryptoError) {
    Endpoint server(server_config());
    Endpoint client(client_config(server.local_port()));
    SecureChannel channel(client, gcm("0123456789abcdef"));

    auto peer_future = std::async(std::launch::async, [&server]() { return server.accept(); });
    auto conn = channel.open();
    auto peer = peer_future.get();

    auto garbage = std::async(std::launch::async, [&peer]() {
        Bytes header = peer->read_exact(kFrameHeaderSize);
        peer->read_exact(decode_frame_length(header.data()));
        peer->write_all(encode_frame(Bytes(20, 0x55)));
    });

    EXPECT_THROW(channel.send_and_receive(*conn, to_bytes("hi")), CryptoError);
    EXPECT_FALSE(conn->is_open());
    garbage.get();
}

TEST(SecureChannelTest, StalledHeaderEndsSessionOnTimeout) {
    ServerFixture server(xor42(), server_config(1024 * 1024, 1));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    auto conn = client.connect();
    conn->write_all(Bytes{0, 0});

    EXPECT_EQ(server.session.get(), SessionEnd::TransportFailure);
}

TEST(SecureChannelTest, SilentServerTimesOutClient) {
    Endpoint server(server_config());
    Endpoint client(client_config(server.local_port(), 1));
    SecureChannel channel(client, xor42());

    auto peer_future = std::async(std::launch::async, [&server]() { return server.accept(); });
    auto conn = channel.open();
    auto peer = peer_future.get();

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(channel.send_and_receive(*conn, to_bytes("hello?")), TransportError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(900));
    EXPECT_FALSE(conn->is_open());
}

TEST(SecureChannelTest, TruncatedBodyEndsSession) {
    ServerFixture server(xor42(), server_config(1024 * 1024, 1));
    server.serve_one();

    Endpoint client(client_config(server.port()));
    auto conn = client.connect();
    conn->write_all(Bytes{0, 0, 0, 10, 'a', 'b', 'c'});
    conn->close();

    EXPECT_EQ(server.session.get(), SessionEnd::TransportFailure);
}

TEST(SecureChannelTest, RequiresCipher) {
    Endpoint client(client_config(9));
    EXPECT_THROW(SecureChannel(client, nullptr), ConfigurationError);
}

TEST(SecureChannelTest, SessionEndNames) {
    EXPECT_EQ(session_end_to_string(SessionEnd::PeerClosed), "peer_closed");
    EXPECT_EQ(session_end_to_string(SessionEnd::CryptoFailure), "crypto_failure");
}
