#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "bytes.hpp"
#include "config_source.hpp"
#include "transport_config.hpp"

namespace netguard {


// Symmetric cipher applied to every frame of a channel. Implementations are
// immutable after construction and safe to share between connection workers.
class CipherPlugin {
public:
    virtual ~CipherPlugin() = default;

    virtual Bytes encrypt(const Bytes& plaintext) const = 0;

    // Throws CryptoError on padding or authentication failure.
    virtual Bytes decrypt(const Bytes& ciphertext) const = 0;

    virtual std::string name() const = 0;
};

// Single-byte XOR. encrypt and decrypt are the same involution.
class XorCipher : public CipherPlugin {
public:
    explicit XorCipher(std::uint8_t key);

    // params: {"byte": 0..255}. Throws ConfigurationError.
    static std::unique_ptr<CipherPlugin> from_params(const boost::json::object& params);

    Bytes encrypt(const Bytes& plaintext) const override;
    Bytes decrypt(const Bytes& ciphertext) const override;
    std::string name() const override { return "xor"; }

private:
    Bytes apply(const Bytes& data) const;

    std::uint8_t key_;
};

// AES-CBC with PKCS#7 padding to the 16-byte block boundary and a fixed IV.
class AesCbcCipher : public CipherPlugin {
public:
    static constexpr std::size_t block_size = 16;

    // key: 16/24/32 bytes, iv: 16 bytes. Throws ConfigurationError.
    AesCbcCipher(Bytes key, Bytes iv);

    // params: {"key": base64, "iv": base64}. Throws ConfigurationError.
    static std::unique_ptr<CipherPlugin> from_params(const boost::json::object& params);

    Bytes encrypt(const Bytes& plaintext) const override;
    Bytes decrypt(const Bytes& ciphertext) const override;
    std::string name() const override { return "aes-cbc"; }

private:
    Bytes key_;
    Bytes iv_;
};

// AES-GCM producing ciphertext || 16-byte tag, with a fixed 12-byte nonce.
class AesGcmCipher : public CipherPlugin {
public:
    static constexpr std::size_t nonce_size = 12;
    static constexpr std::size_t tag_size = 16;

    // key: 16/24/32 bytes, nonce: 12 bytes. Throws ConfigurationError.
    AesGcmCipher(Bytes key, Bytes nonce);

    // params: {"key": base64, "nonce": base64}. Throws ConfigurationError.
    static std::unique_ptr<CipherPlugin> from_params(const boost::json::object& params);

    Bytes encrypt(const Bytes& plaintext) const override;
    Bytes decrypt(const Bytes& ciphertext) const override;
    std::string name() const override { return "aes-gcm"; }

private:
    Bytes key_;
    Bytes nonce_;
};


/**
 * Closed set of cipher variants selected by a configuration tag.
 * The built-in "xor", "aes-cbc" and "aes-gcm" factories are the whole set.
 */
class CipherRegistry {
public:
    using Factory = std::function<std::unique_ptr<CipherPlugin>(const boost::json::object& params)>;

    static CipherRegistry& instance();


    // Throws ConfigurationError for an unknown type or invalid params.
    std::unique_ptr<CipherPlugin> create(const CipherConfig& config) const;

private:
    CipherRegistry();

    std::map<std::string, Factory> factories_;
    mutable std::mutex mutex_;
};

std::shared_ptr<const CipherPlugin> make_cipher(const CipherConfig& config);

// Reads the "crypto" section of (network, service_name, version).
std::shared_ptr<const CipherPlugin> load_cipher(const ConfigSource& source,
                                                const std::string& service_name,
                                                const std::string& version);

}
