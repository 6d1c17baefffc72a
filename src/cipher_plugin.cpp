#include "cipher_plugin.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <openssl/evp.h>
#include <limits>

namespace json = boost::json;

namespace netguard {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtx new_ctx() {
    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

[[noreturn]] void crypto_fail(const std::string& message) {
    MetricsRegistry::instance().increment_counter(metric::kCryptoFailures);
    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::CRYPTO_FAILURE,
                        "internal", message);
    throw CryptoError(message);
}

// EVP takes int lengths.
int evp_length(std::size_t size) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        crypto_fail("Buffer of " + std::to_string(size) + " bytes exceeds the cipher input limit");
    }
    return static_cast<int>(size);
}

[[noreturn]] void params_fail(const std::string& message) {
    SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::CONFIG_ERROR,
                        "internal", message);
    throw ConfigurationError(message);
}

bool valid_aes_key_size(std::size_t n) {
    return n == 16 || n == 24 || n == 32;
}

const EVP_CIPHER* cbc_for_key(std::size_t key_size) {
    switch (key_size) {
        case 16: return EVP_aes_128_cbc();
        case 24: return EVP_aes_192_cbc();
        default: return EVP_aes_256_cbc();
    }
}

const EVP_CIPHER* gcm_for_key(std::size_t key_size) {
    switch (key_size) {
        case 16: return EVP_aes_128_gcm();
        case 24: return EVP_aes_192_gcm();
        default: return EVP_aes_256_gcm();
    }
}

Bytes decode_param(const json::object& params, const char* field, const char* cipher) {
    const json::value* v = params.if_contains(field);
    if (!v || !v->is_string()) {
        params_fail(std::string(cipher) + " requires a base64 '" + field + "' parameter");
    }
    auto decoded = InputValidator::decode_base64(std::string(v->as_string()));
    if (!decoded) {
        params_fail(std::string(cipher) + " '" + field + "' is not valid base64");
    }
    return std::move(*decoded);
}

}

// --- XOR ---

XorCipher::XorCipher(std::uint8_t key) : key_(key) {}

std::unique_ptr<CipherPlugin> XorCipher::from_params(const json::object& params) {
    const json::value* v = params.if_contains("byte");
    if (!v || !(v->is_int64() || v->is_uint64())) {
        params_fail("XOR byte must be an integer between 0 and 255");
    }
    bool in_range = v->is_uint64() ? v->as_uint64() <= 255
                                   : (v->as_int64() >= 0 && v->as_int64() <= 255);
    if (!in_range) {
        params_fail("XOR byte must be an integer between 0 and 255");
    }
    auto key = static_cast<std::uint8_t>(v->is_uint64() ? v->as_uint64() : v->as_int64());
    return std::make_unique<XorCipher>(key);
}

Bytes XorCipher::apply(const Bytes& data) const {
    Bytes out(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        out[i] = static_cast<std::uint8_t>(data[i] ^ key_);
    }
    return out;
}

Bytes XorCipher::encrypt(const Bytes& plaintext) const {
    return apply(plaintext);
}

Bytes XorCipher::decrypt(const Bytes& ciphertext) const {
    return apply(ciphertext);
}

// --- AES-CBC ---

AesCbcCipher::AesCbcCipher(Bytes key, Bytes iv) : key_(std::move(key)), iv_(std::move(iv)) {
    if (!valid_aes_key_size(key_.size()) || iv_.size() != block_size) {
        params_fail("Invalid AES key or IV length: key=" + std::to_string(key_.size()) +
                    ", iv=" + std::to_string(iv_.size()));
    }
}

std::unique_ptr<CipherPlugin> AesCbcCipher::from_params(const json::object& params) {
    Bytes key = decode_param(params, "key", "aes-cbc");
    Bytes iv = decode_param(params, "iv", "aes-cbc");
    return std::make_unique<AesCbcCipher>(std::move(key), std::move(iv));
}

Bytes AesCbcCipher::encrypt(const Bytes& plaintext) const {
    std::size_t pad = block_size - (plaintext.size() % block_size);
    Bytes padded(plaintext);
    padded.insert(padded.end(), pad, static_cast<std::uint8_t>(pad));

    auto ctx = new_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), cbc_for_key(key_.size()), nullptr, key_.data(), iv_.data()) != 1 ||
        EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1) {
        crypto_fail("AES-CBC encrypt init failed");
    }

    Bytes out(padded.size() + block_size);
    int len = 0;
    int total = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, padded.data(), evp_length(padded.size())) != 1) {
        crypto_fail("AES-CBC encrypt failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        crypto_fail("AES-CBC encrypt finalize failed");
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));
    return out;
}

Bytes AesCbcCipher::decrypt(const Bytes& ciphertext) const {
    if (ciphertext.empty() || ciphertext.size() % block_size != 0) {
        crypto_fail("AES-CBC ciphertext length " + std::to_string(ciphertext.size()) +
                    " is not a positive multiple of the block size");
    }

    auto ctx = new_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), cbc_for_key(key_.size()), nullptr, key_.data(), iv_.data()) != 1 ||
        EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1) {
        crypto_fail("AES-CBC decrypt init failed");
    }

    Bytes out(ciphertext.size() + block_size);
    int len = 0;
    int total = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(), evp_length(ciphertext.size())) != 1) {
        crypto_fail("AES-CBC decrypt failed");
    }
    total = len;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        crypto_fail("AES-CBC decrypt finalize failed");
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));

    std::size_t pad = out.back();
    if (pad < 1 || pad > block_size || pad > out.size()) {
        crypto_fail("AES-CBC padding value " + std::to_string(pad) + " out of range");
    }
    for (std::size_t i = out.size() - pad; i < out.size(); ++i) {
        if (out[i] != pad) {
            crypto_fail("AES-CBC padding bytes are inconsistent");
        }
    }
    out.resize(out.size() - pad);
    return out;
}

// --- AES-GCM ---

AesGcmCipher::AesGcmCipher(Bytes key, Bytes nonce) : key_(std::move(key)), nonce_(std::move(nonce)) {
    if (!valid_aes_key_size(key_.size()) || nonce_.size() != nonce_size) {
        params_fail("Invalid AES key or nonce length: key=" + std::to_string(key_.size()) +
                    ", nonce=" + std::to_string(nonce_.size()));
    }
}

std::unique_ptr<CipherPlugin> AesGcmCipher::from_params(const json::object& params) {
    Bytes key = decode_param(params, "key", "aes-gcm");
    Bytes nonce = decode_param(params, "nonce", "aes-gcm");
    return std::make_unique<AesGcmCipher>(std::move(key), std::move(nonce));
}

Bytes AesGcmCipher::encrypt(const Bytes& plaintext) const {
    auto ctx = new_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), gcm_for_key(key_.size()), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce_size), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce_.data()) != 1) {
        crypto_fail("AES-GCM encrypt init failed");
    }

    Bytes out(plaintext.size() + tag_size);
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(), evp_length(plaintext.size())) != 1) {
            crypto_fail("AES-GCM encrypt failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        crypto_fail("AES-GCM encrypt finalize failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_size), out.data() + total) != 1) {
        crypto_fail("AES-GCM tag extraction failed");
    }
    out.resize(static_cast<std::size_t>(total) + tag_size);
    return out;
}

Bytes AesGcmCipher::decrypt(const Bytes& ciphertext) const {
    if (ciphertext.size() < tag_size) {
        crypto_fail("AES-GCM ciphertext shorter than the authentication tag");
    }
    std::size_t body_size = ciphertext.size() - tag_size;
    Bytes tag(ciphertext.begin() + static_cast<std::ptrdiff_t>(body_size), ciphertext.end());

    auto ctx = new_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), gcm_for_key(key_.size()), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce_size), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce_.data()) != 1) {
        crypto_fail("AES-GCM decrypt init failed");
    }

    Bytes out(body_size + tag_size);
    int len = 0;
    int total = 0;
    if (body_size > 0) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(), evp_length(body_size)) != 1) {
            crypto_fail("AES-GCM decrypt failed");
        }
        total = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag_size), tag.data()) != 1) {
        crypto_fail("AES-GCM tag setup failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) <= 0) {
        crypto_fail("AES-GCM authentication failed");
    }
    total += len;
    out.resize(static_cast<std::size_t>(total));
    return out;
}

// --- Registry ---

CipherRegistry::CipherRegistry() {
    factories_["xor"] = &XorCipher::from_params;
    factories_["aes-cbc"] = &AesCbcCipher::from_params;
    factories_["aes-gcm"] = &AesGcmCipher::from_params;
}

CipherRegistry& CipherRegistry::instance() {
    static CipherRegistry instance;
    return instance;
}

std::unique_ptr<CipherPlugin> CipherRegistry::create(const CipherConfig& config) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(config.type);
        if (it == factories_.end()) {
            std::string known;
            for (const auto& entry : factories_) {
                known += (known.empty() ? "" : ", ") + entry.first;
            }
            params_fail("Unsupported crypto type: " + config.type + " (known: " + known + ")");
        }
        factory = it->second;
    }
    auto plugin = factory(config.params);
    SecurityLogger::log(SecurityLogger::Level::DEBUG, SecurityLogger::EventType::LIFECYCLE,
                        "internal", "Initialized cipher " + plugin->name());
    return plugin;
}

std::shared_ptr<const CipherPlugin> make_cipher(const CipherConfig& config) {
    return CipherRegistry::instance().create(config);
}

std::shared_ptr<const CipherPlugin> load_cipher(const ConfigSource& source,
                                                const std::string& service_name,
                                                const std::string& version) {
    return make_cipher(load_cipher_config(source, service_name, version));
}

}
