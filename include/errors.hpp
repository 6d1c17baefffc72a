#pragma once

#include <stdexcept>
#include <string>

namespace netguard {

// Base of every error the transport core raises toward callers.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Bad or missing settings. Raised at construction time, never retried.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

// Socket-level failure (closed, reset, timed out). The offending socket is
// always closed before this is thrown.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& what) : Error(what) {}
};

// Cipher failure: key material rejected by the crypto backend, or a padding /
// authentication failure on decrypt.
class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& what) : Error(what) {}
};

}
