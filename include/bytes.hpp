#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace netguard {

using Bytes = std::vector<std::uint8_t>;

inline Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

inline std::string to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

}
