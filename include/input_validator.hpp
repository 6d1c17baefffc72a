#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <boost/json.hpp>
#include <boost/beast/core/detail/base64.hpp>

#include "bytes.hpp"

namespace netguard {

// Input validation helpers shared by the configuration and cipher layers.
class InputValidator {
public:
    static constexpr std::size_t max_json_depth = 16;

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = max_json_depth;
        return boost::json::parse(input, {}, opt);
    }

    /**
     * Strict base64 decoding: the input must be padded to a multiple of four
     * characters and contain only alphabet characters followed by at most two
     * '=' characters. Returns nullopt on anything else.
     */
    static std::optional<Bytes> decode_base64(const std::string& input) {
        if (input.empty() || input.size() % 4 != 0) return std::nullopt;

        std::size_t padding = 0;
        while (padding < input.size() && input[input.size() - 1 - padding] == '=') {
            ++padding;
        }
        if (padding > 2) return std::nullopt;

        Bytes out(boost::beast::detail::base64::decoded_size(input.size()));
        auto result = boost::beast::detail::base64::decode(out.data(), input.data(), input.size());

        // The decoder stops at the first '=' or at the first foreign character.
        if (result.second + padding != input.size()) return std::nullopt;

        out.resize(result.first);
        return out;
    }

    static bool is_within_size_limit(std::size_t size, std::size_t max_size) {
        return size <= max_size;
    }

    // Checks for safe alphanumeric characters (including underscores, dots and hyphens).
    static bool is_valid_identifier(const std::string& str) {
        if (str.empty()) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        });
    }
};

}
