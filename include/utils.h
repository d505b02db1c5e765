#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace live_relay {

/**
 * @brief String and encoding utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Lowercase copy of a string
 */
inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Join strings with a separator
 */
inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

/**
 * @brief Standard base64 (RFC 4648, with padding)
 */
inline std::string base64_encode(const uint8_t* data, size_t len) {
    static constexpr char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len)
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len)
            n |= static_cast<uint32_t>(data[i + 2]);

        out += base64_chars[(n >> 18) & 0x3F];
        out += base64_chars[(n >> 12) & 0x3F];
        out += (i + 1 < len) ? base64_chars[(n >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? base64_chars[n & 0x3F] : '=';
    }
    return out;
}

inline std::string base64_encode(const std::vector<uint8_t>& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

/**
 * @brief Decode base64; whitespace is skipped, any other invalid character fails.
 * @return decoded bytes, or std::nullopt on malformed input
 */
inline std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    uint32_t accum = 0;
    int bits = 0;
    bool padding = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) return std::nullopt;  // data after padding
        int v = value_of(c);
        if (v < 0) return std::nullopt;
        accum = (accum << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((accum >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace utils

} // namespace live_relay
