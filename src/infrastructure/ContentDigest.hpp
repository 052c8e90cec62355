/**
 * @file ContentDigest.hpp
 * @brief Hashing and base64 helpers backed by OpenSSL.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hubingest::infrastructure {

class ContentDigest {
public:
    /** @brief Lower-case hex MD5 of the buffer. Stable across runs. */
    static std::string Md5Hex(const std::vector<unsigned char>& data);

    /** @brief Standard base64 decode; nullopt on malformed input. */
    static std::optional<std::vector<unsigned char>> DecodeBase64(const std::string& text);
};

} // namespace hubingest::infrastructure
