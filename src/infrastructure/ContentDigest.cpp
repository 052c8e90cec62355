#include "infrastructure/ContentDigest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hubingest::infrastructure {

std::string ContentDigest::Md5Hex(const std::vector<unsigned char>& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::optional<std::vector<unsigned char>> ContentDigest::DecodeBase64(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (c != '\r' && c != '\n' && c != ' ') clean.push_back(c);
    }
    if (clean.empty()) return std::vector<unsigned char>{};
    if (clean.size() % 4 != 0) return std::nullopt;

    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (written < 0) return std::nullopt;

    // EVP_DecodeBlock counts padding as zero bytes.
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace hubingest::infrastructure
