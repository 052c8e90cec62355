#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hubingest::infrastructure {

/**
 * @brief Infers an image file extension from leading magic bytes.
 */
class ImageSignature {
public:
    /** @brief Extension without dot ("jpg", "png", ...) or nullopt when unknown. */
    static std::optional<std::string> Sniff(const std::vector<unsigned char>& bytes);
};

} // namespace hubingest::infrastructure
