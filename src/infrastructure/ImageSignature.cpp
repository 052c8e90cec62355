#include "infrastructure/ImageSignature.hpp"
#include <cstring>

namespace hubingest::infrastructure {

namespace {
    bool Match(const std::vector<unsigned char>& blob, size_t offset, const void* sig, size_t len) {
        if (offset + len > blob.size()) return false;
        return std::memcmp(blob.data() + offset, sig, len) == 0;
    }
}

std::optional<std::string> ImageSignature::Sniff(const std::vector<unsigned char>& b) {
    static const unsigned char jpg[] = {0xFF, 0xD8, 0xFF};
    static const unsigned char png[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    static const unsigned char tiffLE[] = {'I', 'I', 0x2A, 0x00};
    static const unsigned char tiffBE[] = {'M', 'M', 0x00, 0x2A};

    if (Match(b, 0, jpg, sizeof(jpg))) return "jpg";
    if (Match(b, 0, png, sizeof(png))) return "png";
    if (Match(b, 0, "GIF87a", 6) || Match(b, 0, "GIF89a", 6)) return "gif";
    if (Match(b, 0, "RIFF", 4) && Match(b, 8, "WEBP", 4)) return "webp";
    if (Match(b, 0, "BM", 2) && b.size() >= 14) return "bmp";
    if (Match(b, 0, tiffLE, sizeof(tiffLE)) || Match(b, 0, tiffBE, sizeof(tiffBE))) return "tif";

    // ISO-BMFF: box size, then "ftyp" and the major brand.
    if (Match(b, 4, "ftyp", 4)) {
        if (Match(b, 8, "avif", 4) || Match(b, 8, "avis", 4)) return "avif";
        if (Match(b, 8, "heic", 4) || Match(b, 8, "heix", 4) || Match(b, 8, "mif1", 4)) return "heic";
    }
    return std::nullopt;
}

} // namespace hubingest::infrastructure
