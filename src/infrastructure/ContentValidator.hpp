/**
 * @file ContentValidator.hpp
 * @brief Verifies that downloaded bytes are a Parquet archive.
 */

#pragma once

#include "domain/RemoteFetcher.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hubingest::infrastructure {

class ContentValidator {
public:
    using Bytes = std::vector<unsigned char>;

    /**
     * @brief Decompresses when needed and checks the archive magic.
     * @return The buffer to decode.
     * @throws domain::InvalidContent with a preview and hints when the magic is missing.
     */
    static Bytes Validate(const domain::FetchResult& fetched);

    /** @brief True when the buffer begins and ends with "PAR1". */
    static bool IsArchive(const Bytes& buf);

    /**
     * @brief Gunzips when headers or the gzip magic say so.
     * A buffer that fails to inflate is returned unchanged.
     */
    static Bytes MaybeDecompress(const Bytes& buf, const std::string& contentType, const std::string& contentEncoding);

    /** @brief Full gzip inflate; nullopt on any zlib error or truncated stream. */
    static std::optional<Bytes> Gunzip(const Bytes& buf);

    /** @brief Git-LFS pointer file instead of the real object. */
    static bool LooksLikePointerRecord(const Bytes& buf);

    /** @brief An HTML page (login wall, 404 page) instead of binary content. */
    static bool LooksLikeMarkup(const Bytes& buf);
};

} // namespace hubingest::infrastructure
