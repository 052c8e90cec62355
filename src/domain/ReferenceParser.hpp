#pragma once

#include "domain/RemoteReference.hpp"
#include <string>

namespace hubingest::domain {

/**
 * @brief Turns a free-form Hub reference into a RemoteReference.
 * This service is stateless.
 *
 * Accepted shapes:
 *  - org/repo/path/to/file.parquet
 *  - org/repo@rev/path/to/file.parquet
 *  - datasets/org/repo/path/to/file.parquet
 *  - https://huggingface.co/[datasets/]org/repo/(resolve|blob)/REV/path/to/file.parquet
 */
class ReferenceParser {
public:
    /** @brief Suffix every referenced archive must carry (case-insensitive). */
    static constexpr const char* kArchiveSuffix = ".parquet";

    /**
     * @brief Parses a reference string.
     * @throws InvalidReference when the string has too few segments, lacks the
     *         archive suffix, or carries a malformed revision.
     */
    static RemoteReference Parse(const std::string& input);
};

} // namespace hubingest::domain
