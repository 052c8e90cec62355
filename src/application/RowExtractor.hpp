/**
 * @file RowExtractor.hpp
 * @brief Derives an image asset (or a skip/failure) from one decoded row.
 */

#pragma once

#include "domain/ImportOutcome.hpp"
#include "domain/RemoteFetcher.hpp"
#include "domain/RemoteReference.hpp"
#include "domain/TableReader.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hubingest::application {

/**
 * @class RowExtractor
 * @brief Stateless per-row extraction. Exceptions never leave extract().
 */
class RowExtractor {
public:
    /**
     * @struct Context
     * @brief What a row may need beyond itself: where the archive came from,
     * for rows that only reference an image path in the same repository.
     */
    struct Context {
        std::optional<domain::RemoteReference> source;
        std::string token;
        std::shared_ptr<domain::RemoteFetcher> fetcher;
    };

    static constexpr const char* kImageColumn = "image";
    static constexpr const char* kDefaultExtension = "jpg";

    /** @brief Caption columns in priority order. */
    static const std::vector<std::string>& CaptionColumns();

    /**
     * @brief Extracts one row.
     * @param row Decoded record.
     * @param rowIndex 1-based index, used in failure messages.
     * @return Asset, Skipped (no obtainable image) or Failed (anything thrown).
     */
    static domain::RowExtraction Extract(const domain::TableRow& row, std::size_t rowIndex, const Context& context);

    /** @brief First non-null caption column, or an empty string. */
    static std::string PickCaption(const domain::TableRow& row);

    /**
     * @brief Converts an embedded payload to raw bytes.
     * Accepts binary values, arrays of byte-sized integers and UTF-8 strings.
     * @return nullopt for null or empty payloads.
     * @throws std::invalid_argument for any other shape.
     */
    static std::optional<std::vector<unsigned char>> CoerceToBytes(const domain::TableRow& value);

    /** @brief Splits a repository path into (base name, extension without dot). */
    static std::pair<std::string, std::string> SplitPathHint(const std::string& path);

private:
    static domain::RowExtraction ExtractAsset(const domain::TableRow& row, const Context& context);
};

} // namespace hubingest::application
