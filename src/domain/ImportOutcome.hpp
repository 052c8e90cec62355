/**
 * @file ImportOutcome.hpp
 * @brief Summary of one import run and the per-row results feeding it.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hubingest::domain {

/**
 * @struct ExtractedAsset
 * @brief Image bytes and naming derived from one row. Consumed immediately.
 */
struct ExtractedAsset {
    std::vector<unsigned char> imageBytes;
    std::string caption;
    std::string suggestedBaseName;
    std::string suggestedExtension;   ///< Without the leading dot.
};

/**
 * @struct RowExtraction
 * @brief Tagged result of extracting one row.
 */
struct RowExtraction {
    enum class Kind { Asset, Skipped, Failed };

    Kind kind = Kind::Skipped;
    ExtractedAsset asset;
    std::string message;   ///< Skip reason or failure message.

    static RowExtraction Imported(ExtractedAsset a) {
        RowExtraction r;
        r.kind = Kind::Asset;
        r.asset = std::move(a);
        return r;
    }

    static RowExtraction Skipped(std::string reason) {
        RowExtraction r;
        r.kind = Kind::Skipped;
        r.message = std::move(reason);
        return r;
    }

    static RowExtraction Failed(std::string error) {
        RowExtraction r;
        r.kind = Kind::Failed;
        r.message = std::move(error);
        return r;
    }
};

/**
 * @struct RowError
 * @brief A per-row fault, 1-based row index.
 */
struct RowError {
    std::size_t row = 0;
    std::string error;
};

/**
 * @struct ImportOutcome
 * @brief Counters and ordered errors of a run.
 */
struct ImportOutcome {
    int imported = 0;
    int skipped = 0;
    std::vector<RowError> errors;

    nlohmann::ordered_json toJson() const {
        nlohmann::ordered_json errs = nlohmann::ordered_json::array();
        for (const auto& e : errors) {
            nlohmann::ordered_json entry;
            entry["row"] = e.row;
            entry["error"] = e.error;
            errs.push_back(std::move(entry));
        }
        nlohmann::ordered_json out;
        out["imported"] = imported;
        out["skipped"] = skipped;
        out["errors"] = std::move(errs);
        return out;
    }
};

} // namespace hubingest::domain
