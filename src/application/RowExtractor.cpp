#include "application/RowExtractor.hpp"
#include "infrastructure/ContentDigest.hpp"
#include "infrastructure/ContentValidator.hpp"
#include "infrastructure/ImageSignature.hpp"
#include <iostream>
#include <stdexcept>

namespace hubingest::application {

using domain::ExtractedAsset;
using domain::RowExtraction;
using domain::TableRow;

namespace {
    const TableRow* Field(const TableRow& obj, const char* key) {
        if (!obj.is_object()) return nullptr;
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return nullptr;
        return &(*it);
    }
}

const std::vector<std::string>& RowExtractor::CaptionColumns() {
    static const std::vector<std::string> columns = {"text", "caption", "prompt"};
    return columns;
}

std::string RowExtractor::PickCaption(const TableRow& row) {
    for (const auto& column : CaptionColumns()) {
        const TableRow* value = Field(row, column.c_str());
        if (!value) continue;
        if (value->is_string()) return value->get<std::string>();
        if (value->is_binary()) {
            const auto& bin = value->get_binary();
            return std::string(bin.begin(), bin.end());
        }
        return value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return "";
}

std::optional<std::vector<unsigned char>> RowExtractor::CoerceToBytes(const TableRow& value) {
    if (value.is_null()) return std::nullopt;

    std::vector<unsigned char> out;
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        out.assign(bin.begin(), bin.end());
    } else if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        out.assign(text.begin(), text.end());
    } else if (value.is_array()) {
        out.reserve(value.size());
        for (const auto& item : value) {
            if (!item.is_number_integer() || item.get<long long>() < 0 || item.get<long long>() > 255) {
                throw std::invalid_argument("Image byte array contains a non-byte element: " +
                                            item.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
            }
            out.push_back(static_cast<unsigned char>(item.get<long long>()));
        }
    } else {
        throw std::invalid_argument(std::string("Unsupported image payload type: ") + value.type_name());
    }

    if (out.empty()) return std::nullopt;
    return out;
}

std::pair<std::string, std::string> RowExtractor::SplitPathHint(const std::string& path) {
    std::string name = path;
    auto slash = name.find_last_of('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);
    if (name.empty() || name == ".") return {"", ""};

    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return {name, ""};
    }
    return {name.substr(0, dot), name.substr(dot + 1)};
}

RowExtraction RowExtractor::ExtractAsset(const TableRow& row, const Context& context) {
    ExtractedAsset asset;
    asset.caption = PickCaption(row);

    const TableRow* image = Field(row, kImageColumn);
    if (!image) {
        return RowExtraction::Skipped("row has no image value");
    }

    std::optional<std::vector<unsigned char>> bytes;
    std::string pathHint;

    if (image->is_binary()) {
        bytes = CoerceToBytes(*image);
    } else if (image->is_object()) {
        const TableRow* payload = Field(*image, "bytes");
        if (!payload) payload = Field(*image, "data");
        if (payload) bytes = CoerceToBytes(*payload);

        const TableRow* path = Field(*image, "path");
        if (path) {
            if (!path->is_string()) {
                throw std::invalid_argument(std::string("Unsupported image path type: ") + path->type_name());
            }
            pathHint = path->get<std::string>();
        }
    } else {
        throw std::invalid_argument(std::string("Unsupported image column shape: ") + image->type_name());
    }

    // Path-only rows point at a file next to the archive in the same repository.
    if (!bytes && !pathHint.empty() && context.source && context.fetcher) {
        std::cerr << "[RowExtractor] Fetching referenced image " << pathHint << std::endl;
        domain::FetchResult fetched = context.fetcher->fetch(context.source->withFilePath(pathHint), context.token);
        auto body = infrastructure::ContentValidator::MaybeDecompress(fetched.bytes, "", fetched.contentEncoding);
        if (!body.empty()) bytes = std::move(body);
    }

    if (!bytes) {
        return RowExtraction::Skipped(pathHint.empty()
            ? "row has neither embedded image bytes nor an image path"
            : "image path '" + pathHint + "' cannot be fetched without a source repository");
    }

    asset.imageBytes = std::move(*bytes);

    if (!pathHint.empty()) {
        auto [base, ext] = SplitPathHint(pathHint);
        asset.suggestedBaseName = base;
        asset.suggestedExtension = ext;
    }
    if (asset.suggestedBaseName.empty()) {
        asset.suggestedBaseName = infrastructure::ContentDigest::Md5Hex(asset.imageBytes);
    }
    if (asset.suggestedExtension.empty()) {
        asset.suggestedExtension = infrastructure::ImageSignature::Sniff(asset.imageBytes).value_or(kDefaultExtension);
    }
    return RowExtraction::Imported(std::move(asset));
}

RowExtraction RowExtractor::Extract(const TableRow& row, std::size_t rowIndex, const Context& context) {
    try {
        return ExtractAsset(row, context);
    } catch (const std::exception& e) {
        std::cerr << "[RowExtractor] Row " << rowIndex << " failed: " << e.what() << std::endl;
        return RowExtraction::Failed(e.what());
    }
}

} // namespace hubingest::application
