/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HubFetcher.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>

namespace hubingest::infrastructure {

namespace fs = std::filesystem;

namespace {
    std::optional<nlohmann::json> ReadSettings(const std::string& settingsPath) {
        if (settingsPath.empty() || !fs::exists(settingsPath)) {
            return std::nullopt;
        }
        try {
            std::ifstream f(settingsPath);
            nlohmann::json j;
            f >> j;
            if (!j.is_object()) {
                std::cerr << "[ConfigLoader] " << settingsPath << " is not a JSON object, ignoring" << std::endl;
                return std::nullopt;
            }
            return j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
        }
        return std::nullopt;
    }

    std::string StringOr(const nlohmann::json& j, const char* key, const std::string& fallback) {
        if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
            return j[key].get<std::string>();
        }
        return fallback;
    }
}

ImportSettings ConfigLoader::Load(const std::string& settingsPath) {
    ImportSettings settings;
    settings.datasetsRoot = PathUtils::GetDatasetsDir().string();
    settings.hubEndpoint = HubFetcher::kDefaultEndpoint;
    settings.userAgent = HubFetcher::kDefaultUserAgent;

    auto j = ReadSettings(settingsPath);
    if (!j) {
        settings.decoderCommand = DefaultDecoderCommand();
        return settings;
    }

    settings.datasetsRoot = StringOr(*j, "datasets_root", settings.datasetsRoot);
    settings.hubEndpoint = StringOr(*j, "hub_endpoint", settings.hubEndpoint);
    settings.userAgent = StringOr(*j, "user_agent", settings.userAgent);

    if (j->contains("decoder_command")) {
        const auto& cmd = (*j)["decoder_command"];
        std::vector<std::string> words;
        if (cmd.is_array()) {
            for (const auto& w : cmd) {
                if (w.is_string()) words.push_back(w.get<std::string>());
            }
        }
        if (!words.empty()) {
            settings.decoderCommand = words;
        } else {
            std::cerr << "[ConfigLoader] decoder_command must be a non-empty array of strings, using default" << std::endl;
        }
    }
    if (settings.decoderCommand.empty()) {
        settings.decoderCommand = DefaultDecoderCommand();
    }
    return settings;
}

std::string ConfigLoader::GetHubToken(const std::string& settingsPath) {
    if (auto j = ReadSettings(settingsPath)) {
        std::string token = StringOr(*j, "hf_token", "");
        if (!token.empty()) return token;
    }
    const char* env = std::getenv("HF_TOKEN");
    return (env && *env) ? std::string(env) : std::string();
}

std::vector<std::string> ConfigLoader::DefaultDecoderCommand() {
    const fs::path exeDir = PathUtils::GetExecutableDir();
    const std::vector<fs::path> candidates = {
        exeDir / "decode_parquet.py",
        exeDir.parent_path() / "share" / "hubingest" / "decode_parquet.py",
        fs::current_path() / "scripts" / "decode_parquet.py",
    };

    for (const auto& candidate : candidates) {
        if (fs::exists(candidate)) {
            return {"python3", candidate.string()};
        }
    }
    std::cerr << "[ConfigLoader] decode_parquet.py not found next to the executable or in ./scripts" << std::endl;
    return {"python3", candidates.back().string()};
}

} // namespace hubingest::infrastructure
