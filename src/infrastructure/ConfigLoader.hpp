/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading importer configuration (settings.json).
 *
 * Keys: datasets_root, hf_token, hub_endpoint, user_agent, decoder_command.
 */

#pragma once

#include <string>
#include <vector>

namespace hubingest::infrastructure {

/**
 * @struct ImportSettings
 * @brief Everything except the token. Defaults apply for missing keys.
 */
struct ImportSettings {
    std::string datasetsRoot;
    std::string hubEndpoint;
    std::string userAgent;
    std::vector<std::string> decoderCommand;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json, falling back to defaults for absent keys
     * or an unreadable file.
     * @param settingsPath Path to settings.json.
     */
    static ImportSettings Load(const std::string& settingsPath);

    /**
     * @brief Reads 'hf_token' from settings.json, then the HF_TOKEN environment variable.
     * Reads the file on every call; the token must never be cached between runs.
     * @return Raw token (unsanitized) or an empty string.
     */
    static std::string GetHubToken(const std::string& settingsPath);

    /**
     * @brief Command line for the bundled decoder: python3 + decode_parquet.py,
     * searched next to the executable, in its share/ directory and under ./scripts.
     */
    static std::vector<std::string> DefaultDecoderCommand();
};

} // namespace hubingest::infrastructure
