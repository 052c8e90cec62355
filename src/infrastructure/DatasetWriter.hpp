/**
 * @file DatasetWriter.hpp
 * @brief Writes image + caption sidecar pairs into a dataset directory.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace hubingest::infrastructure {

/**
 * @class DatasetWriter
 * @brief Collision-safe writer for training images and their captions.
 *
 * Never overwrites: when {base}{ext} (or its .txt sidecar) exists, numbered
 * variants {base}_1{ext}, {base}_2{ext}, ... are tried up to the attempt limit.
 */
class DatasetWriter {
public:
    static constexpr int kMaxAttempts = 10000;
    static constexpr const char* kCaptionExtension = ".txt";

    /**
     * @param datasetDir Target directory. Created if missing.
     * @param maxAttempts Name variants tried before NoUniqueNameAvailable.
     */
    explicit DatasetWriter(const std::string& datasetDir, int maxAttempts = kMaxAttempts);

    /**
     * @brief Writes the image and its caption sidecar.
     * @param baseName Unsanitized base name.
     * @param extension With or without leading dot.
     * @return Absolute path of the written image.
     * @throws domain::NoUniqueNameAvailable when every variant is taken.
     * @throws std::runtime_error on I/O failure.
     */
    std::filesystem::path write(const std::string& baseName,
                                const std::string& extension,
                                const std::vector<unsigned char>& imageBytes,
                                const std::string& caption) const;

    /** @brief Picks the first free image path for base/extension. */
    std::filesystem::path uniquePath(const std::string& baseName, const std::string& extension) const;

    /** @brief Replaces every character outside [A-Za-z0-9._-] with '_'. */
    static std::string SanitizeFileName(const std::string& name);

    /** @brief Caption file for an image: same stem, .txt. */
    static std::filesystem::path SidecarPath(const std::filesystem::path& imagePath);

    const std::filesystem::path& directory() const { return m_dir; }

private:
    void writeAtomic(const std::filesystem::path& finalPath, const char* data, size_t size) const;

    std::filesystem::path m_dir;
    int m_maxAttempts;
};

} // namespace hubingest::infrastructure
