#include "infrastructure/DatasetWriter.hpp"
#include "domain/ImportErrors.hpp"
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace hubingest::infrastructure {

namespace fs = std::filesystem;

DatasetWriter::DatasetWriter(const std::string& datasetDir, int maxAttempts)
    : m_dir(fs::absolute(datasetDir)), m_maxAttempts(maxAttempts) {
    if (!fs::exists(m_dir)) {
        fs::create_directories(m_dir);
    }
    if (!fs::is_directory(m_dir)) {
        throw std::runtime_error("Dataset path is not a directory: " + m_dir.string());
    }
}

std::string DatasetWriter::SanitizeFileName(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '.' || c == '_' || c == '-')) {
            c = '_';
        }
    }
    return out;
}

fs::path DatasetWriter::SidecarPath(const fs::path& imagePath) {
    fs::path sidecar = imagePath;
    sidecar.replace_extension(kCaptionExtension);
    return sidecar;
}

fs::path DatasetWriter::uniquePath(const std::string& baseName, const std::string& extension) const {
    const std::string safeBase = SanitizeFileName(baseName);
    const std::string safeExt = SanitizeFileName(
        (extension.empty() || extension.front() == '.') ? extension : "." + extension);

    // A status error (e.g. ENAMETOOLONG) counts as free; the write then reports it.
    auto isFree = [](const fs::path& candidate) {
        std::error_code ec;
        if (fs::exists(candidate, ec)) return false;
        return !fs::exists(SidecarPath(candidate), ec);
    };

    fs::path candidate = m_dir / (safeBase + safeExt);
    if (isFree(candidate)) return candidate;

    for (int i = 1; i < m_maxAttempts; ++i) {
        candidate = m_dir / (safeBase + "_" + std::to_string(i) + safeExt);
        if (isFree(candidate)) return candidate;
    }
    throw domain::NoUniqueNameAvailable("Unable to find a unique filename for '" + safeBase + safeExt +
                                        "' after " + std::to_string(m_maxAttempts) + " attempts");
}

fs::path DatasetWriter::write(const std::string& baseName,
                              const std::string& extension,
                              const std::vector<unsigned char>& imageBytes,
                              const std::string& caption) const {
    fs::path imagePath = uniquePath(baseName, extension);
    if (SidecarPath(imagePath) == imagePath) {
        throw std::runtime_error("Image file name collides with its caption sidecar: " + imagePath.string());
    }
    writeAtomic(imagePath, reinterpret_cast<const char*>(imageBytes.data()), imageBytes.size());
    try {
        writeAtomic(SidecarPath(imagePath), caption.data(), caption.size());
    } catch (const std::exception&) {
        // An image without its caption would block the slot on the next run.
        std::error_code ec;
        fs::remove(imagePath, ec);
        throw;
    }
    return imagePath;
}

void DatasetWriter::writeAtomic(const fs::path& finalPath, const char* data, size_t size) const {
    // Fixed-length temp name, so any final name that fits NAME_MAX can be staged.
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath.parent_path() / (".hubingest-" + std::to_string(timestamp) + ".tmp");

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs.write(data, static_cast<std::streamsize>(size));
        ofs.flush();
        if (ofs.fail()) {
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw std::runtime_error("Rename failed for " + finalPath.string() + ": " + ec.message());
    }
}

} // namespace hubingest::infrastructure
