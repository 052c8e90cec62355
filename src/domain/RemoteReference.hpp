/**
 * @file RemoteReference.hpp
 * @brief Value object identifying a file inside a Hub repository.
 */

#pragma once

#include <string>
#include <utility>

namespace hubingest::domain {

/**
 * @enum RepoKind
 * @brief Which Hub namespace a repository lives in.
 *
 * Auto means "not pinned by the reference"; fetchers try Datasets, then Models.
 */
enum class RepoKind {
    Datasets,
    Models,
    Auto
};

inline std::string RepoKindToString(RepoKind kind) {
    switch (kind) {
        case RepoKind::Datasets: return "datasets";
        case RepoKind::Models: return "models";
        case RepoKind::Auto: return "auto";
    }
    return "auto";
}

/**
 * @class RemoteReference
 * @brief Structured identity of a remote file.
 *
 * Invariant: repoId contains exactly one '/'.
 */
class RemoteReference {
public:
    std::string repoId;              ///< "org/name".
    std::string revision = "main";   ///< Branch, tag or commit.
    std::string filePath;            ///< Path inside the repository.
    RepoKind repoKind = RepoKind::Auto;

    RemoteReference() = default;

    RemoteReference(std::string id, std::string rev, std::string path, RepoKind kind)
        : repoId(std::move(id)), revision(std::move(rev)), filePath(std::move(path)), repoKind(kind) {}

    /** @brief Same repository and revision, different file. Used for per-row image fetches. */
    RemoteReference withFilePath(const std::string& path) const {
        return RemoteReference(repoId, revision, path, repoKind);
    }

    /** @brief Canonical "[datasets/]org/repo@rev/path" rendering. */
    std::string toString() const {
        std::string prefix;
        if (repoKind == RepoKind::Datasets) prefix = "datasets/";
        return prefix + repoId + "@" + revision + "/" + filePath;
    }

    bool operator==(const RemoteReference& other) const {
        return repoId == other.repoId &&
               revision == other.revision &&
               filePath == other.filePath &&
               repoKind == other.repoKind;
    }
};

} // namespace hubingest::domain
