/**
 * @file RemoteFetcher.hpp
 * @brief Interface for resolving a RemoteReference to bytes.
 */

#pragma once

#include "domain/RemoteReference.hpp"
#include <string>
#include <vector>

namespace hubingest::domain {

/**
 * @struct FetchResult
 * @brief A successful download. Transient, never persisted.
 */
struct FetchResult {
    std::vector<unsigned char> bytes;
    int httpStatus = 0;
    std::string requestedUrl;
    std::string finalUrl;            ///< After redirects.
    std::string contentType;
    std::string contentEncoding;
    RepoKind repoKind = RepoKind::Auto;   ///< Namespace that served the file.
};

/**
 * @class RemoteFetcher
 * @brief Abstract source of remote files.
 */
class RemoteFetcher {
public:
    virtual ~RemoteFetcher() = default;

    /**
     * @brief Downloads the file named by the reference.
     * @param reference Repository, revision, path and namespace.
     * @param token Bearer token, may be empty or carry copy-paste noise.
     * @return The first successful response.
     * @throws RemoteFetchError when every strategy fails.
     */
    virtual FetchResult fetch(const RemoteReference& reference, const std::string& token) = 0;
};

} // namespace hubingest::domain
