/**
 * @file HubFetcher.hpp
 * @brief RemoteFetcher for the Hugging Face Hub with layered fallbacks.
 */

#pragma once

#include "domain/RemoteFetcher.hpp"
#include "domain/ImportErrors.hpp"
#include "infrastructure/HubClient.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hubingest::infrastructure {

/**
 * @class HubFetcher
 * @brief Resolves a reference to bytes, tolerating auth and namespace ambiguity.
 *
 * For each concrete namespace it tries the canonical resolve URL, then the
 * same URL with download=true. With a token, each URL is tried authenticated
 * and, on any non-2xx, again without credentials. RepoKind::Auto walks
 * datasets first, then models. Legs run back to back, without delay.
 */
class HubFetcher : public domain::RemoteFetcher {
public:
    static constexpr const char* kDefaultEndpoint = "https://huggingface.co";
    static constexpr const char* kDefaultUserAgent = "hubingest";
    static constexpr size_t kBodyPreviewBytes = 300;

    explicit HubFetcher(std::string endpoint = kDefaultEndpoint,
                        std::string userAgent = kDefaultUserAgent,
                        HubClient client = HubClient());

    /** @see domain::RemoteFetcher::fetch */
    domain::FetchResult fetch(const domain::RemoteReference& reference, const std::string& token) override;

    /**
     * @brief Cleans a pasted token: trims, drops a "Bearer " prefix and
     * surrounding quotes, and keeps only the first whitespace-separated word.
     */
    static std::string SanitizeToken(const std::string& raw);

    /** @brief Canonical resolve URL for a concrete namespace. */
    std::string buildUrl(const domain::RemoteReference& reference, domain::RepoKind kind) const;

    static std::string WithDownloadQuery(const std::string& url);

private:
    std::optional<domain::FetchResult> tryKind(const domain::RemoteReference& reference,
                                               domain::RepoKind kind,
                                               const std::string& token,
                                               std::vector<domain::FetchAttempt>& attempts) const;

    std::optional<domain::FetchResult> tryOnce(const std::string& url,
                                               domain::RepoKind kind,
                                               const std::string& token,
                                               std::vector<domain::FetchAttempt>& attempts) const;

    static std::string FormatFailure(const domain::RemoteReference& reference,
                                     const std::vector<domain::FetchAttempt>& attempts,
                                     bool hadToken);

    std::string m_endpoint;
    std::string m_userAgent;
    HubClient m_client;
};

} // namespace hubingest::infrastructure
