#include "infrastructure/HubFetcher.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace hubingest::infrastructure {

using domain::FetchAttempt;
using domain::FetchResult;
using domain::RemoteReference;
using domain::RepoKind;

namespace {
    std::string EncodePath(const std::string& path) {
        std::stringstream ss(path);
        std::string segment;
        std::string out;
        while (std::getline(ss, segment, '/')) {
            if (segment.empty()) continue;
            if (!out.empty()) out += "/";
            out += HubClient::EncodeComponent(segment);
        }
        return out;
    }

    int HexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Revisions copied out of browser URLs arrive already escaped (refs%2Fpr%2F1).
    std::string UnescapeOnce(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 && HexValue(text[i + 2]) >= 0) {
                out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
                i += 2;
            } else {
                out.push_back(text[i]);
            }
        }
        return out;
    }

    bool IsSpace(unsigned char c) {
        return std::isspace(c) != 0;
    }

    std::string TrimSpaces(const std::string& s) {
        auto first = std::find_if_not(s.begin(), s.end(), IsSpace);
        auto last = std::find_if_not(s.rbegin(), s.rend(), IsSpace).base();
        return (first < last) ? std::string(first, last) : std::string();
    }

    std::string StripQuotes(const std::string& s) {
        if (s.size() >= 3) {
            char q = s.front();
            if ((q == '"' || q == '\'') && s.back() == q) {
                return TrimSpaces(s.substr(1, s.size() - 2));
            }
        }
        return s;
    }

    // "Bearer xyz" pasted from a curl command or an HTTP client.
    std::string StripBearer(const std::string& s) {
        if (s.size() <= 6 || !IsSpace(s[6])) return s;
        std::string scheme = s.substr(0, 6);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c){ return std::tolower(c); });
        if (scheme != "bearer") return s;
        return TrimSpaces(s.substr(6));
    }
}

HubFetcher::HubFetcher(std::string endpoint, std::string userAgent, HubClient client)
    : m_endpoint(std::move(endpoint)), m_userAgent(std::move(userAgent)), m_client(std::move(client)) {
    while (!m_endpoint.empty() && m_endpoint.back() == '/') {
        m_endpoint.pop_back();
    }
}

std::string HubFetcher::SanitizeToken(const std::string& raw) {
    std::string token = TrimSpaces(raw);
    token = StripQuotes(token);
    token = StripBearer(token);
    token = StripQuotes(token);

    auto ws = std::find_if(token.begin(), token.end(), IsSpace);
    return std::string(token.begin(), ws);
}

std::string HubFetcher::buildUrl(const RemoteReference& reference, RepoKind kind) const {
    std::string revision = reference.revision.empty() ? "main" : UnescapeOnce(reference.revision);
    std::string prefix = (kind == RepoKind::Datasets) ? "/datasets/" : "/";
    return m_endpoint + prefix + reference.repoId + "/resolve/" +
           HubClient::EncodeComponent(revision) + "/" + EncodePath(reference.filePath);
}

std::string HubFetcher::WithDownloadQuery(const std::string& url) {
    return url + (url.find('?') != std::string::npos ? "&" : "?") + "download=true";
}

FetchResult HubFetcher::fetch(const RemoteReference& reference, const std::string& rawToken) {
    const std::string token = SanitizeToken(rawToken);
    std::vector<FetchAttempt> attempts;

    std::vector<RepoKind> kinds;
    if (reference.repoKind == RepoKind::Auto) {
        kinds = {RepoKind::Datasets, RepoKind::Models};
    } else {
        kinds = {reference.repoKind};
    }

    for (RepoKind kind : kinds) {
        if (auto result = tryKind(reference, kind, token, attempts)) {
            return *result;
        }
    }

    throw domain::RemoteFetchError(FormatFailure(reference, attempts, !token.empty()), attempts);
}

std::optional<FetchResult> HubFetcher::tryKind(const RemoteReference& reference,
                                               RepoKind kind,
                                               const std::string& token,
                                               std::vector<FetchAttempt>& attempts) const {
    const std::string url = buildUrl(reference, kind);
    const std::vector<std::string> candidates = {url, WithDownloadQuery(url)};

    for (const auto& candidate : candidates) {
        if (!token.empty()) {
            if (auto ok = tryOnce(candidate, kind, token, attempts)) return ok;
            // Public files can reject a stale or foreign token; retry without it.
        }
        if (auto ok = tryOnce(candidate, kind, "", attempts)) return ok;
    }
    return std::nullopt;
}

std::optional<FetchResult> HubFetcher::tryOnce(const std::string& url,
                                               RepoKind kind,
                                               const std::string& token,
                                               std::vector<FetchAttempt>& attempts) const {
    HubClient::Headers headers = {
        {"User-Agent", m_userAgent},
        {"Accept", "*/*"},
    };
    if (!token.empty()) {
        headers.emplace_back("Authorization", "Bearer " + token);
    }

    HttpResponse res = m_client.get(url, headers);
    if (res.ok()) {
        FetchResult out;
        out.bytes = std::move(res.body);
        out.httpStatus = res.status;
        out.requestedUrl = url;
        out.finalUrl = res.finalUrl;
        out.contentType = res.contentType;
        out.contentEncoding = res.contentEncoding;
        out.repoKind = kind;
        return out;
    }

    FetchAttempt attempt;
    attempt.url = url;
    attempt.repoKind = domain::RepoKindToString(kind);
    attempt.authenticated = !token.empty();
    attempt.status = res.status;
    attempt.reason = res.reason;
    attempt.hostErrorMessage = res.hostErrorMessage;
    size_t previewLen = std::min(res.body.size(), kBodyPreviewBytes);
    attempt.bodyPreview.assign(res.body.begin(), res.body.begin() + previewLen);

    std::cerr << "[HubFetcher] " << (attempt.authenticated ? "auth " : "anon ")
              << url << " -> " << res.status << " " << res.reason << std::endl;

    attempts.push_back(std::move(attempt));
    return std::nullopt;
}

std::string HubFetcher::FormatFailure(const RemoteReference& reference,
                                      const std::vector<FetchAttempt>& attempts,
                                      bool hadToken) {
    std::stringstream ss;
    ss << "Failed to download " << reference.toString() << " from Hugging Face. Tried:\n";
    for (const auto& a : attempts) {
        ss << "- " << a.repoKind << (a.authenticated ? " (auth)" : "") << ": "
           << a.url << " -> " << a.status << " " << a.reason;

        std::string extra;
        if (!a.hostErrorMessage.empty()) extra = "x-error-message: " + a.hostErrorMessage;
        if (!a.bodyPreview.empty()) {
            if (!extra.empty()) extra += " | ";
            extra += a.bodyPreview;
        }
        if (!extra.empty()) ss << " (" << extra << ")";
        ss << "\n";
    }
    if (hadToken) {
        ss << "\nIf the file downloads in your browser but fails here, the token was not accepted. "
           << "Re-save hf_token in settings (paste the raw \"hf_...\" token, no quotes).";
    } else {
        ss << "\nNo token was configured. Gated or private repositories need hf_token in settings or HF_TOKEN in the environment.";
    }
    return ss.str();
}

} // namespace hubingest::infrastructure
