/**
 * @file HubClient.hpp
 * @brief Low-level HTTP GET client for Hub file downloads.
 */

#pragma once

#include <string>
#include <vector>
#include <utility>

namespace hubingest::infrastructure {

/**
 * @struct HttpResponse
 * @brief Outcome of a single GET. status == 0 means no response arrived.
 */
struct HttpResponse {
    int status = 0;
    std::string reason;
    std::string finalUrl;
    std::string contentType;
    std::string contentEncoding;
    std::string hostErrorMessage;    ///< x-error-message header, if any.
    std::vector<unsigned char> body;

    bool ok() const { return status >= 200 && status < 300; }
};

class HubClient {
public:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    explicit HubClient(int readTimeoutSeconds = 600);

    /**
     * @brief Issues a GET for an absolute http(s) URL, following redirects.
     * Never throws for HTTP or transport failures; they are reported in the response.
     */
    HttpResponse get(const std::string& url, const Headers& headers) const;

    /** @brief Splits "scheme://host[:port]/path?query" into origin and path. */
    static std::pair<std::string, std::string> SplitUrl(const std::string& url);

    /** @brief Percent-encodes one URL component (encodeURIComponent rules). */
    static std::string EncodeComponent(const std::string& text);

private:
    int m_readTimeoutSeconds;
};

} // namespace hubingest::infrastructure
