#include "infrastructure/HubClient.hpp"
#include <httplib.h>
#include <cctype>
#include <iostream>

namespace hubingest::infrastructure {

HubClient::HubClient(int readTimeoutSeconds)
    : m_readTimeoutSeconds(readTimeoutSeconds) {}

std::pair<std::string, std::string> HubClient::SplitUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    size_t hostStart = (schemeEnd == std::string::npos) ? 0 : schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        return {url, "/"};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

std::string HubClient::EncodeComponent(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        bool unreserved = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
                          c == '~' || c == '*' || c == '\'' || c == '(' || c == ')';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

HttpResponse HubClient::get(const std::string& url, const Headers& headers) const {
    auto [origin, path] = SplitUrl(url);

    httplib::Client cli(origin);
    cli.set_follow_location(true);
    cli.set_connection_timeout(30);
    cli.set_read_timeout(m_readTimeoutSeconds);
    // Keep the wire bytes as sent; the content validator decides about gzip.
    cli.set_decompress(false);

    httplib::Headers requestHeaders;
    for (const auto& h : headers) {
        requestHeaders.emplace(h.first, h.second);
    }

    HttpResponse out;
    out.finalUrl = url;

    auto res = cli.Get(path, requestHeaders);
    if (!res) {
        out.status = 0;
        out.reason = httplib::to_string(res.error());
        std::cerr << "[HubClient] Connection failed for " << url << ": " << out.reason << std::endl;
        return out;
    }

    out.status = res->status;
    out.reason = res->reason.empty() ? httplib::status_message(res->status) : res->reason;
    if (!res->location.empty()) {
        out.finalUrl = res->location;
    }
    out.contentType = res->get_header_value("Content-Type");
    out.contentEncoding = res->get_header_value("Content-Encoding");
    out.hostErrorMessage = res->get_header_value("X-Error-Message");
    out.body.assign(res->body.begin(), res->body.end());
    return out;
}

} // namespace hubingest::infrastructure
