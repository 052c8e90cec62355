#include <cassert>
#include <iostream>
#include <string>

#include "domain/ImportErrors.hpp"
#include "infrastructure/HubFetcher.hpp"
#include "TestSupport.hpp"

using namespace hubingest;
using namespace hubingest::domain;
using hubingest::infrastructure::HubFetcher;
using hubingest::test::LocalHub;

namespace {
    void ServeBytes(httplib::Response& res, const std::string& body, const char* type = "application/octet-stream") {
        res.status = 200;
        res.set_content(body, type);
    }

    void Reject(httplib::Response& res, int status, const std::string& hostMessage) {
        res.status = status;
        if (!hostMessage.empty()) res.set_header("X-Error-Message", hostMessage);
        res.set_content("{\"error\":\"" + hostMessage + "\"}", "application/json");
    }

    void TestSanitizeToken() {
        assert(HubFetcher::SanitizeToken("  hf_abc  ") == "hf_abc");
        assert(HubFetcher::SanitizeToken("Bearer hf_abc") == "hf_abc");
        assert(HubFetcher::SanitizeToken("bearer   hf_abc\n") == "hf_abc");
        assert(HubFetcher::SanitizeToken("\"hf_abc\"") == "hf_abc");
        assert(HubFetcher::SanitizeToken("'hf_abc'") == "hf_abc");
        assert(HubFetcher::SanitizeToken("\"Bearer hf_abc\"") == "hf_abc");
        assert(HubFetcher::SanitizeToken("hf_abc hf_def") == "hf_abc");
        assert(HubFetcher::SanitizeToken("   ") == "");
        assert(HubFetcher::SanitizeToken("") == "");
        assert(HubFetcher::SanitizeToken("Bearer") == "Bearer");
        std::cout << "[PASS] SanitizeToken" << std::endl;
    }

    void TestUrlBuilding() {
        HubFetcher fetcher("https://hub.example/");
        RemoteReference ref("org/repo", "refs/convert/parquet", "dir/my file#1.parquet", RepoKind::Auto);
        assert(fetcher.buildUrl(ref, RepoKind::Datasets) ==
               "https://hub.example/datasets/org/repo/resolve/refs%2Fconvert%2Fparquet/dir/my%20file%231.parquet");
        assert(fetcher.buildUrl(ref, RepoKind::Models) ==
               "https://hub.example/org/repo/resolve/refs%2Fconvert%2Fparquet/dir/my%20file%231.parquet");
        // Escaped and plain spellings of a revision resolve to the same URL.
        RemoteReference escaped("org/repo", "refs%2Fconvert%2Fparquet", "dir/my file#1.parquet", RepoKind::Auto);
        assert(fetcher.buildUrl(escaped, RepoKind::Datasets) == fetcher.buildUrl(ref, RepoKind::Datasets));
        assert(HubFetcher::WithDownloadQuery("https://h/x") == "https://h/x?download=true");
        assert(HubFetcher::WithDownloadQuery("https://h/x?a=1") == "https://h/x?a=1&download=true");
        std::cout << "[PASS] URL building" << std::endl;
    }

    void TestTokenRejectedOnPublicFile() {
        LocalHub hub;
        hub.server().Get("/datasets/org/repo/resolve/main/data.parquet",
            [](const httplib::Request& req, httplib::Response& res) {
                if (req.has_header("Authorization")) {
                    Reject(res, 401, "Invalid credentials in Authorization header");
                    return;
                }
                ServeBytes(res, "PAR1public-PAR1");
            });
        hub.start();

        HubFetcher fetcher(hub.endpoint());
        FetchResult out = fetcher.fetch(RemoteReference("org/repo", "main", "data.parquet", RepoKind::Datasets), "\"Bearer hf_stale\"");
        assert(std::string(out.bytes.begin(), out.bytes.end()) == "PAR1public-PAR1");
        assert(out.httpStatus == 200);

        auto hits = hub.hits();
        assert(hits.size() == 2);
        assert(hits[0].authenticated);
        assert(!hits[1].authenticated);
        assert(!hits[1].downloadParam);
        std::cout << "[PASS] Auth falls back to anonymous on the same URL" << std::endl;
    }

    void TestDownloadQueryFallback() {
        LocalHub hub;
        hub.server().Get("/org/repo/resolve/main/data.parquet",
            [](const httplib::Request& req, httplib::Response& res) {
                if (!req.has_param("download")) {
                    Reject(res, 404, "Entry not found");
                    return;
                }
                ServeBytes(res, "PAR1download-PAR1");
            });
        hub.start();

        HubFetcher fetcher(hub.endpoint());
        FetchResult out = fetcher.fetch(RemoteReference("org/repo", "main", "data.parquet", RepoKind::Models), "");
        assert(std::string(out.bytes.begin(), out.bytes.end()) == "PAR1download-PAR1");
        assert(out.requestedUrl == hub.endpoint() + "/org/repo/resolve/main/data.parquet?download=true");

        auto hits = hub.hits();
        assert(hits.size() == 2);
        assert(!hits[0].downloadParam && hits[1].downloadParam);
        std::cout << "[PASS] download=true fallback" << std::endl;
    }

    void TestAutoFallsBackToModels() {
        LocalHub hub;
        hub.server().Get("/org/repo/resolve/main/data.parquet",
            [](const httplib::Request&, httplib::Response& res) {
                res.set_header("Content-Encoding", "identity");
                ServeBytes(res, "PAR1model-PAR1", "application/vnd.apache.parquet");
            });
        hub.start();

        HubFetcher fetcher(hub.endpoint());
        FetchResult out = fetcher.fetch(RemoteReference("org/repo", "main", "data.parquet", RepoKind::Auto), "hf_token");
        assert(std::string(out.bytes.begin(), out.bytes.end()) == "PAR1model-PAR1");
        assert(out.contentType == "application/vnd.apache.parquet");
        assert(out.repoKind == RepoKind::Models);

        // datasets: (auth, anon) x (plain, download) = 4 misses, then models succeeds at once.
        auto hits = hub.hits();
        assert(hits.size() == 5);
        for (size_t i = 0; i < 4; ++i) {
            assert(hits[i].path.rfind("/datasets/", 0) == 0);
        }
        assert(hits[4].path == "/org/repo/resolve/main/data.parquet");
        assert(hits[4].authenticated);
        std::cout << "[PASS] Auto tries datasets, then models" << std::endl;
    }

    void TestRedirectReportsFinalUrl() {
        LocalHub hub;
        hub.server().Get("/datasets/org/repo/resolve/main/data.parquet",
            [](const httplib::Request&, httplib::Response& res) {
                res.set_redirect("/cdn/blob-123");
            });
        hub.server().Get("/cdn/blob-123",
            [](const httplib::Request&, httplib::Response& res) {
                ServeBytes(res, "PAR1cdn-PAR1");
            });
        hub.start();

        HubFetcher fetcher(hub.endpoint());
        FetchResult out = fetcher.fetch(RemoteReference("org/repo", "main", "data.parquet", RepoKind::Datasets), "");
        assert(std::string(out.bytes.begin(), out.bytes.end()) == "PAR1cdn-PAR1");
        assert(out.finalUrl.find("/cdn/blob-123") != std::string::npos);
        std::cout << "[PASS] Redirects are followed" << std::endl;
    }

    void TestTotalFailureAggregatesAttempts() {
        LocalHub hub;
        hub.server().Get(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
            Reject(res, 404, "Repository not found");
        });
        hub.start();

        HubFetcher fetcher(hub.endpoint());
        bool thrown = false;
        try {
            fetcher.fetch(RemoteReference("org/private", "main", "data.parquet", RepoKind::Auto), "hf_token");
        } catch (const RemoteFetchError& e) {
            thrown = true;
            const auto& attempts = e.attempts();
            assert(attempts.size() == 8);
            assert(attempts[0].repoKind == "datasets" && attempts[0].authenticated);
            assert(attempts[1].repoKind == "datasets" && !attempts[1].authenticated);
            assert(attempts[7].repoKind == "models");
            for (const auto& a : attempts) {
                assert(a.status == 404);
                assert(a.hostErrorMessage == "Repository not found");
                assert(a.bodyPreview.find("Repository not found") != std::string::npos);
            }
            std::string message = e.what();
            assert(message.find(hub.endpoint() + "/datasets/org/private/resolve/main/data.parquet") != std::string::npos);
            assert(message.find(hub.endpoint() + "/org/private/resolve/main/data.parquet?download=true") != std::string::npos);
            assert(message.find("x-error-message: Repository not found") != std::string::npos);
        }
        assert(thrown);
        std::cout << "[PASS] Total failure lists every attempt" << std::endl;
    }

    void TestConnectionRefused() {
        // Nothing listens on tcpmux in the test environment.
        HubFetcher fetcher("http://127.0.0.1:1");
        bool thrown = false;
        try {
            fetcher.fetch(RemoteReference("org/repo", "main", "data.parquet", RepoKind::Models), "");
        } catch (const RemoteFetchError& e) {
            thrown = true;
            assert(e.attempts().size() == 2);
            assert(e.attempts()[0].status == 0);
            assert(!e.attempts()[0].reason.empty());
        }
        assert(thrown);
        std::cout << "[PASS] Transport failures become attempts" << std::endl;
    }
}

int main() {
    std::cout << "[Test] Starting HubFetcher Test..." << std::endl;
    TestSanitizeToken();
    TestUrlBuilding();
    TestTokenRejectedOnPublicFile();
    TestDownloadQueryFallback();
    TestAutoFallsBackToModels();
    TestRedirectReportsFinalUrl();
    TestTotalFailureAggregatesAttempts();
    TestConnectionRefused();
    std::cout << "[PASS] HubFetcher Test." << std::endl;
    return 0;
}
