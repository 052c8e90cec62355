#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "application/ParquetImportService.hpp"
#include "domain/ImportErrors.hpp"
#include "domain/ReferenceParser.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentValidator.hpp"
#include "infrastructure/HubClient.hpp"
#include "infrastructure/HubFetcher.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ScriptTableReader.hpp"

namespace fs = std::filesystem;
using namespace hubingest;

namespace {

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    std::string option(const std::string& key) const {
        auto it = options.find(key);
        return it == options.end() ? std::string() : it->second;
    }
};

CliArgs ParseArgs(int argc, char** argv) {
    CliArgs args;
    if (argc > 1) args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            std::string key = a.substr(2);
            std::string value = (i + 1 < argc) ? argv[++i] : "";
            args.options[key] = value;
        } else {
            args.positional.push_back(a);
        }
    }
    return args;
}

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  hubingest import (--dataset NAME | --dataset-dir DIR) --ref REFERENCE [--token TOKEN] [--settings FILE]\n"
              << "  hubingest parse REFERENCE\n"
              << "  hubingest verify URL [--token TOKEN] [--settings FILE]\n";
}

std::string Dump(const nlohmann::ordered_json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void PrintError(const std::string& message) {
    nlohmann::ordered_json err;
    err["error"] = message;
    std::cout << Dump(err) << std::endl;
}

std::string SettingsPath(const CliArgs& args) {
    std::string path = args.option("settings");
    return path.empty() ? infrastructure::PathUtils::GetSettingsPath().string() : path;
}

int RunImport(const CliArgs& args) {
    const std::string settingsPath = SettingsPath(args);
    infrastructure::ImportSettings settings = infrastructure::ConfigLoader::Load(settingsPath);

    std::string datasetDir = args.option("dataset-dir");
    std::string datasetName = args.option("dataset");
    const std::string reference = args.option("ref");

    if (datasetDir.empty()) {
        if (datasetName.empty()) {
            PrintError("datasetName is required");
            return 2;
        }
        datasetDir = (fs::path(settings.datasetsRoot) / datasetName).string();
    }
    if (reference.empty()) {
        PrintError("hfParquetPath is required");
        return 2;
    }

    // Read fresh on every run; a stale token silently turns into 401/404s.
    std::string token = args.option("token");
    if (token.empty()) {
        token = infrastructure::ConfigLoader::GetHubToken(settingsPath);
    }

    auto fetcher = std::make_shared<infrastructure::HubFetcher>(settings.hubEndpoint, settings.userAgent);
    auto reader = std::make_shared<infrastructure::ScriptTableReader>(settings.decoderCommand);
    application::ParquetImportService service(fetcher, reader);

    domain::ImportOutcome outcome = service.importFromHub(datasetDir, reference, token,
        [](const std::string& status) { std::cerr << "[hubingest] " << status << std::endl; });

    std::cout << Dump(outcome.toJson()) << std::endl;
    return 0;
}

int RunParse(const CliArgs& args) {
    if (args.positional.empty()) {
        PrintUsage();
        return 2;
    }
    domain::RemoteReference ref = domain::ReferenceParser::Parse(args.positional[0]);
    nlohmann::ordered_json out;
    out["repoId"] = ref.repoId;
    out["revision"] = ref.revision;
    out["filePath"] = ref.filePath;
    out["repoType"] = domain::RepoKindToString(ref.repoKind);
    std::cout << Dump(out) << std::endl;
    return 0;
}

int RunVerify(const CliArgs& args) {
    if (args.positional.empty()) {
        PrintUsage();
        return 2;
    }
    const std::string url = args.positional[0];
    const std::string settingsPath = SettingsPath(args);
    infrastructure::ImportSettings settings = infrastructure::ConfigLoader::Load(settingsPath);

    std::string token = args.option("token");
    if (token.empty()) token = infrastructure::ConfigLoader::GetHubToken(settingsPath);
    token = infrastructure::HubFetcher::SanitizeToken(token);

    infrastructure::HubClient::Headers headers = {
        {"User-Agent", settings.userAgent + "-verify"},
        {"Accept", "*/*"},
    };
    if (!token.empty()) headers.emplace_back("Authorization", "Bearer " + token);

    infrastructure::HttpResponse res = infrastructure::HubClient().get(url, headers);
    std::cout << "status: " << res.status << " " << res.reason << "\n"
              << "requested: " << url << "\n"
              << "finalUrl: " << res.finalUrl << "\n"
              << "content-type: " << res.contentType << "\n"
              << "content-encoding: " << res.contentEncoding << "\n";

    std::vector<unsigned char> buf = res.body;
    std::string enc = res.contentEncoding + " " + res.contentType;
    if (enc.find("gzip") != std::string::npos) {
        auto inflated = infrastructure::ContentValidator::Gunzip(buf);
        std::cout << "gunzip: " << (inflated ? "ok" : "failed") << "\n";
        if (inflated) buf = std::move(*inflated);
    }

    bool archive = infrastructure::ContentValidator::IsArchive(buf);
    std::cout << "bytes: " << buf.size() << "\n"
              << "isParquet: " << (archive ? "true" : "false") << std::endl;

    if (!archive) {
        std::string preview(buf.begin(), buf.begin() + std::min<size_t>(buf.size(), 300));
        std::cout << "looksLikeHtml: " << (infrastructure::ContentValidator::LooksLikeMarkup(buf) ? "true" : "false") << "\n"
                  << "looksLikeGitLFSPointer: " << (infrastructure::ContentValidator::LooksLikePointerRecord(buf) ? "true" : "false") << "\n"
                  << "preview: " << Dump(nlohmann::ordered_json(preview)) << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args = ParseArgs(argc, argv);

    try {
        if (args.command == "import") return RunImport(args);
        if (args.command == "parse") return RunParse(args);
        if (args.command == "verify") return RunVerify(args);
    } catch (const std::exception& e) {
        std::cerr << "[hubingest] " << e.what() << std::endl;
        PrintError(e.what());
        return 1;
    }

    PrintUsage();
    return 2;
}
