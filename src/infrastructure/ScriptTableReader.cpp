#include "infrastructure/ScriptTableReader.hpp"
#include "domain/ImportErrors.hpp"
#include "infrastructure/ContentDigest.hpp"
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace hubingest::infrastructure {

using domain::DecodeError;
using domain::TableRow;
using domain::TableRows;

namespace {
    constexpr size_t kStderrExcerpt = 2000;

    // Private directory holding the archive for the decoder. Removed on scope exit.
    class TempWorkspace {
    public:
        TempWorkspace() {
            std::string pattern = (fs::temp_directory_path() / "hubingest-parquet-XXXXXX").string();
            std::vector<char> buf(pattern.begin(), pattern.end());
            buf.push_back('\0');
            if (mkdtemp(buf.data()) == nullptr) {
                throw DecodeError("Could not create a temporary directory for the parquet decoder");
            }
            m_path = buf.data();
        }

        ~TempWorkspace() {
            std::error_code ec;
            fs::remove_all(m_path, ec);
            if (ec) {
                std::cerr << "[ScriptTableReader] Failed to remove " << m_path << ": " << ec.message() << std::endl;
            }
        }

        TempWorkspace(const TempWorkspace&) = delete;
        TempWorkspace& operator=(const TempWorkspace&) = delete;

        const fs::path& path() const { return m_path; }

    private:
        fs::path m_path;
    };

    std::string ReadFile(const fs::path& path, size_t limit) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) return "";
        std::string out(limit, '\0');
        file.read(&out[0], static_cast<std::streamsize>(limit));
        out.resize(static_cast<size_t>(file.gcount()));
        return out;
    }

    std::string LastNonEmptyLine(const std::string& text) {
        std::stringstream ss(text);
        std::string line;
        std::string last;
        while (std::getline(ss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t") != std::string::npos) last = line;
        }
        return last;
    }

    // Turns {"$binary": "..."} objects back into binary values, recursively.
    void RestoreBinary(TableRow& value) {
        if (value.is_object()) {
            if (value.size() == 1 && value.contains("$binary") && value["$binary"].is_string()) {
                auto bytes = ContentDigest::DecodeBase64(value["$binary"].get<std::string>());
                if (!bytes) {
                    throw DecodeError("Parquet decoder produced malformed base64 payload");
                }
                value = TableRow::binary(std::move(*bytes));
                return;
            }
            for (auto& item : value.items()) {
                RestoreBinary(item.value());
            }
        } else if (value.is_array()) {
            for (auto& item : value) {
                RestoreBinary(item);
            }
        }
    }
}

ScriptTableReader::ScriptTableReader(std::vector<std::string> decoderCommand)
    : m_command(std::move(decoderCommand)) {}

std::string ScriptTableReader::ShellQuote(const std::string& word) {
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

TableRows ScriptTableReader::read(const std::vector<unsigned char>& archive) {
    if (m_command.empty()) {
        throw DecodeError("No parquet decoder command configured");
    }

    TempWorkspace workspace;
    fs::path parquetPath = workspace.path() / "input.parquet";
    fs::path stderrPath = workspace.path() / "decoder.stderr";

    {
        std::ofstream out(parquetPath, std::ios::binary);
        out.write(reinterpret_cast<const char*>(archive.data()), static_cast<std::streamsize>(archive.size()));
        if (!out) {
            throw DecodeError("Failed to write archive to " + parquetPath.string());
        }
    }

    std::stringstream cmd;
    for (const auto& word : m_command) {
        cmd << ShellQuote(word) << " ";
    }
    cmd << "--parquetFile " << ShellQuote(parquetPath.string())
        << " 2>" << ShellQuote(stderrPath.string());

    std::cerr << "[ScriptTableReader] Running: " << cmd.str() << std::endl;

    FILE* pipe = popen(cmd.str().c_str(), "r");
    if (!pipe) {
        throw DecodeError("Parquet decoder could not be started: " + m_command.front());
    }
    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    int status = pclose(pipe);

    std::string stderrText = ReadFile(stderrPath, kStderrExcerpt);

    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        throw DecodeError("Parquet decoder failed with code " + std::to_string(code) +
                          (stderrText.empty() ? std::string() : ": " + stderrText));
    }
    if (stderrText.find_first_not_of(" \t\r\n") != std::string::npos) {
        std::cerr << "[ScriptTableReader] Decoder stderr: " << stderrText << std::endl;
    }

    return ParseDecoderOutput(output);
}

TableRows ScriptTableReader::ParseDecoderOutput(const std::string& stdoutText) {
    std::string line = LastNonEmptyLine(stdoutText);
    if (line.empty()) {
        throw DecodeError("Parquet decoder produced no output");
    }

    TableRow doc;
    try {
        doc = TableRow::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("Parquet decoder output is not valid JSON: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("rows") || !doc["rows"].is_array()) {
        throw DecodeError("Parquet decoder output lacks a 'rows' array");
    }
    auto& rowsJson = doc["rows"];
    if (doc.contains("num_rows")) {
        if (!doc["num_rows"].is_number_unsigned() || doc["num_rows"].get<size_t>() != rowsJson.size()) {
            throw DecodeError("Parquet decoder row count mismatch: declared " + doc["num_rows"].dump() +
                              ", received " + std::to_string(rowsJson.size()));
        }
    }

    std::vector<TableRow> rows;
    rows.reserve(rowsJson.size());
    for (auto& row : rowsJson) {
        if (!row.is_object()) {
            throw DecodeError("Parquet decoder emitted a row that is not an object");
        }
        RestoreBinary(row);
        rows.push_back(std::move(row));
    }
    return TableRows(std::move(rows));
}

} // namespace hubingest::infrastructure
