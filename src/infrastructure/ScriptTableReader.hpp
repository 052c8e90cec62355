/**
 * @file ScriptTableReader.hpp
 * @brief TableReader that decodes archives in a separate decoder process.
 */

#pragma once

#include "domain/TableReader.hpp"
#include <string>
#include <vector>

namespace hubingest::infrastructure {

/**
 * @class ScriptTableReader
 * @brief Hands the archive to an external decoder and reads back one JSON line.
 *
 * The buffer goes through input.parquet in a private temp directory, which is
 * removed on every exit path. The decoder is called as
 * `<command...> --parquetFile <path>` and must print
 * {"num_rows": N, "columns": [...], "rows": [...]} on a single line, with byte
 * payloads tagged as {"$binary": "<base64>"}.
 */
class ScriptTableReader : public domain::TableReader {
public:
    explicit ScriptTableReader(std::vector<std::string> decoderCommand);
    ~ScriptTableReader() override = default;

    /** @see domain::TableReader::read */
    domain::TableRows read(const std::vector<unsigned char>& archive) override;

    /** @brief Parses decoder stdout into rows. Exposed for tests. */
    static domain::TableRows ParseDecoderOutput(const std::string& stdoutText);

    /** @brief Single-quotes a word for /bin/sh. */
    static std::string ShellQuote(const std::string& word);

private:
    std::vector<std::string> m_command;
};

} // namespace hubingest::infrastructure
