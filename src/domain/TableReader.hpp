/**
 * @file TableReader.hpp
 * @brief Row-oriented view of a decoded columnar archive.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace hubingest::domain {

/**
 * @brief One record: ordered column name -> value.
 *
 * Values are scalars, nested structs (objects), lists, byte payloads
 * (binary values) or null.
 */
using TableRow = nlohmann::ordered_json;

/**
 * @class TableRows
 * @brief Finite, non-restartable sequence of rows with a known count.
 *
 * Rows are handed out by move, so each one is released once consumed.
 */
class TableRows {
public:
    TableRows() = default;
    explicit TableRows(std::vector<TableRow> rows)
        : m_rows(std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end())),
          m_total(m_rows.size()) {}

    /** @brief Number of rows the archive declared. */
    std::size_t size() const { return m_total; }

    /** @brief Rows not yet consumed. */
    std::size_t remaining() const { return m_rows.size(); }

    std::optional<TableRow> next() {
        if (m_rows.empty()) return std::nullopt;
        TableRow row = std::move(m_rows.front());
        m_rows.pop_front();
        return row;
    }

private:
    std::deque<TableRow> m_rows;
    std::size_t m_total = 0;
};

/**
 * @class TableReader
 * @brief Abstract decoder from a validated archive buffer to rows.
 */
class TableReader {
public:
    virtual ~TableReader() = default;

    /**
     * @brief Decodes the whole archive as one unit.
     * @throws DecodeError on any failure. No partial results.
     */
    virtual TableRows read(const std::vector<unsigned char>& archive) = 0;
};

} // namespace hubingest::domain
