/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CSVREADER_HPP
#define CSVREADER_HPP

#include <string>
#include <vector>

namespace Smallville {

using CsvRow = std::vector<std::string>;

/**
 * @brief Minimal RFC 4180 style CSV reader
 *
 * Handles quoted cells (with "" escapes and embedded newlines), CRLF line
 * endings and strips surrounding whitespace from every cell. Blank lines are
 * skipped.
 *
 * Usage:
 *   CsvReader reader;
 *   if (!reader.loadFromFile("sector_blocks.csv")) {
 *       log(reader.getLastError());
 *   }
 *   for (const CsvRow& row : reader.getRows()) { ... }
 */
class CsvReader {
public:
    CsvReader() = default;

    bool loadFromFile(const std::string& path);
    bool parse(const std::string& text);

    const std::vector<CsvRow>& getRows() const { return m_rows; }
    const std::string& getLastError() const { return m_lastError; }

private:
    std::vector<CsvRow> m_rows;
    std::string m_lastError;
};

} // namespace Smallville

#endif // CSVREADER_HPP
