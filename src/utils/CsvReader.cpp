/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/CsvReader.hpp"
#include <format>
#include <fstream>
#include <sstream>

namespace Smallville {

namespace {

std::string trimmed(const std::string& cell) {
    const char* whitespace = " \t\r\n";
    const size_t first = cell.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = cell.find_last_not_of(whitespace);
    return cell.substr(first, last - first + 1);
}

} // anonymous namespace

bool CsvReader::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        m_rows.clear();
        m_lastError = "Could not open file: " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parse(buffer.str())) {
        m_lastError = path + ": " + m_lastError;
        return false;
    }
    return true;
}

bool CsvReader::parse(const std::string& text) {
    m_rows.clear();
    m_lastError.clear();

    CsvRow row;
    std::string cell;
    bool inQuotes = false;
    bool rowHasContent = false;
    size_t line = 1;

    auto endCell = [&]() {
        row.push_back(trimmed(cell));
        cell.clear();
    };
    auto endRow = [&]() {
        endCell();
        if (rowHasContent) {
            m_rows.push_back(std::move(row));
        }
        row.clear();
        rowHasContent = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                cell += c;
            }
            continue;
        }

        switch (c) {
        case '"':
            inQuotes = true;
            rowHasContent = true;
            break;
        case ',':
            endCell();
            rowHasContent = true;
            break;
        case '\r':
            break;
        case '\n':
            endRow();
            ++line;
            break;
        default:
            if (c != ' ' && c != '\t') {
                rowHasContent = true;
            }
            cell += c;
        }
    }

    if (inQuotes) {
        m_rows.clear();
        m_lastError = std::format("Line {}: unterminated quoted cell", line);
        return false;
    }

    if (rowHasContent || !cell.empty()) {
        endRow();
    }
    return true;
}

} // namespace Smallville
