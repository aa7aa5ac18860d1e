#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Delimited-text tokenization, header normalization and field escaping.
// Nothing here assigns meaning to cell text beyond null-token detection.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
    size_t maxColumns = 20000;
    size_t maxPhysicalLinesPerRecord = 10000;
};

struct Record {
    std::vector<std::string> fields;
    bool malformed = false;     // unterminated quote
    bool limitExceeded = false;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span lines and use "" for a quote.
 * @details Unquoted fields are trimmed of spaces and tabs. A blank physical line
 * yields a record with no fields.
 */
Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});

/// Fills empty names with column_<i> and suffixes repeats with _2, _3, ...
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/// Tokens read as a missing cell (NA, N/A, NULL, NaN, None, #N/A, <NA>, ...).
bool isNullToken(const std::string& field);

std::string escapeField(const std::string& field, char delimiter);
void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
} // namespace CSVUtils
