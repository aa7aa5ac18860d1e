#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
namespace {
std::string trimUnquoted(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}
} // namespace

void skipBOM(std::istream& is) {
    if (!is.good()) return;
    static const unsigned char bom[3] = {0xEF, 0xBB, 0xBF};

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != bom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

Record readRecord(std::istream& is, char delimiter, const ParseLimits& limits) {
    Record record;
    if (is.peek() == EOF) return record;

    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;
    size_t physicalLines = 1;
    char c;

    auto pushField = [&]() {
        record.fields.push_back(fieldQuoted ? val : trimUnquoted(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && record.fields.size() > limits.maxColumns) record.limitExceeded = true;
    };
    auto append = [&](char ch) {
        val += ch;
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) record.limitExceeded = true;
    };

    while (!record.limitExceeded && is.get(c)) {
        if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (!inQuotes) break;
            if (limits.maxPhysicalLinesPerRecord > 0 && ++physicalLines > limits.maxPhysicalLinesPerRecord) {
                record.limitExceeded = true;
                break;
            }
            append('\n');
            continue;
        }

        sawContent = true;
        if (c == '"') {
            if (!inQuotes && val.empty() && !fieldQuoted) {
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                append('"');
            } else if (inQuotes) {
                const int next = is.peek();
                if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                    inQuotes = false;
                } else {
                    append(c);
                }
            } else {
                append(c);
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
        } else {
            append(c);
        }
    }

    record.malformed = inQuotes;
    if (sawContent) pushField();
    return record;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        if (seen.count(out[i]) > 0) {
            const std::string base = out[i];
            size_t suffix = 2;
            while (seen.count(base + "_" + std::to_string(suffix)) > 0) ++suffix;
            out[i] = base + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

bool isNullToken(const std::string& field) {
    static const std::unordered_set<std::string> tokens = {
        "", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan", "1.#IND", "1.#QNAN",
        "<NA>", "N/A", "NA", "NULL", "NaN", "None", "n/a", "nan", "null"
    };
    return tokens.count(field) > 0;
}

std::string escapeField(const std::string& field, char delimiter) {
    if (field.find_first_of(std::string(1, delimiter) + "\"\r\n") == std::string::npos &&
        (field.empty() || (field.front() != ' ' && field.front() != '\t' && field.back() != ' ' && field.back() != '\t'))) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    // A lone empty field would otherwise read back as a blank line.
    if (fields.size() == 1 && fields.front().empty()) {
        os << "\"\"\n";
        return;
    }
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) os << delimiter;
        os << escapeField(fields[i], delimiter);
    }
    os << '\n';
}
} // namespace CSVUtils
