#include "DataSanitizer.h"
#include "CommonUtils.h"
#include "MenderExceptions.h"
#include "SchemaClassifier.h"

#include <charconv>
#include <cmath>
#include <unordered_set>

namespace {
std::vector<double> sanitizeContinuous(const RawColumn& col, MissingMask& missing) {
    std::vector<double> values(col.cells.size(), 0.0);
    for (size_t r = 0; r < col.cells.size(); ++r) {
        const RawCell& cell = col.cells[r];
        double parsed = 0.0;
        bool ok = false;
        if (const auto* d = std::get_if<double>(&cell)) {
            parsed = *d;
            ok = std::isfinite(parsed);
        } else if (const auto* s = std::get_if<std::string>(&cell)) {
            ok = !CommonUtils::isBlank(*s) && DataSanitizer::parseNumber(*s, parsed);
        }
        if (ok) {
            values[r] = parsed;
        } else {
            missing[r] = static_cast<uint8_t>(1);
        }
    }
    return values;
}

std::vector<std::string> sanitizeCategorical(const RawColumn& col, MissingMask& missing) {
    std::vector<std::string> values(col.cells.size());
    for (size_t r = 0; r < col.cells.size(); ++r) {
        const RawCell& cell = col.cells[r];
        if (const auto* d = std::get_if<double>(&cell)) {
            if (std::isfinite(*d)) {
                values[r] = CommonUtils::formatDouble(*d);
                continue;
            }
        } else if (const auto* s = std::get_if<std::string>(&cell)) {
            if (!CommonUtils::isBlank(*s) && !DataSanitizer::isInfinityToken(*s)) {
                values[r] = *s;
                continue;
            }
        }
        missing[r] = static_cast<uint8_t>(1);
    }
    return values;
}
} // namespace

bool DataSanitizer::parseNumber(const std::string& text, double& out) {
    std::string cleaned = CommonUtils::trim(text);
    if (!cleaned.empty() && cleaned.front() == '+') {
        cleaned.erase(cleaned.begin());
    }
    if (cleaned.empty()) return false;

    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    double value = 0.0;
    auto [p, ec] = std::from_chars(b, e, value, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool DataSanitizer::isInfinityToken(const std::string& text) {
    static const std::unordered_set<std::string> tokens = {
        "inf", "+inf", "-inf", "infinity", "+infinity", "-infinity"
    };
    return tokens.find(CommonUtils::toLower(CommonUtils::trim(text))) != tokens.end();
}

TypedDataset DataSanitizer::run(const RawDataset& raw, const std::vector<ColumnRole>& roles) {
    if (raw.columns.empty()) {
        throw Mender::DataValidityException("dataset has no columns");
    }
    if (roles.size() != raw.columns.size()) {
        throw Mender::DataValidityException("expected " + std::to_string(raw.columns.size()) +
                                            " column roles, got " + std::to_string(roles.size()));
    }

    const size_t rows = raw.rowCount();
    std::vector<std::string> ragged;
    std::vector<std::string> duplicates;
    std::unordered_set<std::string> seen;
    for (const auto& col : raw.columns) {
        if (col.cells.size() != rows) ragged.push_back(col.name);
        if (!seen.insert(col.name).second) duplicates.push_back(col.name);
    }
    if (!duplicates.empty()) {
        throw Mender::DataValidityException("column names must be unique", duplicates);
    }
    if (!ragged.empty()) {
        throw Mender::DataValidityException("column length differs from row count " + std::to_string(rows), ragged);
    }
    if (rows == 0) {
        throw Mender::DataValidityException("dataset has no rows");
    }

    std::vector<TypedColumn> columns;
    columns.reserve(raw.columns.size());
    for (size_t c = 0; c < raw.columns.size(); ++c) {
        const RawColumn& src = raw.columns[c];
        TypedColumn col;
        col.name = src.name;
        col.role = roles[c];
        col.missing.assign(rows, static_cast<uint8_t>(0));
        if (col.role == ColumnRole::CONTINUOUS) {
            col.values = sanitizeContinuous(src, col.missing);
        } else {
            col.values = sanitizeCategorical(src, col.missing);
        }
        columns.push_back(std::move(col));
    }
    return TypedDataset(std::move(columns));
}

TypedDataset DataSanitizer::run(const RawDataset& raw, const std::vector<std::string>& continuousColumns) {
    std::vector<std::string> names;
    names.reserve(raw.columns.size());
    for (const auto& col : raw.columns) names.push_back(col.name);
    return run(raw, SchemaClassifier::classify(names, continuousColumns));
}
