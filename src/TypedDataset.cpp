#include "TypedDataset.h"
#include "MenderExceptions.h"

#include <algorithm>
#include <unordered_set>

size_t TypedColumn::missingCount() const noexcept {
    return static_cast<size_t>(std::count(missing.begin(), missing.end(), static_cast<uint8_t>(1)));
}

bool operator==(const TypedColumn& a, const TypedColumn& b) {
    return a.name == b.name && a.role == b.role && a.missing == b.missing && a.values == b.values;
}

const char* columnRoleName(ColumnRole role) noexcept {
    return role == ColumnRole::CONTINUOUS ? "continuous" : "categorical";
}

TypedDataset::TypedDataset(std::vector<TypedColumn> columns) : columns_(std::move(columns)) {
    rowCount_ = columns_.empty() ? 0 : columns_.front().missing.size();

    std::unordered_set<std::string> seen;
    std::vector<std::string> duplicates;
    for (const auto& col : columns_) {
        if (!seen.insert(col.name).second) duplicates.push_back(col.name);
    }
    if (!duplicates.empty()) {
        throw Mender::DataValidityException("column names must be unique", duplicates);
    }

    for (const auto& col : columns_) {
        const bool numericStorage = std::holds_alternative<std::vector<double>>(col.values);
        if ((col.role == ColumnRole::CONTINUOUS) != numericStorage) {
            throw Mender::DataValidityException(
                std::string("storage does not match declared ") + columnRoleName(col.role) + " role", {col.name});
        }
        const size_t storageSize = std::visit([](const auto& v) { return v.size(); }, col.values);
        if (col.missing.size() != rowCount_ || storageSize != rowCount_) {
            throw Mender::DataValidityException(
                "column length differs from row count " + std::to_string(rowCount_), {col.name});
        }
    }
}

std::vector<size_t> TypedDataset::continuousColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].role == ColumnRole::CONTINUOUS) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].role == ColumnRole::CATEGORICAL) out.push_back(i);
    return out;
}

std::vector<size_t> TypedDataset::columnsWithMissing() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].hasMissing()) out.push_back(i);
    return out;
}

size_t TypedDataset::totalMissing() const noexcept {
    size_t total = 0;
    for (const auto& col : columns_) total += col.missingCount();
    return total;
}

int TypedDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::vector<std::string> TypedDataset::columnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}
