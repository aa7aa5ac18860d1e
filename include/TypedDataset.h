#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnRole { CONTINUOUS, CATEGORICAL };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>>;
using MissingMask = std::vector<uint8_t>;

/// Loosely typed input cell; monostate is an explicit missing cell.
using RawCell = std::variant<std::monostate, double, std::string>;

struct RawColumn {
    std::string name;
    std::vector<RawCell> cells;
};

/**
 * @brief Dataset as supplied by a loader, before any typing or cleaning.
 * @details Columns are kept in input order; lengths are not validated here.
 */
struct RawDataset {
    std::vector<RawColumn> columns;

    size_t colCount() const noexcept { return columns.size(); }
    size_t rowCount() const noexcept { return columns.empty() ? 0 : columns.front().cells.size(); }
};

struct TypedColumn {
    std::string name;
    ColumnRole role = ColumnRole::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;

    size_t missingCount() const noexcept;
    bool hasMissing() const noexcept { return missingCount() > 0; }
};

bool operator==(const TypedColumn& a, const TypedColumn& b);
inline bool operator!=(const TypedColumn& a, const TypedColumn& b) { return !(a == b); }

const char* columnRoleName(ColumnRole role) noexcept;

class TypedDataset {
public:
    TypedDataset() = default;

    /**
     * @brief Builds a dataset from already typed columns.
     * @pre every column has storage matching its role and a mask of the same length.
     * @throws Mender::DataValidityException on ragged columns, duplicate names,
     *         or storage that does not match the column role.
     */
    explicit TypedDataset(std::vector<TypedColumn> columns);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    bool empty() const noexcept { return columns_.empty() || rowCount_ == 0; }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }

    std::vector<size_t> continuousColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;
    std::vector<size_t> columnsWithMissing() const;

    size_t totalMissing() const noexcept;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    std::vector<std::string> columnNames() const;

    friend bool operator==(const TypedDataset& a, const TypedDataset& b) {
        return a.rowCount_ == b.rowCount_ && a.columns_ == b.columns_;
    }
    friend bool operator!=(const TypedDataset& a, const TypedDataset& b) { return !(a == b); }

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
};
