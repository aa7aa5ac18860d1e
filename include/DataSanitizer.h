#pragma once
#include "TypedDataset.h"
#include <string>
#include <vector>

/**
 * @brief Normalizes a raw dataset into a typed working copy.
 * @details Per cell: infinities become MISSING, blank strings become MISSING,
 * continuous columns are parsed to double with unparseable values degrading to
 * MISSING. Categorical strings are kept verbatim. The input is never modified.
 */
class DataSanitizer {
public:
    /**
     * @pre roles.size() == raw.colCount().
     * @throws Mender::DataValidityException on an empty dataset, ragged columns,
     *         duplicate column names, or a role vector of the wrong size.
     */
    static TypedDataset run(const RawDataset& raw, const std::vector<ColumnRole>& roles);

    /**
     * @brief Classifies columns from the declared continuous names, then sanitizes.
     * @throws Mender::DataValidityException also when a declared name is unknown.
     */
    static TypedDataset run(const RawDataset& raw, const std::vector<std::string>& continuousColumns);

    /// Parses a complete finite number; surrounding whitespace and a leading '+' are accepted.
    static bool parseNumber(const std::string& text, double& out);

    static bool isInfinityToken(const std::string& text);
};
