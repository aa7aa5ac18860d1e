#pragma once
#include "TypedDataset.h"
#include <string>
#include <vector>

namespace SchemaClassifier {

/**
 * @brief Assigns a role to every column: declared names are continuous, the rest categorical.
 * @post result.size() == columnNames.size(), aligned with columnNames.
 * @throws Mender::DataValidityException when a declared name is not a column.
 */
std::vector<ColumnRole> classify(const std::vector<std::string>& columnNames,
                                 const std::vector<std::string>& continuousColumns);

std::vector<std::string> namesWithRole(const std::vector<std::string>& columnNames,
                                       const std::vector<ColumnRole>& roles,
                                       ColumnRole role);

} // namespace SchemaClassifier
