#include "SchemaClassifier.h"
#include "MenderExceptions.h"

#include <unordered_map>
#include <unordered_set>

namespace SchemaClassifier {

std::vector<ColumnRole> classify(const std::vector<std::string>& columnNames,
                                 const std::vector<std::string>& continuousColumns) {
    std::unordered_map<std::string, size_t> position;
    position.reserve(columnNames.size());
    for (size_t i = 0; i < columnNames.size(); ++i) position.emplace(columnNames[i], i);

    std::vector<ColumnRole> roles(columnNames.size(), ColumnRole::CATEGORICAL);
    std::vector<std::string> unknown;
    std::unordered_set<std::string> seenUnknown;
    for (const auto& name : continuousColumns) {
        const auto it = position.find(name);
        if (it == position.end()) {
            if (seenUnknown.insert(name).second) unknown.push_back(name);
            continue;
        }
        roles[it->second] = ColumnRole::CONTINUOUS;
    }
    if (!unknown.empty()) {
        throw Mender::DataValidityException("declared continuous column not found in dataset", unknown);
    }
    return roles;
}

std::vector<std::string> namesWithRole(const std::vector<std::string>& columnNames,
                                       const std::vector<ColumnRole>& roles,
                                       ColumnRole role) {
    std::vector<std::string> out;
    for (size_t i = 0; i < columnNames.size() && i < roles.size(); ++i) {
        if (roles[i] == role) out.push_back(columnNames[i]);
    }
    return out;
}

} // namespace SchemaClassifier
