#ifndef MENDER_EXCEPTIONS_H
#define MENDER_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Mender {

class MenderException : public std::runtime_error {
public:
    explicit MenderException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public MenderException {
public:
    explicit IOException(const std::string& message) : MenderException("IO Error: " + message) {}
};

class DatasetException : public MenderException {
public:
    explicit DatasetException(const std::string& message) : MenderException("Dataset Error: " + message) {}
};

class ConfigurationException : public MenderException {
public:
    explicit ConfigurationException(const std::string& message) : MenderException("Configuration Error: " + message) {}
};

/**
 * @brief Fatal data problem for the current run (empty dataset, duplicate names,
 * non-numeric continuous column, unknown declared column).
 * @details columns() lists the offending column names, possibly empty.
 */
class DataValidityException : public MenderException {
public:
    explicit DataValidityException(const std::string& message, std::vector<std::string> columns = {})
        : MenderException("Data Validity Error: " + message + describeColumns(columns)),
          columns_(std::move(columns)) {}

    const std::vector<std::string>& columns() const noexcept { return columns_; }

private:
    static std::string describeColumns(const std::vector<std::string>& columns) {
        if (columns.empty()) return "";
        std::string out = " [columns: ";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out += ", ";
            out += "'" + columns[i] + "'";
        }
        return out + "]";
    }

    std::vector<std::string> columns_;
};

class CancelledException : public MenderException {
public:
    explicit CancelledException(const std::string& message) : MenderException("Cancelled: " + message) {}
};

} // namespace Mender

#endif // MENDER_EXCEPTIONS_H
