#pragma once
#include "ImputationSession.h"
#include "MissingnessReporter.h"
#include "TypedDataset.h"
#include <string>
#include <vector>

namespace DatasetIO {

/**
 * @brief Loads a delimited text file with a header row into a RawDataset.
 * @details Null tokens and empty fields become missing cells; every other field is
 * kept as text. Short records are padded with missing cells, long records are
 * truncated, records with an unterminated quote are skipped with a warning.
 * @throws Mender::IOException when the file cannot be opened.
 * @throws Mender::DatasetException for an invalid delimiter, a missing header,
 *         or a record exceeding the parse limits.
 */
RawDataset loadDelimited(const std::string& path, char delimiter = ',');

/// Typed dataset back to loosely typed cells; MISSING becomes monostate.
RawDataset toRaw(const TypedDataset& data);

/// Cell text as written to CSV; MISSING is the empty string.
std::string cellText(const TypedColumn& col, size_t row);

/// @throws Mender::IOException when the file cannot be written.
void writeDatasetCSV(const TypedDataset& data, const std::string& path, char delimiter = ',');
void writeMissingnessCSV(const MissingnessTable& table, const std::string& path, char delimiter = ',');

/**
 * @brief Persists a session result under outputDir.
 * @details Writes missingness.csv, data_original.csv and data_imputed.csv (one chain)
 * or data_imputed_<k>.csv for k = 1..chains. exportFormat "parquet" also writes
 * .parquet twins of the dataset files when built with Arrow; "none" writes nothing.
 * @return Paths of the files written, in write order.
 * @throws Mender::IOException on directory or file failures.
 */
std::vector<std::string> writeResults(const SessionResult& result,
                                      const std::string& outputDir,
                                      const std::string& exportFormat = "csv");

} // namespace DatasetIO
