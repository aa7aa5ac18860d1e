#include "DatasetIO.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "MenderExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#ifdef MENDER_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace {
#ifdef MENDER_USE_NATIVE_PARQUET
bool exportParquetNative(const TypedDataset& data, const std::string& parquetPath, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    fields.reserve(data.colCount());
    arrays.reserve(data.colCount());

    for (const auto& col : data.columns()) {
        std::shared_ptr<arrow::Array> arr;
        arrow::Status status;
        if (col.role == ColumnRole::CONTINUOUS) {
            arrow::DoubleBuilder builder;
            const auto& vals = std::get<std::vector<double>>(col.values);
            for (size_t r = 0; r < data.rowCount() && status.ok(); ++r) {
                status = col.missing[r] ? builder.AppendNull() : builder.Append(vals[r]);
            }
            if (status.ok()) status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::float64(), true));
        } else {
            arrow::StringBuilder builder;
            const auto& vals = std::get<std::vector<std::string>>(col.values);
            for (size_t r = 0; r < data.rowCount() && status.ok(); ++r) {
                status = col.missing[r] ? builder.AppendNull() : builder.Append(vals[r]);
            }
            if (status.ok()) status = builder.Finish(&arr);
            fields.push_back(arrow::field(col.name, arrow::utf8(), true));
        }
        if (!status.ok()) {
            errorOut = "Failed to build Arrow array for column '" + col.name + "': " + status.ToString();
            return false;
        }
        arrays.push_back(arr);
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto table = arrow::Table::Make(schema, arrays, static_cast<int64_t>(data.rowCount()));

    auto outRes = arrow::io::FileOutputStream::Open(parquetPath);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(data.rowCount())));
    auto writeStatus = parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif

void exportParquet(const TypedDataset& data, const std::string& parquetPath, const std::string& csvPath,
                   std::vector<std::string>& written) {
#ifdef MENDER_USE_NATIVE_PARQUET
    std::string parquetError;
    if (exportParquetNative(data, parquetPath, parquetError)) {
        written.push_back(parquetPath);
    } else {
        std::cout << "[Mender][Warning] Native parquet export failed: " << parquetError
                  << ". CSV export is available at " << csvPath << "\n";
    }
#else
    (void)data;
    (void)parquetPath;
    (void)written;
    std::cout << "[Mender][Warning] Parquet export requested, but this build was compiled without native parquet support. "
              << "CSV export is available at " << csvPath << "\n";
#endif
}

std::ofstream openForWrite(const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw Mender::IOException("Could not open " + path + " for writing");
    return out;
}
} // namespace

namespace DatasetIO {

RawDataset loadDelimited(const std::string& path, char delimiter) {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
        throw Mender::DatasetException("Invalid delimiter character");
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) throw Mender::IOException("Could not open file " + path);

    CSVUtils::skipBOM(file);
    CSVUtils::Record header;
    while (file.peek() != EOF && header.fields.empty()) {
        header = CSVUtils::readRecord(file, delimiter);
    }
    if (header.limitExceeded) throw Mender::DatasetException("Header row exceeds parse limits in " + path);
    if (header.fields.empty() || header.malformed) {
        throw Mender::DatasetException("Missing or malformed header row in " + path);
    }

    RawDataset raw;
    for (const auto& name : CSVUtils::normalizeHeader(header.fields)) raw.columns.push_back({name, {}});
    const size_t width = raw.columns.size();

    size_t recordNo = 1;
    size_t skipped = 0;
    while (file.peek() != EOF) {
        CSVUtils::Record record = CSVUtils::readRecord(file, delimiter);
        ++recordNo;
        if (record.limitExceeded) {
            throw Mender::DatasetException("Record " + std::to_string(recordNo) + " exceeds parse limits in " + path);
        }
        if (record.malformed) {
            ++skipped;
            continue;
        }
        if (record.fields.empty()) continue;

        for (size_t c = 0; c < width; ++c) {
            RawCell cell;
            if (c < record.fields.size() && !CSVUtils::isNullToken(record.fields[c])) {
                cell = std::move(record.fields[c]);
            }
            raw.columns[c].cells.push_back(std::move(cell));
        }
    }
    if (skipped > 0) {
        std::cout << "[Mender][Warning] Skipped " << skipped << " malformed record(s) in " << path << "\n";
    }
    return raw;
}

RawDataset toRaw(const TypedDataset& data) {
    RawDataset raw;
    raw.columns.reserve(data.colCount());
    for (const auto& col : data.columns()) {
        RawColumn out{col.name, {}};
        out.cells.reserve(data.rowCount());
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (col.missing[r]) {
                out.cells.emplace_back(std::monostate{});
            } else if (col.role == ColumnRole::CONTINUOUS) {
                out.cells.emplace_back(std::get<std::vector<double>>(col.values)[r]);
            } else {
                out.cells.emplace_back(std::get<std::vector<std::string>>(col.values)[r]);
            }
        }
        raw.columns.push_back(std::move(out));
    }
    return raw;
}

std::string cellText(const TypedColumn& col, size_t row) {
    if (col.missing[row]) return "";
    if (col.role == ColumnRole::CONTINUOUS) {
        return CommonUtils::formatDouble(std::get<std::vector<double>>(col.values)[row]);
    }
    return std::get<std::vector<std::string>>(col.values)[row];
}

void writeDatasetCSV(const TypedDataset& data, const std::string& path, char delimiter) {
    std::ofstream out = openForWrite(path);
    CSVUtils::writeRow(out, data.columnNames(), delimiter);
    std::vector<std::string> fields(data.colCount());
    for (size_t r = 0; r < data.rowCount(); ++r) {
        for (size_t c = 0; c < data.colCount(); ++c) fields[c] = cellText(data.columns()[c], r);
        CSVUtils::writeRow(out, fields, delimiter);
    }
    if (!out) throw Mender::IOException("Write failed: " + path);
}

void writeMissingnessCSV(const MissingnessTable& table, const std::string& path, char delimiter) {
    std::ofstream out = openForWrite(path);
    CSVUtils::writeRow(out, {"variable", "missing_count", "missing_pct"}, delimiter);
    for (const auto& row : table) {
        CSVUtils::writeRow(out, {row.variable, std::to_string(row.missingCount), CommonUtils::formatDouble(row.missingPct)}, delimiter);
    }
    if (!out) throw Mender::IOException("Write failed: " + path);
}

std::vector<std::string> writeResults(const SessionResult& result,
                                      const std::string& outputDir,
                                      const std::string& exportFormat) {
    const std::string format = CommonUtils::toLower(CommonUtils::trim(exportFormat));
    std::vector<std::string> written;
    if (format == "none") return written;
    if (format != "csv" && format != "parquet") {
        throw Mender::ConfigurationException("export must be one of: csv, parquet, none");
    }

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) throw Mender::IOException("Could not create output directory " + outputDir + ": " + ec.message());

    const fs::path dir(outputDir);
    auto emitDataset = [&](const TypedDataset& data, const std::string& stem) {
        const std::string csvPath = (dir / (stem + ".csv")).string();
        writeDatasetCSV(data, csvPath);
        written.push_back(csvPath);
        if (format == "parquet") exportParquet(data, (dir / (stem + ".parquet")).string(), csvPath, written);
    };

    const std::string missingnessPath = (dir / "missingness.csv").string();
    writeMissingnessCSV(result.missingness, missingnessPath);
    written.push_back(missingnessPath);

    emitDataset(result.sanitizedOriginal, "data_original");
    const auto& chains = result.completedDatasets;
    if (chains.size() == 1) {
        emitDataset(chains.front(), "data_imputed");
    } else {
        for (size_t k = 0; k < chains.size(); ++k) emitDataset(chains[k], "data_imputed_" + std::to_string(k + 1));
    }
    return written;
}

} // namespace DatasetIO
