#include "AutoConfig.h"
#include "DatasetIO.h"
#include "ImputationSession.h"
#include "MathUtils.h"
#include "MenderExceptions.h"
#include "RunReport.h"
#include "TerminalUI.h"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {
std::string resolveReportPath(const AutoConfig& config) {
    namespace fs = std::filesystem;
    const fs::path report(config.reportFile);
    if (report.is_absolute() || config.outputDir.empty()) return report.string();

    std::error_code ec;
    fs::create_directories(config.outputDir, ec);
    if (ec) throw Mender::IOException("Could not create output directory " + config.outputDir + ": " + ec.message());
    return (fs::path(config.outputDir) / report).string();
}
}

int main(int argc, char* argv[]) {
    std::cout << "Mender: Chained-Equations Imputation Engine Initialization...\n";

    AutoConfig config;
    try {
        config = AutoConfig::fromArgs(argc, argv);
    } catch (const Mender::MenderException& e) {
        std::cerr << "[Mender][Error] " << e.what() << "\n";
        return 1;
    }

    try {
        MathUtils::setNumericEpsilon(config.numericEpsilon);

        RawDataset raw = DatasetIO::loadDelimited(config.datasetPath, config.delimiter);
        std::cout << "[Mender] Loaded " << raw.rowCount() << " rows x " << raw.colCount()
                  << " columns from " << config.datasetPath << "\n";

        SessionOptions options;
        options.engine = config.engineOptions();
        const ImputationSession session(options);
        const SessionResult result = session.run(raw, config.continuousColumns, config.chains);

        TerminalUI::printMissingnessTable(result.missingness);
        TerminalUI::printComparisonTable(result.comparisons);

        std::vector<std::string> written = DatasetIO::writeResults(result, config.outputDir, config.exportFormat);
        if (!config.reportFile.empty()) {
            const std::string reportPath = resolveReportPath(config);
            RunReport::build(config, result, written).save(reportPath);
            written.push_back(reportPath);
        }

        TerminalUI::printRunSummary(result, written);
    } catch (const Mender::MenderException& e) {
        std::cerr << "[Mender][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Mender][Exception] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
