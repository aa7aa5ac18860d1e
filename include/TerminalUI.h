#pragma once
#include "ImputationSession.h"
#include "MissingnessReporter.h"
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printMissingnessTable(const MissingnessTable& table);
    static void printComparisonTable(const std::vector<ColumnComparison>& comparisons);
    static void printRunSummary(const SessionResult& result, const std::vector<std::string>& writtenFiles);
};
