#pragma once
#include "AutoConfig.h"
#include "ImputationSession.h"
#include "ReportEngine.h"
#include <string>
#include <vector>

namespace RunReport {

/**
 * @brief Markdown summary of one imputation run: parameters, missingness,
 * fallbacks, before/after column summaries and the optional convergence trace.
 */
ReportEngine build(const AutoConfig& config,
                   const SessionResult& result,
                   const std::vector<std::string>& writtenFiles);

std::string toFixed(double v, int prec = 4);

} // namespace RunReport
