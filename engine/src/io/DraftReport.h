#pragma once
#include "core/VentAnalyzer.h"
#include <string>

namespace ventsizer {

class DraftReport {
public:
    /// Human-readable summary: inputs, one block per scenario with the
    /// itemized loss, compliance warnings, guard-rail trail and selection.
    static std::string formatText(const VentRequest& request, const AnalysisOutcome& outcome);

    /// One row per scenario and segment, metadata in '#' header lines.
    static std::string formatCsv(const AnalysisOutcome& outcome);
};

} // namespace ventsizer
