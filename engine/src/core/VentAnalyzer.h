#pragma once

#include "core/AnalysisConfig.h"
#include "core/DraftCalculator.h"
#include "core/ScenarioEngine.h"
#include "core/VentRequest.h"
#include "select/FanCurveCatalog.h"
#include "select/ProductSelector.h"
#include <vector>

namespace ventsizer {

enum class AnalysisStatus {
    Ok,
    ValidationFailed,
    NoFit
};

std::string analysisStatusName(AnalysisStatus status);

struct AnalysisOutcome {
    AnalysisStatus status = AnalysisStatus::Ok;
    std::vector<ValidationIssue> issues;
    ScenarioSet scenarios;
    SelectionResult selection;

    bool valid() const { return status != AnalysisStatus::ValidationFailed; }
};

// Single entry point: validate, run every scenario, select hardware
// Request content never throws; problems come back in the outcome.
class VentAnalyzer {
public:
    VentAnalyzer(CatalogPtr catalog, const AnalysisConfig& config = AnalysisConfig());
    VentAnalyzer(const VentAnalyzer&) = delete;
    VentAnalyzer& operator=(const VentAnalyzer&) = delete;

    const AnalysisConfig& config() const { return config_; }
    const DraftCalculator& calculator() const { return calc_; }

    AnalysisOutcome analyze(const VentRequest& request) const;

private:
    AnalysisConfig config_;
    DraftCalculator calc_;
    ScenarioEngine scenarios_;
    ProductSelector selector_;
};

} // namespace ventsizer
