#pragma once

#include "core/AnalysisConfig.h"
#include "core/DraftCalculator.h"
#include "core/VentRequest.h"
#include <string>
#include <vector>

namespace ventsizer {

enum class ScenarioTag {
    All,
    AllMinusLargest,
    SingleLargest,
    SingleSmallest
};

std::string scenarioName(ScenarioTag tag);

struct OperatingScenario {
    ScenarioTag tag;
    std::vector<int> active;  // appliance indices, input order
};

enum class WarningKind {
    VelocityLow,
    VelocityHigh,
    VentTypeNotRated,
    OutletPressureTooNegative,
    OutletPressureTooPositive
};

std::string warningKindName(WarningKind kind);

struct ComplianceWarning {
    WarningKind kind;
    std::string subject;   // "connector", "manifold", "appliance[2]", ...
    std::string message;
};

// Result of one operating scenario
// availableDraft > 0 means the vent pulls the appliance outlet below
// atmosphere; outletPressure is the same quantity with the opposite sign.
struct CalculationResult {
    OperatingScenario scenario;
    CombinedFlow flow;
    int connectorAppliance = -1;   // appliance carried by the connector, -1 = combined flow
    SegmentResult connector;
    bool hasManifold = false;
    SegmentResult manifold;
    double theoreticalDraft = 0.0;
    double totalLoss = 0.0;
    double availableDraft = 0.0;
    double outletPressure = 0.0;
    std::vector<ComplianceWarning> warnings;
};

struct ScenarioSet {
    std::vector<CalculationResult> results;
    int worstCase = -1;                        // index into results
    std::vector<ComplianceWarning> warnings;   // system-level (vent rating, category limits)

    const CalculationResult& worst() const { return results.at(worstCase); }
    const CalculationResult* find(ScenarioTag tag) const;
};

// Resolve the active subset for a scenario
// Ties on MBH go to the first appliance in input order. ALL_MINUS_LARGEST on a
// single-appliance system resolves to an empty set (not applicable).
OperatingScenario resolveScenario(ScenarioTag tag, const std::vector<ApplianceSpec>& appliances);

// Runs the draft calculation once per operating scenario and picks the worst case
class ScenarioEngine {
public:
    ScenarioEngine(const DraftCalculator& calculator, const ScenarioConfig& config);

    CalculationResult evaluate(const VentRequest& request,
                               const OperatingScenario& scenario) const;

    ScenarioSet run(const VentRequest& request) const;

private:
    const DraftCalculator& calc_;
    ScenarioConfig config_;

    void checkVelocity(const SegmentResult& seg, const std::string& subject,
                       std::vector<ComplianceWarning>& out) const;
    void checkVentRatings(const VentRequest& request,
                          std::vector<ComplianceWarning>& out) const;
    void checkOutletPressure(const VentRequest& request, const CalculationResult& worst,
                             std::vector<ComplianceWarning>& out) const;
};

} // namespace ventsizer
