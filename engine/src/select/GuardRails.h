#pragma once

#include "core/AnalysisConfig.h"
#include "core/ScenarioEngine.h"
#include <functional>
#include <string>
#include <vector>

namespace ventsizer {

// Which inducer series the sizing pass may draw from
enum class SeriesFilter {
    Any,
    CondensingRated,
    VariableSpeed
};

std::string seriesFilterName(SeriesFilter filter);

// Facts about the calculated system that the guard rails decide on
struct GuardRailContext {
    CategoryMix mix;
    double worstPressure = 0.0;        // |available draft| of the worst case, in. w.c.
    bool hasTurndown = false;          // ALL_MINUS_LARGEST was evaluated
    double turndownRequirement = 0.0;  // |available draft| of ALL_MINUS_LARGEST, in. w.c.
};

GuardRailContext makeGuardRailContext(const VentRequest& request, const ScenarioSet& scenarios);

// What the sizing pass is allowed to do
struct SelectionPlan {
    bool poweredInducer = true;
    SeriesFilter seriesFilter = SeriesFilter::Any;
    bool excludeConnectorLoss = false;
    bool barometricDampers = false;
    bool overdraftControl = false;
};

struct GuardRail {
    std::string id;
    std::function<bool(const GuardRailContext&)> predicate;
    std::function<void(SelectionPlan&)> action;
    std::string rationale;
};

struct GuardRailTrailEntry {
    std::string id;
    bool matched;
    std::string rationale;
};

struct GuardRailOutcome {
    SelectionPlan plan;
    std::vector<GuardRailTrailEntry> trail;  // every rule evaluated, in order
    int firedRule = -1;                      // index into the rule list, -1 = default plan
    std::string firedId;
    std::string rationale;
};

// Ordered guard-rail table, evaluated top-down, first match wins
class GuardRails {
public:
    static const char* DEFAULT_RATIONALE;

    static std::vector<GuardRail> defaultRules(const SelectionConfig& config);

    explicit GuardRails(const SelectionConfig& config);
    explicit GuardRails(std::vector<GuardRail> rules);

    const std::vector<GuardRail>& rules() const { return rules_; }

    GuardRailOutcome evaluate(const GuardRailContext& ctx) const;

private:
    std::vector<GuardRail> rules_;
};

} // namespace ventsizer
