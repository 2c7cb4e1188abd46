#include "core/ScenarioEngine.h"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ventsizer {

std::string scenarioName(ScenarioTag tag) {
    switch (tag) {
        case ScenarioTag::All:             return "ALL";
        case ScenarioTag::AllMinusLargest: return "ALL_MINUS_LARGEST";
        case ScenarioTag::SingleLargest:   return "SINGLE_LARGEST";
        case ScenarioTag::SingleSmallest:  return "SINGLE_SMALLEST";
    }
    return "?";
}

std::string warningKindName(WarningKind kind) {
    switch (kind) {
        case WarningKind::VelocityLow:               return "velocity_low";
        case WarningKind::VelocityHigh:              return "velocity_high";
        case WarningKind::VentTypeNotRated:          return "vent_not_rated";
        case WarningKind::OutletPressureTooNegative: return "outlet_too_negative";
        case WarningKind::OutletPressureTooPositive: return "outlet_too_positive";
    }
    return "?";
}

const CalculationResult* ScenarioSet::find(ScenarioTag tag) const {
    for (const auto& r : results) {
        if (r.scenario.tag == tag) return &r;
    }
    return nullptr;
}

static std::string num(double v, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

static int largestIndex(const std::vector<ApplianceSpec>& apps) {
    int best = 0;
    for (int i = 1; i < static_cast<int>(apps.size()); ++i) {
        if (apps[i].mbh() > apps[best].mbh()) best = i;
    }
    return best;
}

static int smallestIndex(const std::vector<ApplianceSpec>& apps) {
    int best = 0;
    for (int i = 1; i < static_cast<int>(apps.size()); ++i) {
        if (apps[i].mbh() < apps[best].mbh()) best = i;
    }
    return best;
}

OperatingScenario resolveScenario(ScenarioTag tag, const std::vector<ApplianceSpec>& appliances) {
    OperatingScenario s{tag, {}};
    const int n = static_cast<int>(appliances.size());
    if (n == 0) return s;

    switch (tag) {
        case ScenarioTag::All:
            for (int i = 0; i < n; ++i) s.active.push_back(i);
            break;
        case ScenarioTag::AllMinusLargest: {
            if (n < 2) break;
            int drop = largestIndex(appliances);
            for (int i = 0; i < n; ++i) {
                if (i != drop) s.active.push_back(i);
            }
            break;
        }
        case ScenarioTag::SingleLargest:
            s.active.push_back(largestIndex(appliances));
            break;
        case ScenarioTag::SingleSmallest:
            s.active.push_back(smallestIndex(appliances));
            break;
    }
    return s;
}

// ── ScenarioEngine ───────────────────────────────────────────────────

// Preconditions validateRequest reports as issues; direct callers get an exception
static void requireCalculable(const VentRequest& request) {
    if (!request.ambientTemperature || !request.barometricPressure) {
        throw std::invalid_argument("Request is missing ambient temperature or barometric pressure");
    }
    const int n = static_cast<int>(request.appliances.size());
    if (request.manifold && (request.connectorAppliance < 0 || request.connectorAppliance >= n)) {
        throw std::invalid_argument("Connector appliance "
            + std::to_string(request.connectorAppliance + 1) + " does not name an appliance");
    }
}

ScenarioEngine::ScenarioEngine(const DraftCalculator& calculator, const ScenarioConfig& config)
    : calc_(calculator), config_(config) {}

CalculationResult ScenarioEngine::evaluate(const VentRequest& request,
                                           const OperatingScenario& scenario) const {
    if (scenario.active.empty()) {
        throw std::invalid_argument("Scenario " + scenarioName(scenario.tag) + " has no active appliances");
    }

    requireCalculable(request);
    const double ambient = *request.ambientTemperature;
    const double baro = *request.barometricPressure;

    CalculationResult r;
    r.scenario = scenario;
    r.flow = calc_.combineFlows(request.appliances, scenario.active, baro);

    if (request.manifold) {
        // Connector carries one appliance: the designated one when it fires,
        // otherwise the largest active appliance.
        int carried = -1;
        for (const auto& f : r.flow.appliances) {
            if (f.index == request.connectorAppliance) carried = f.index;
        }
        if (carried < 0) {
            carried = scenario.active.front();
            for (int idx : scenario.active) {
                if (request.appliances[idx].mbh() > request.appliances[carried].mbh()) carried = idx;
            }
        }
        const ApplianceFlow* cf = nullptr;
        for (const auto& f : r.flow.appliances) {
            if (f.index == carried) cf = &f;
        }
        r.connectorAppliance = carried;
        r.connector = calc_.analyzeSegment(request.connector, cf->cfm, cf->flueTemperature,
                                           ambient, baro);
        r.hasManifold = true;
        r.manifold = calc_.analyzeSegment(*request.manifold, r.flow.totalCfm,
                                          r.flow.mixedTemperature, ambient, baro);
    } else {
        r.connectorAppliance = -1;
        r.connector = calc_.analyzeSegment(request.connector, r.flow.totalCfm,
                                           r.flow.mixedTemperature, ambient, baro);
    }

    r.theoreticalDraft = r.connector.theoreticalDraft;
    r.totalLoss = r.connector.loss.total;
    if (r.hasManifold) {
        r.theoreticalDraft += r.manifold.theoreticalDraft;
        r.totalLoss += r.manifold.loss.total;
    }
    r.availableDraft = r.theoreticalDraft - r.totalLoss;
    r.outletPressure = -r.availableDraft;

    checkVelocity(r.connector, "connector", r.warnings);
    if (r.hasManifold) checkVelocity(r.manifold, "manifold", r.warnings);

    spdlog::debug("{}: {} appliance(s), {:.1f} CFM, available draft {:.4f} in. w.c.",
                  scenarioName(scenario.tag), scenario.active.size(),
                  r.flow.totalCfm, r.availableDraft);
    return r;
}

ScenarioSet ScenarioEngine::run(const VentRequest& request) const {
    requireCalculable(request);
    ScenarioSet set;
    const ScenarioTag tags[] = {
        ScenarioTag::All, ScenarioTag::AllMinusLargest,
        ScenarioTag::SingleLargest, ScenarioTag::SingleSmallest
    };

    for (ScenarioTag tag : tags) {
        OperatingScenario s = resolveScenario(tag, request.appliances);
        if (s.active.empty()) continue;
        set.results.push_back(evaluate(request, s));
    }

    for (int i = 0; i < static_cast<int>(set.results.size()); ++i) {
        if (set.worstCase < 0
            || set.results[i].availableDraft < set.results[set.worstCase].availableDraft) {
            set.worstCase = i;
        }
    }

    checkVentRatings(request, set.warnings);
    if (set.worstCase >= 0) {
        checkOutletPressure(request, set.worst(), set.warnings);
    }

    for (const auto& w : set.warnings) {
        spdlog::warn("{}: {}", w.subject, w.message);
    }
    return set;
}

void ScenarioEngine::checkVelocity(const SegmentResult& seg, const std::string& subject,
                                   std::vector<ComplianceWarning>& out) const {
    if (seg.velocityFpm < config_.minVelocityFpm) {
        out.push_back({WarningKind::VelocityLow, subject,
            "velocity " + num(seg.velocityFpm, 0) + " ft/min is below "
            + num(config_.minVelocityFpm, 0) + " ft/min; condensate may pool instead of draining"});
    } else if (seg.velocityFpm > config_.maxVelocityFpm) {
        out.push_back({WarningKind::VelocityHigh, subject,
            "velocity " + num(seg.velocityFpm, 0) + " ft/min is above "
            + num(config_.maxVelocityFpm, 0) + " ft/min; expect noise and liner erosion"});
    }
}

void ScenarioEngine::checkVentRatings(const VentRequest& request,
                                      std::vector<ComplianceWarning>& out) const {
    CategoryMix mix = summarizeCategories(request.appliances);

    auto check = [&](const VentSegment& seg, const std::string& subject) {
        const FittingLossTable& table = calc_.constants().tableFor(seg.ventType());
        for (ApplianceCategory cat : mix.present) {
            if (!table.isRatedFor(cat)) {
                out.push_back({WarningKind::VentTypeNotRated, subject,
                    ventTypeName(seg.ventType()) + " is not rated for "
                    + categoryName(cat) + " flue gas"});
            }
        }
    };

    // The connector only carries its own appliance when a manifold exists
    if (request.manifold) {
        const auto& app = request.appliances.at(request.connectorAppliance);
        const FittingLossTable& table = calc_.constants().tableFor(request.connector.ventType());
        if (!table.isRatedFor(app.category())) {
            out.push_back({WarningKind::VentTypeNotRated, "connector",
                ventTypeName(request.connector.ventType()) + " is not rated for "
                + categoryName(app.category()) + " flue gas"});
        }
        check(*request.manifold, "manifold");
    } else {
        check(request.connector, "connector");
    }
}

void ScenarioEngine::checkOutletPressure(const VentRequest& request,
                                         const CalculationResult& worst,
                                         std::vector<ComplianceWarning>& out) const {
    for (int idx : worst.scenario.active) {
        const auto& app = request.appliances[idx];
        const CategoryInfo& info = categoryInfo(app.category());
        const std::string subject = "appliance[" + std::to_string(idx + 1) + "]";
        const std::string range = num(info.outletPressureMin, 2) + " to "
            + num(info.outletPressureMax, 2) + " in. w.c.";

        if (worst.outletPressure < info.outletPressureMin) {
            out.push_back({WarningKind::OutletPressureTooNegative, subject,
                "outlet pressure " + num(worst.outletPressure, 4) + " in. w.c. is below the "
                + std::string(info.name) + " range " + range + "; draft control device recommended"});
        } else if (worst.outletPressure > info.outletPressureMax) {
            out.push_back({WarningKind::OutletPressureTooPositive, subject,
                "outlet pressure " + num(worst.outletPressure, 4) + " in. w.c. is above the "
                + std::string(info.name) + " range " + range + "; draft inducer or larger diameter recommended"});
        }
    }
}

} // namespace ventsizer
