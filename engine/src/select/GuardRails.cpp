#include "select/GuardRails.h"
#include <spdlog/spdlog.h>
#include <cmath>

namespace ventsizer {

std::string seriesFilterName(SeriesFilter filter) {
    switch (filter) {
        case SeriesFilter::Any:             return "any";
        case SeriesFilter::CondensingRated: return "condensing-rated";
        case SeriesFilter::VariableSpeed:   return "variable-speed";
    }
    return "?";
}

GuardRailContext makeGuardRailContext(const VentRequest& request, const ScenarioSet& scenarios) {
    GuardRailContext ctx;
    ctx.mix = summarizeCategories(request.appliances);
    if (scenarios.worstCase >= 0) {
        ctx.worstPressure = std::fabs(scenarios.worst().availableDraft);
    }
    if (const CalculationResult* turndown = scenarios.find(ScenarioTag::AllMinusLargest)) {
        ctx.hasTurndown = true;
        ctx.turndownRequirement = std::fabs(turndown->availableDraft);
    }
    return ctx;
}

const char* GuardRails::DEFAULT_RATIONALE =
    "No guard rail applies: powered inducer from any series, standard sizing.";

std::vector<GuardRail> GuardRails::defaultRules(const SelectionConfig& config) {
    const double catIVThreshold = config.catIVPressureThreshold;
    const double turndownLimit = config.fixedSpeedTurndownLimit;

    std::vector<GuardRail> rules;

    rules.push_back({
        "mixed-categories",
        [](const GuardRailContext& c) { return c.mix.mixed; },
        [](SelectionPlan& p) {
            p.poweredInducer = true;
            p.barometricDampers = false;
        },
        "Mixed appliance categories share the vent: a powered draft inducer is "
        "required regardless of natural-draft margin."
    });

    rules.push_back({
        "cat4-low-pressure",
        [catIVThreshold](const GuardRailContext& c) {
            return c.mix.allCatIV && c.worstPressure < catIVThreshold;
        },
        [](SelectionPlan& p) {
            p.poweredInducer = true;
            p.seriesFilter = SeriesFilter::CondensingRated;
        },
        "All Category IV with low operating pressure: inducer restricted to "
        "condensing-rated series."
    });

    rules.push_back({
        "cat4-positive-pressure",
        [catIVThreshold](const GuardRailContext& c) {
            return c.mix.allCatIV && c.worstPressure >= catIVThreshold;
        },
        [](SelectionPlan& p) {
            p.poweredInducer = true;
            p.excludeConnectorLoss = true;
        },
        "All Category IV positive-pressure system: connector loss excluded from "
        "the inducer pressure requirement."
    });

    rules.push_back({
        "cat1-barometric",
        [](const GuardRailContext& c) { return c.mix.allCatI; },
        [](SelectionPlan& p) {
            p.poweredInducer = false;
            p.barometricDampers = true;
        },
        "All Category I: barometric damper on each appliance, no powered inducer."
    });

    rules.push_back({
        "turndown-overdraft",
        [turndownLimit](const GuardRailContext& c) {
            return c.hasTurndown && c.turndownRequirement > turndownLimit;
        },
        [](SelectionPlan& p) {
            p.poweredInducer = true;
            p.seriesFilter = SeriesFilter::VariableSpeed;
            p.overdraftControl = true;
        },
        "Turndown pressure requirement exceeds a fixed-speed inducer: variable-speed "
        "series with overdraft control required."
    });

    return rules;
}

GuardRails::GuardRails(const SelectionConfig& config)
    : rules_(defaultRules(config)) {}

GuardRails::GuardRails(std::vector<GuardRail> rules)
    : rules_(std::move(rules)) {}

GuardRailOutcome GuardRails::evaluate(const GuardRailContext& ctx) const {
    GuardRailOutcome out;

    for (int i = 0; i < static_cast<int>(rules_.size()); ++i) {
        const GuardRail& rule = rules_[i];
        bool matched = rule.predicate(ctx);
        out.trail.push_back({rule.id, matched, rule.rationale});
        spdlog::debug("guard rail {}: {}", rule.id, matched ? "match" : "no match");
        if (matched) {
            rule.action(out.plan);
            out.firedRule = i;
            out.firedId = rule.id;
            out.rationale = rule.rationale;
            spdlog::info("Guard rail {} fired: {}", rule.id, rule.rationale);
            return out;
        }
    }

    out.rationale = DEFAULT_RATIONALE;
    spdlog::info("{}", DEFAULT_RATIONALE);
    return out;
}

} // namespace ventsizer
