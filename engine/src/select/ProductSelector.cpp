#include "select/ProductSelector.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace ventsizer {

std::string selectionStatusName(SelectionStatus status) {
    switch (status) {
        case SelectionStatus::Selected:    return "selected";
        case SelectionStatus::NotRequired: return "not_required";
        case SelectionStatus::NoFit:       return "no_fit";
    }
    return "?";
}

std::string SubsystemSet::suffix() const {
    std::string s;
    if (overdraftControl) s += 'O';
    if (supplyAir) s += 'P';
    if (poweredInducer) s += 'V';
    return s;
}

const char* ProductSelector::BAROMETRIC_DAMPER_PRODUCT = "KW Barometric Damper";

const std::vector<ControllerRule>& ProductSelector::controllerTable() {
    static const std::vector<ControllerRule> table = {
        // touchscreen
        {1, 4, true,  false, "V300"},
        {5, 6, true,  true,  "V350"},
        {5, 6, true,  false, "V250"},
        // LCD
        {1, 1, false, false, "H100"},
        {2, 2, false, false, "V150"},
        {3, 6, false, false, "V250", true},
    };
    return table;
}

ProductSelector::ProductSelector(CatalogPtr catalog, const DraftCalculator& calculator,
                                 const SelectionConfig& config)
    : catalog_(std::move(catalog)), calc_(calculator), config_(config), rails_(config)
{
    if (!catalog_) {
        throw std::invalid_argument("ProductSelector: catalog must not be null");
    }
}

bool ProductSelector::passesFilter(const FanSeries& series, SeriesFilter filter) const {
    if (series.kind != FanKind::Inducer) return false;
    switch (filter) {
        case SeriesFilter::Any:             return true;
        case SeriesFilter::CondensingRated: return series.condensingRated;
        case SeriesFilter::VariableSpeed:   return series.variableSpeed;
    }
    return false;
}

bool ProductSelector::trySeries(const FanSeries& series, double requiredCfm,
                                double requiredPressure, InducerSelection& out) const {
    for (const FanModel* m : catalog_->seriesModels(series.id)) {
        CurveLookup look = m->curve.pressureAt(requiredCfm);
        bool ok = look.inDomain && look.pressure >= requiredPressure;
        out.candidates.push_back({m->id, series.id, look.inDomain, look.pressure, ok});
        spdlog::debug("  {} @ {:.1f} CFM: {}", m->id, requiredCfm,
                      look.inDomain ? std::to_string(look.pressure) : std::string("out of domain"));
        if (ok) {
            out.status = SelectionStatus::Selected;
            out.model = m->id;
            out.series = series.id;
            out.curve = m->curve.points();
            out.deliveredPressure = look.pressure;
            return true;
        }
    }
    return false;
}

InducerSelection ProductSelector::selectInducer(double requiredCfm, double requiredPressure,
                                                SeriesFilter filter,
                                                const std::string& preferredSeries) const {
    InducerSelection out;
    out.requiredCfm = requiredCfm;
    out.requiredPressure = requiredPressure;

    spdlog::debug("Sizing inducer for {:.1f} CFM at {:.4f} in. w.c. ({} series)",
                  requiredCfm, requiredPressure, seriesFilterName(filter));

    if (!preferredSeries.empty()) {
        const FanSeries* pref = catalog_->findSeries(preferredSeries);
        if (!pref) {
            out.note = "Preferred series " + preferredSeries + " is not in the catalog.";
        } else if (!passesFilter(*pref, filter)) {
            out.note = "Preferred series " + preferredSeries + " is not allowed ("
                + seriesFilterName(filter) + " inducer required).";
        } else if (trySeries(*pref, requiredCfm, requiredPressure, out)) {
            out.preferenceHonored = true;
            return out;
        } else {
            out.note = "Preferred series " + preferredSeries + " has no model that fits.";
        }
        if (!out.note.empty()) spdlog::info("{}", out.note);
    }

    for (const FanSeries* s : catalog_->seriesByPriority(FanKind::Inducer)) {
        if (s->id == preferredSeries) continue;
        if (!passesFilter(*s, filter)) continue;
        if (trySeries(*s, requiredCfm, requiredPressure, out)) {
            spdlog::info("Selected inducer {} ({} series)", out.model, out.series);
            return out;
        }
    }

    out.status = SelectionStatus::NoFit;
    spdlog::warn("No {} inducer covers {:.1f} CFM at {:.4f} in. w.c.",
                 seriesFilterName(filter), requiredCfm, requiredPressure);
    return out;
}

ControllerSelection ProductSelector::selectController(int applianceCount,
                                                      const SubsystemSet& subsystems,
                                                      bool touchscreen) const {
    ControllerSelection out;
    if (subsystems.empty()) return out;

    const bool all = subsystems.count() == 3;
    for (const auto& row : controllerTable()) {
        if (applianceCount < row.minAppliances || applianceCount > row.maxAppliances) continue;
        if (row.touchscreen != touchscreen) continue;
        if (row.needsAllSubsystems && !all) continue;
        out.required = true;
        out.baseModel = row.baseModel;
        out.suffix = subsystems.suffix();
        out.model = out.baseModel + "-" + out.suffix;
        out.touchscreen = touchscreen || row.forcedTouchscreen;
        if (row.forcedTouchscreen && !touchscreen) {
            out.display = "touchscreen (required for 3+ appliances)";
        } else {
            out.display = touchscreen ? "touchscreen" : "LCD";
        }
        return out;
    }
    throw std::out_of_range("No controller row for " + std::to_string(applianceCount) + " appliances");
}

bool ProductSelector::trySupplySeries(const FanSeries& series, double requiredCfm,
                                      SupplyFanSelection& out) const {
    for (const FanModel* m : catalog_->seriesModels(series.id)) {
        if (m->capacity() >= requiredCfm) {
            out.status = SelectionStatus::Selected;
            out.model = m->id;
            out.series = series.id;
            out.capacity = m->capacity();
            spdlog::info("Selected supply fan {} ({:.0f} CFM rated)", out.model, out.capacity);
            return true;
        }
    }
    return false;
}

SupplyFanSelection ProductSelector::selectSupplyFan(double requiredCfm,
                                                    const std::string& preferredSeries) const {
    SupplyFanSelection out;
    out.requiredCfm = requiredCfm;

    if (!preferredSeries.empty()) {
        const FanSeries* pref = catalog_->findSeries(preferredSeries);
        if (!pref) {
            out.note = "Preferred supply series " + preferredSeries + " is not in the catalog.";
        } else if (pref->kind != FanKind::Supply) {
            out.note = "Preferred supply series " + preferredSeries + " is not a supply fan.";
        } else if (trySupplySeries(*pref, requiredCfm, out)) {
            out.preferenceHonored = true;
            return out;
        } else {
            out.note = "Preferred supply series " + preferredSeries + " has no model large enough.";
        }
        spdlog::info("{}", out.note);
    }

    for (const FanSeries* s : catalog_->seriesByPriority(FanKind::Supply)) {
        if (s->id == preferredSeries) continue;
        if (trySupplySeries(*s, requiredCfm, out)) return out;
    }

    out.status = SelectionStatus::NoFit;
    spdlog::warn("No supply fan delivers {:.1f} CFM", requiredCfm);
    return out;
}

std::vector<BarometricDamper> ProductSelector::barometricDampers(const std::vector<ApplianceSpec>& appliances) {
    std::vector<BarometricDamper> out;
    for (int i = 0; i < static_cast<int>(appliances.size()); ++i) {
        if (appliances[i].category() == ApplianceCategory::CatI) {
            out.push_back({i + 1, appliances[i].outletDiameter(), BAROMETRIC_DAMPER_PRODUCT});
        }
    }
    return out;
}

double ProductSelector::combustionAirCfm(const VentRequest& request,
                                         const ScenarioSet& scenarios) const {
    if (request.preferences.combustionAirCfm) return *request.preferences.combustionAirCfm;

    const CalculationResult* all = scenarios.find(ScenarioTag::All);
    if (!all) all = &scenarios.worst();
    double airDensity = calc_.gasDensity(request.ambientTemperature.value(),
                                       request.barometricPressure.value());
    return all->flow.totalMassFlowLbMin / airDensity;
}

SelectionResult ProductSelector::select(const VentRequest& request,
                                        const ScenarioSet& scenarios) const {
    SelectionResult out;
    out.guardRails = rails_.evaluate(makeGuardRailContext(request, scenarios));
    const SelectionPlan& plan = out.guardRails.plan;
    const CalculationResult& worst = scenarios.worst();

    if (plan.poweredInducer) {
        double avail = worst.availableDraft;
        double excluded = 0.0;
        if (plan.excludeConnectorLoss && worst.hasManifold) {
            excluded = worst.connector.loss.total;
            avail += excluded;
        }
        double deficit = std::max(0.0, -avail);

        const double baro = request.barometricPressure.value();
        double ratio = calc_.gasDensity(config_.standardAirTemperature, baro)
                     / calc_.gasDensity(worst.flow.mixedTemperature, baro);

        out.inducer = selectInducer(worst.flow.totalCfm, deficit * ratio, plan.seriesFilter,
                                    request.preferences.preferredInducerSeries);
        out.inducer.flueDeficit = deficit;
        out.inducer.connectorLossExcluded = excluded;
        out.inducer.densityRatio = ratio;

        if (excluded > 0.0) {
            out.notes.push_back("Connector loss of " + std::to_string(excluded)
                + " in. w.c. removed from the inducer requirement.");
        }
        if (!out.inducer.note.empty()) out.notes.push_back(out.inducer.note);
    }

    if (plan.barometricDampers) {
        out.barometricDampers = barometricDampers(request.appliances);
    }

    out.subsystems.poweredInducer = plan.poweredInducer;
    out.subsystems.overdraftControl = plan.overdraftControl;
    out.subsystems.supplyAir = request.preferences.supplyAir;

    if (request.preferences.supplyAir) {
        out.supplyFan = selectSupplyFan(combustionAirCfm(request, scenarios),
                                        request.preferences.preferredSupplySeries);
        if (!out.supplyFan.note.empty()) out.notes.push_back(out.supplyFan.note);
    }

    out.controller = selectController(static_cast<int>(request.appliances.size()),
                                      out.subsystems, request.preferences.touchscreen);

    if (out.inducer.status == SelectionStatus::NoFit
        || out.supplyFan.status == SelectionStatus::NoFit) {
        out.status = SelectionStatus::NoFit;
    }
    return out;
}

} // namespace ventsizer
