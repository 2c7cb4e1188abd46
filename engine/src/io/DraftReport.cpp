#include "io/DraftReport.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ventsizer {

static void writeSegment(std::ostringstream& oss, const std::string& label,
                         const SegmentResult& seg) {
    oss << "  " << label << " (" << std::setprecision(0) << seg.diameter << " in.)\n"
        << std::setprecision(4);
    oss << "    Flow:              " << std::setprecision(1) << seg.cfm << " CFM at "
        << seg.gasTemperature << " F\n";
    oss << "    Velocity:          " << std::setprecision(2) << seg.velocityFps << " ft/s ("
        << std::setprecision(0) << seg.velocityFpm << " ft/min)\n";
    oss << std::setprecision(4);
    oss << "    Theoretical draft: " << seg.theoreticalDraft << " in. w.c.\n";
    oss << "    Velocity pressure: " << seg.loss.velocityPressure << " in. w.c.\n";
    oss << "    Friction f*L/D:    " << seg.loss.frictionTerm << " (f = "
        << seg.loss.baseFrictionFactor << ")  loss " << seg.loss.frictionLoss << "\n";

    for (const auto& item : seg.loss.items) {
        oss << "    " << std::left << std::setw(12) << item.name << std::right
            << std::setw(3) << item.quantity << " x K " << std::setw(6) << item.kEach
            << " = " << std::setw(7) << item.kTotal << "  loss " << item.loss << "\n";
    }
    if (seg.loss.additionalLoss > 0.0) {
        oss << "    Additional loss:   " << seg.loss.additionalLoss << " in. w.c.\n";
    }
    oss << "    Total loss:        " << seg.loss.total << " in. w.c.\n";
    oss << "    Available draft:   " << seg.availableDraft << " in. w.c.\n";
}

std::string DraftReport::formatText(const VentRequest& request, const AnalysisOutcome& outcome) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    oss << "=== Combustion Vent Draft Report ===\n\n";
    oss << "Status: " << analysisStatusName(outcome.status) << "\n\n";

    if (!outcome.issues.empty()) {
        oss << "--- Validation Issues ---\n";
        for (const auto& issue : outcome.issues) {
            oss << "  " << issue.field << ": " << issue.message << "\n";
        }
        return oss.str();
    }

    oss << "Ambient temperature: " << std::setprecision(1)
        << request.ambientTemperature.value_or(std::nan("")) << " F\n";
    oss << "Barometric pressure: " << std::setprecision(2)
        << request.barometricPressure.value_or(std::nan("")) << " in. Hg\n\n";

    oss << "--- Appliances ---\n";
    oss << std::left
        << std::setw(4)  << "#"
        << std::setw(16) << "Name"
        << std::setw(6)  << "Cat"
        << std::setw(13) << "Fuel"
        << std::right
        << std::setw(9)  << "MBH"
        << std::setw(9)  << "Outlet"
        << std::setw(8)  << "CO2%"
        << std::setw(10) << "Flue(F)"
        << "\n";
    oss << std::string(75, '-') << "\n";
    for (size_t i = 0; i < request.appliances.size(); ++i) {
        const auto& a = request.appliances[i];
        oss << std::left
            << std::setw(4)  << (i + 1)
            << std::setw(16) << (a.name().empty() ? "-" : a.name())
            << std::setw(6)  << categoryTag(a.category())
            << std::setw(13) << fuelName(a.fuel())
            << std::right << std::setprecision(1)
            << std::setw(9)  << a.mbh()
            << std::setw(9)  << a.outletDiameter()
            << std::setw(8)  << a.co2Percent()
            << std::setw(10) << a.flueTemperature()
            << "\n";
    }
    oss << "\n" << std::setprecision(4);

    const auto& results = outcome.scenarios.results;
    for (int i = 0; i < static_cast<int>(results.size()); ++i) {
        const auto& r = results[i];
        oss << "--- Scenario " << scenarioName(r.scenario.tag)
            << (i == outcome.scenarios.worstCase ? " (worst case)" : "") << " ---\n";
        oss << "  Active appliances: ";
        for (size_t k = 0; k < r.scenario.active.size(); ++k) {
            oss << (k ? ", " : "") << (r.scenario.active[k] + 1);
        }
        oss << "\n";
        for (const auto& f : r.flow.appliances) {
            oss << "    appliance " << (f.index + 1) << ": M " << f.mFactor
                << ", " << std::setprecision(1) << f.massFlowLbHr << " lb/hr, "
                << f.cfm << " CFM\n" << std::setprecision(4);
        }
        oss << "  Combined: " << std::setprecision(1) << r.flow.totalCfm << " CFM, "
            << r.flow.mixedTemperature << " F mixed\n" << std::setprecision(4);

        writeSegment(oss, r.hasManifold ? "Connector" : "Vent", r.connector);
        if (r.hasManifold) writeSegment(oss, "Manifold", r.manifold);

        oss << "  Theoretical draft: " << r.theoreticalDraft << " in. w.c.\n";
        oss << "  Total loss:        " << r.totalLoss << " in. w.c.\n";
        oss << "  Available draft:   " << r.availableDraft << " in. w.c.\n";
        oss << "  Outlet pressure:   " << r.outletPressure << " in. w.c.\n";
        for (const auto& w : r.warnings) {
            oss << "  WARNING " << w.subject << ": " << w.message << "\n";
        }
        oss << "\n";
    }

    if (!outcome.scenarios.warnings.empty()) {
        oss << "--- Compliance ---\n";
        for (const auto& w : outcome.scenarios.warnings) {
            oss << "  " << warningKindName(w.kind) << " " << w.subject << ": " << w.message << "\n";
        }
        oss << "\n";
    }

    const SelectionResult& sel = outcome.selection;
    oss << "--- Guard Rails ---\n";
    for (const auto& t : sel.guardRails.trail) {
        oss << "  [" << (t.matched ? "x" : " ") << "] " << t.id << "\n";
    }
    oss << "  " << sel.guardRails.rationale << "\n\n";

    oss << "--- Selection (" << selectionStatusName(sel.status) << ") ---\n";
    const InducerSelection& ind = sel.inducer;
    oss << "  Draft inducer: ";
    if (ind.status == SelectionStatus::Selected) {
        oss << ind.model << " (" << ind.series << " series), "
            << ind.deliveredPressure << " in. w.c. at " << std::setprecision(1)
            << ind.requiredCfm << " CFM\n" << std::setprecision(4);
    } else {
        oss << selectionStatusName(ind.status) << "\n";
    }
    if (ind.status != SelectionStatus::NotRequired) {
        oss << "    required " << ind.requiredPressure << " in. w.c. at standard air (deficit "
            << ind.flueDeficit << " x density ratio " << ind.densityRatio << ")\n";
    }

    oss << "  Controller:    "
        << (sel.controller.required ? sel.controller.model + " (" + sel.controller.display + ")" : "none")
        << "\n";

    oss << "  Supply fan:    ";
    if (sel.supplyFan.status == SelectionStatus::Selected) {
        oss << sel.supplyFan.model << " (" << std::setprecision(0) << sel.supplyFan.capacity
            << " CFM rated, " << sel.supplyFan.requiredCfm << " CFM required)\n";
    } else {
        oss << (sel.supplyFan.status == SelectionStatus::NoFit ? "no fit" : "none") << "\n";
    }

    for (const auto& d : sel.barometricDampers) {
        oss << "  " << d.product << " " << std::setprecision(0) << d.size
            << " in. on appliance " << d.appliance << "\n";
    }
    for (const auto& n : sel.notes) {
        oss << "  Note: " << n << "\n";
    }

    return oss.str();
}

std::string DraftReport::formatCsv(const AnalysisOutcome& outcome) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);

    oss << "# Status," << analysisStatusName(outcome.status) << "\n";
    if (outcome.scenarios.worstCase >= 0) {
        oss << "# WorstCase," << scenarioName(outcome.scenarios.worst().scenario.tag) << "\n";
    }
    if (!outcome.selection.guardRails.firedId.empty()) {
        oss << "# GuardRail," << outcome.selection.guardRails.firedId << "\n";
    }
    if (outcome.selection.inducer.status == SelectionStatus::Selected) {
        oss << "# Inducer," << outcome.selection.inducer.model << "\n";
    }
    if (outcome.selection.controller.required) {
        oss << "# Controller," << outcome.selection.controller.model << "\n";
    }

    oss << "Scenario,Segment,Diameter_in,CFM,GasTemp_F,Velocity_fpm,VelocityPressure_inwc,"
           "TheoreticalDraft_inwc,FrictionLoss_inwc,FittingLoss_inwc,TotalLoss_inwc,"
           "AvailableDraft_inwc\n";

    auto row = [&oss](const std::string& scenario, const std::string& segment,
                      const SegmentResult& s) {
        oss << scenario << "," << segment << ","
            << s.diameter << "," << s.cfm << "," << s.gasTemperature << ","
            << s.velocityFpm << "," << s.loss.velocityPressure << ","
            << s.theoreticalDraft << "," << s.loss.frictionLoss << ","
            << s.loss.fittingLoss << "," << s.loss.total << ","
            << s.availableDraft << "\n";
    };

    for (const auto& r : outcome.scenarios.results) {
        std::string name = scenarioName(r.scenario.tag);
        row(name, r.hasManifold ? "connector" : "vent", r.connector);
        if (r.hasManifold) row(name, "manifold", r.manifold);
    }

    return oss.str();
}

} // namespace ventsizer
