#pragma once

#include "core/AnalysisConfig.h"
#include "core/DraftCalculator.h"
#include "core/ScenarioEngine.h"
#include "core/VentRequest.h"
#include "select/FanCurveCatalog.h"
#include "select/GuardRails.h"
#include <string>
#include <vector>

namespace ventsizer {

enum class SelectionStatus {
    Selected,
    NotRequired,
    NoFit
};

std::string selectionStatusName(SelectionStatus status);

// One catalog model tried by the inducer sizing pass
struct InducerCandidate {
    std::string model;
    std::string series;
    bool inDomain;
    double pressure;    // interpolated at the required flow, 0 when out of domain
    bool accepted;
};

struct InducerSelection {
    SelectionStatus status = SelectionStatus::NotRequired;
    std::string model;
    std::string series;
    std::vector<FanCurvePoint> curve;       // samples of the selected model
    double requiredCfm = 0.0;
    double flueDeficit = 0.0;               // max(0, −available draft) after exclusions
    double connectorLossExcluded = 0.0;
    double densityRatio = 1.0;              // ρ(standard air) / ρ(mixed flue gas)
    double requiredPressure = 0.0;          // at standard air, in. w.c.
    double deliveredPressure = 0.0;         // interpolated at requiredCfm
    bool preferenceHonored = false;
    std::vector<InducerCandidate> candidates;
    std::string note;
};

// Subsystems a controller has to drive
struct SubsystemSet {
    bool overdraftControl = false;  // O
    bool supplyAir = false;         // P
    bool poweredInducer = false;    // V

    bool empty() const { return !overdraftControl && !supplyAir && !poweredInducer; }
    int count() const { return int(overdraftControl) + int(supplyAir) + int(poweredInducer); }
    std::string suffix() const;     // letters in the order O, P, V
};

struct ControllerSelection {
    bool required = false;
    std::string baseModel;
    std::string suffix;
    std::string model;      // base + "-" + suffix
    std::string display;    // "touchscreen", "LCD", or the forced-touchscreen note
    bool touchscreen = false;
};

// Row of the controller lookup table; first matching row wins
struct ControllerRule {
    int minAppliances;
    int maxAppliances;
    bool touchscreen;
    bool needsAllSubsystems;   // row applies only when O, P and V are all active
    std::string baseModel;
    bool forcedTouchscreen = false;  // LCD requested but the model only ships with a touchscreen
};

struct SupplyFanSelection {
    SelectionStatus status = SelectionStatus::NotRequired;
    std::string model;
    std::string series;
    double requiredCfm = 0.0;
    double capacity = 0.0;
    bool preferenceHonored = false;
    std::string note;
};

struct BarometricDamper {
    int appliance;          // 1-based, input order
    double size;            // in, matches the appliance outlet
    std::string product;
};

struct SelectionResult {
    SelectionStatus status = SelectionStatus::Selected;  // NoFit if any sizing failed
    GuardRailOutcome guardRails;
    InducerSelection inducer;
    SubsystemSet subsystems;
    ControllerSelection controller;
    SupplyFanSelection supplyFan;
    std::vector<BarometricDamper> barometricDampers;
    std::vector<std::string> notes;
};

// Chooses catalog hardware for a calculated vent system
class ProductSelector {
public:
    static const std::vector<ControllerRule>& controllerTable();
    static const char* BAROMETRIC_DAMPER_PRODUCT;

    ProductSelector(CatalogPtr catalog, const DraftCalculator& calculator,
                    const SelectionConfig& config);

    const FanCurveCatalog& catalog() const { return *catalog_; }
    const GuardRails& guardRails() const { return rails_; }

    // Smallest acceptable inducer for a flow at a standard-air pressure
    InducerSelection selectInducer(double requiredCfm, double requiredPressure,
                                   SeriesFilter filter,
                                   const std::string& preferredSeries = "") const;

    ControllerSelection selectController(int applianceCount, const SubsystemSet& subsystems,
                                         bool touchscreen) const;

    // First supply fan, preferred series first, whose capacity covers the flow
    SupplyFanSelection selectSupplyFan(double requiredCfm,
                                       const std::string& preferredSeries = "") const;

    static std::vector<BarometricDamper> barometricDampers(const std::vector<ApplianceSpec>& appliances);

    // Combustion air the supply fan must deliver, CFM at ambient air density
    double combustionAirCfm(const VentRequest& request, const ScenarioSet& scenarios) const;

    SelectionResult select(const VentRequest& request, const ScenarioSet& scenarios) const;

private:
    CatalogPtr catalog_;
    const DraftCalculator& calc_;
    SelectionConfig config_;
    GuardRails rails_;

    bool passesFilter(const FanSeries& series, SeriesFilter filter) const;
    bool trySeries(const FanSeries& series, double requiredCfm, double requiredPressure,
                   InducerSelection& out) const;
    bool trySupplySeries(const FanSeries& series, double requiredCfm,
                         SupplyFanSelection& out) const;
};

} // namespace ventsizer
