#pragma once

#include "core/Appliance.h"
#include "core/DraftConstants.h"
#include "elements/VentSegment.h"
#include <string>
#include <vector>

namespace ventsizer {

// Flue gas flow produced by one appliance
struct ApplianceFlow {
    int index;              // position in the request's appliance list
    double mFactor;         // lb products per 1000 BTU
    double massFlowLbHr;
    double massFlowLbMin;
    double flueTemperature; // °F
    double density;         // lbm/ft³ at flue temperature
    double cfm;
};

// Combined flow of a set of appliances discharging into one segment
// Mixed temperature is the mass-weighted mean of absolute temperatures
// (adiabatic mixing at constant cp), so totalCfm equals the sum of the
// individual volumetric flows.
struct CombinedFlow {
    std::vector<ApplianceFlow> appliances;
    double totalMassFlowLbMin = 0.0;
    double totalCfm = 0.0;
    double mixedTemperature = 0.0;  // °F
    double mixedDensity = 0.0;      // lbm/ft³
};

struct LossItem {
    std::string name;   // fitting name, "cap" or "additional"
    int quantity;
    double kEach;
    double kTotal;
    double loss;        // in. w.c.
};

struct LossBreakdown {
    double baseFrictionFactor = 0.0;
    double frictionTerm = 0.0;      // f·L/D
    double frictionLoss = 0.0;      // in. w.c.
    double sumK = 0.0;
    double fittingLoss = 0.0;       // in. w.c.
    double additionalLoss = 0.0;    // in. w.c., fixed, independent of velocity
    double velocityPressure = 0.0;  // in. w.c.
    double total = 0.0;             // in. w.c.
    std::vector<LossItem> items;
};

// Steady-state result for one vent segment at one flow
struct SegmentResult {
    double diameter = 0.0;          // in
    double cfm = 0.0;
    double gasTemperature = 0.0;    // °F
    double density = 0.0;           // lbm/ft³
    double velocityFps = 0.0;
    double velocityFpm = 0.0;
    double theoreticalDraft = 0.0;  // in. w.c.
    LossBreakdown loss;
    double availableDraft = 0.0;    // in. w.c., theoretical − loss
};

struct DiameterOption {
    double diameter;
    double velocityFps;
    double pressureLoss;
    double availableDraft;
    bool meetsRequirement;
};

struct DiameterSelection {
    bool found = false;
    double diameter = 0.0;
    std::vector<DiameterOption> options;
};

// Convert site elevation (ft) to barometric pressure (in. Hg)
double barometricPressureFromElevation(double elevationFt);

// Draft, flow and loss equations for combustion vents
// Stateless apart from the constants block; every method is a pure function.
class DraftCalculator {
public:
    static const std::vector<double>& standardDiameters();

    DraftCalculator() = default;
    explicit DraftCalculator(const DraftConstants& constants);

    const DraftConstants& constants() const { return constants_; }

    // Ideal-gas density, barometric-corrected (lbm/ft³)
    double gasDensity(double tempF, double barometric) const;

    // Flue products per 1000 BTU for a fuel at a measured CO2 %
    double mFactor(FuelType fuel, double co2Percent) const;

    ApplianceFlow applianceFlow(const ApplianceSpec& appliance, int index,
                                double barometric) const;

    CombinedFlow combineFlows(const std::vector<ApplianceSpec>& appliances,
                              const std::vector<int>& active,
                              double barometric) const;

    static double velocityFps(double cfm, double diameter);

    // ρ·(V/1096.2)², in. w.c.
    double velocityPressure(double velocityFpm, double density) const;

    // Stack effect over a rise, in. w.c.
    double theoreticalDraft(double rise, double flueTempF, double ambientTempF,
                            double barometric) const;

    LossBreakdown pressureLoss(const VentSegment& segment, double velocityFpm,
                               double density) const;

    SegmentResult analyzeSegment(const VentSegment& segment, double cfm,
                                 double gasTempF, double ambientTempF,
                                 double barometric) const;

    // Smallest standard diameter whose available draft reaches minAvailableDraft
    DiameterSelection selectDiameter(const VentSegment& segment, double cfm,
                                     double gasTempF, double ambientTempF,
                                     double barometric,
                                     double minAvailableDraft) const;

private:
    DraftConstants constants_;
};

} // namespace ventsizer
