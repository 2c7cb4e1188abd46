#pragma once

#include "core/Appliance.h"
#include "elements/FittingLossTable.h"
#include "utils/Constants.h"
#include <array>

namespace ventsizer {

// Flue products per 1000 BTU input: M = scale · (base + co2Term / CO2%)
struct CombustionCoefficients {
    double scale;
    double base;
    double co2Term;
};

// Formula constants for the draft and loss equations
// Defaults follow the ASHRAE chimney chapter; every value can be overridden
// through ConfigReader without touching the calculator.
struct DraftConstants {
    double draftCoefficient = 0.2554;          // D = C·B·H·(1/To − 1/Tm)
    double velocityPressureDivisor = 1096.2;   // VP = ρ·(V/C)², V in ft/min
    double gasConstant = 53.35;                // ft·lbf/(lbm·°R)
    double referencePressure = STD_PRESSURE_LBF_FT2;
    double referenceBarometric = STD_BAROMETRIC_INHG;

    std::array<CombustionCoefficients, 3> combustion{{
        {0.705, 0.159, 10.72},  // natural gas
        {0.704, 0.144, 12.61},  // propane
        {0.720, 0.120, 14.40}   // #2 oil
    }};

    std::array<FittingLossTable, 3> ventTables{{
        defaultFittingLossTable(VentType::UL441),
        defaultFittingLossTable(VentType::UL103),
        defaultFittingLossTable(VentType::UL1738)
    }};

    const CombustionCoefficients& combustionFor(FuelType fuel) const {
        return combustion[static_cast<std::size_t>(fuel)];
    }
    CombustionCoefficients& combustionFor(FuelType fuel) {
        return combustion[static_cast<std::size_t>(fuel)];
    }
    const FittingLossTable& tableFor(VentType type) const {
        return ventTables[static_cast<std::size_t>(type)];
    }
    FittingLossTable& tableFor(VentType type) {
        return ventTables[static_cast<std::size_t>(type)];
    }
};

} // namespace ventsizer
