#pragma once

#include "core/Appliance.h"
#include <array>
#include <string>
#include <vector>

namespace ventsizer {

enum class VentType {
    UL441,   // Type B gas vent
    UL103,   // factory-built / pressure chimney
    UL1738   // special gas vent (plastic/stainless, condensing)
};

enum class FittingType {
    Elbow90 = 0,
    Elbow45,
    Elbow30,
    Tee,
    TerminationCap
};

constexpr std::size_t FITTING_TYPE_COUNT = 5;

std::string ventTypeName(VentType type);
std::string fittingName(FittingType type);
// Accepts "UL441", "ul103", "UL1738"; throws std::invalid_argument
VentType parseVentType(const std::string& text);
// Accepts "elbow90", "elbow45", "elbow30", "tee", "cap"; throws std::invalid_argument
FittingType parseFittingType(const std::string& text);

// Fitting-loss coefficients for one vent listing standard
// Loss = (f·L/D + ΣK) · ρ·(V/1096.2)²  with D in inches, L in ft
struct FittingLossTable {
    std::array<double, FITTING_TYPE_COUNT> k{};  // indexed by FittingType
    double baseFrictionFactor = 0.3;
    // Appliance categories the listing is rated to vent
    std::vector<ApplianceCategory> ratedCategories;

    double kFactor(FittingType type) const { return k[static_cast<std::size_t>(type)]; }
    void setKFactor(FittingType type, double value) { k[static_cast<std::size_t>(type)] = value; }
    bool isRatedFor(ApplianceCategory category) const;
};

// Published coefficients for each standard (K-value sheet per listing)
FittingLossTable defaultFittingLossTable(VentType type);

} // namespace ventsizer
