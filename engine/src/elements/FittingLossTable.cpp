#include "elements/FittingLossTable.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ventsizer {

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string ventTypeName(VentType type) {
    switch (type) {
        case VentType::UL441:  return "UL441";
        case VentType::UL103:  return "UL103";
        case VentType::UL1738: return "UL1738";
    }
    return "?";
}

std::string fittingName(FittingType type) {
    switch (type) {
        case FittingType::Elbow90:        return "elbow90";
        case FittingType::Elbow45:        return "elbow45";
        case FittingType::Elbow30:        return "elbow30";
        case FittingType::Tee:            return "tee";
        case FittingType::TerminationCap: return "cap";
    }
    return "?";
}

VentType parseVentType(const std::string& text) {
    std::string t = upper(text);
    if (t == "UL441")  return VentType::UL441;
    if (t == "UL103")  return VentType::UL103;
    if (t == "UL1738") return VentType::UL1738;
    throw std::invalid_argument("Unknown vent type: " + text);
}

FittingType parseFittingType(const std::string& text) {
    std::string t = upper(text);
    if (t == "ELBOW90") return FittingType::Elbow90;
    if (t == "ELBOW45") return FittingType::Elbow45;
    if (t == "ELBOW30") return FittingType::Elbow30;
    if (t == "TEE")     return FittingType::Tee;
    if (t == "CAP")     return FittingType::TerminationCap;
    throw std::invalid_argument("Unknown fitting type: " + text);
}

bool FittingLossTable::isRatedFor(ApplianceCategory category) const {
    return std::find(ratedCategories.begin(), ratedCategories.end(), category)
        != ratedCategories.end();
}

FittingLossTable defaultFittingLossTable(VentType type) {
    FittingLossTable t;
    switch (type) {
        case VentType::UL441:
            t.setKFactor(FittingType::Elbow90, 0.75);
            t.setKFactor(FittingType::Elbow45, 0.25);
            t.setKFactor(FittingType::Elbow30, 0.12);
            t.setKFactor(FittingType::Tee, 1.25);
            t.setKFactor(FittingType::TerminationCap, 0.50);
            t.baseFrictionFactor = 0.40;
            // Type B: non-positive, non-condensing gas appliances only
            t.ratedCategories = {ApplianceCategory::CatI};
            break;
        case VentType::UL103:
            t.setKFactor(FittingType::Elbow90, 0.30);
            t.setKFactor(FittingType::Elbow45, 0.15);
            t.setKFactor(FittingType::Elbow30, 0.12);
            t.setKFactor(FittingType::Tee, 1.25);
            t.setKFactor(FittingType::TerminationCap, 0.50);
            t.baseFrictionFactor = 0.30;
            // Pressure chimney: positive pressure allowed, not condensate-rated
            t.ratedCategories = {ApplianceCategory::CatI, ApplianceCategory::CatIII,
                                 ApplianceCategory::BuildingHeating};
            break;
        case VentType::UL1738:
            t.setKFactor(FittingType::Elbow90, 0.30);
            t.setKFactor(FittingType::Elbow45, 0.15);
            t.setKFactor(FittingType::Elbow30, 0.12);
            t.setKFactor(FittingType::Tee, 1.25);
            t.setKFactor(FittingType::TerminationCap, 0.50);
            t.baseFrictionFactor = 0.27;
            t.ratedCategories = {ApplianceCategory::CatI, ApplianceCategory::CatII,
                                 ApplianceCategory::CatIII, ApplianceCategory::CatIV};
            break;
    }
    return t;
}

} // namespace ventsizer
