#include "core/Appliance.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ventsizer {

namespace {

const CategoryInfo CAT_I    {"Category I",       6.8, 320.0, PressureClass::NonPositive, -0.08, -0.02, false};
const CategoryInfo CAT_II   {"Category II",      8.5, 285.0, PressureClass::NonPositive, -0.08, -0.03, false};
const CategoryInfo CAT_III  {"Category III",     8.0, 320.0, PressureClass::Positive,     0.00,  0.08, false};
const CategoryInfo CAT_IV   {"Category IV",      8.5, 275.0, PressureClass::Positive,    -0.05,  0.25, true};
const CategoryInfo BLDG_HTG {"Building Heating", 8.0, 400.0, PressureClass::NonPositive, -0.10, -0.02, false};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const CategoryInfo& categoryInfo(ApplianceCategory category) {
    switch (category) {
        case ApplianceCategory::CatI:            return CAT_I;
        case ApplianceCategory::CatII:           return CAT_II;
        case ApplianceCategory::CatIII:          return CAT_III;
        case ApplianceCategory::CatIV:           return CAT_IV;
        case ApplianceCategory::BuildingHeating: return BLDG_HTG;
    }
    return CAT_I;
}

std::string categoryName(ApplianceCategory category) {
    return categoryInfo(category).name;
}

std::string categoryTag(ApplianceCategory category) {
    switch (category) {
        case ApplianceCategory::CatI:            return "I";
        case ApplianceCategory::CatII:           return "II";
        case ApplianceCategory::CatIII:          return "III";
        case ApplianceCategory::CatIV:           return "IV";
        case ApplianceCategory::BuildingHeating: return "BH";
    }
    return "?";
}

std::string fuelName(FuelType fuel) {
    switch (fuel) {
        case FuelType::NaturalGas: return "natural_gas";
        case FuelType::Propane:    return "propane";
        case FuelType::Oil:        return "oil";
    }
    return "?";
}

ApplianceCategory parseCategory(const std::string& text) {
    std::string t = lower(text);
    if (t.rfind("cat_", 0) == 0) t = t.substr(4);
    if (t == "i" || t == "1")   return ApplianceCategory::CatI;
    if (t == "ii" || t == "2")  return ApplianceCategory::CatII;
    if (t == "iii" || t == "3") return ApplianceCategory::CatIII;
    if (t == "iv" || t == "4")  return ApplianceCategory::CatIV;
    if (t == "bh" || t == "building_heating") return ApplianceCategory::BuildingHeating;
    throw std::invalid_argument("Unknown appliance category: " + text);
}

FuelType parseFuel(const std::string& text) {
    std::string t = lower(text);
    if (t == "natural_gas" || t == "ng" || t == "gas") return FuelType::NaturalGas;
    if (t == "propane" || t == "lp" || t == "lp_gas" || t == "lpg") return FuelType::Propane;
    if (t == "oil" || t == "fuel_oil") return FuelType::Oil;
    throw std::invalid_argument("Unknown fuel type: " + text);
}

// ── ApplianceSpec ────────────────────────────────────────────────────

ApplianceSpec::ApplianceSpec(double mbh, double outletDiameter, ApplianceCategory category,
                             FuelType fuel)
    : mbh_(mbh), outletDiameter_(outletDiameter), category_(category), fuel_(fuel) {}

ApplianceSpec& ApplianceSpec::withCo2(double co2Percent) {
    co2Override_ = co2Percent;
    return *this;
}

ApplianceSpec& ApplianceSpec::withFlueTemperature(double tempF) {
    flueTempOverride_ = tempF;
    return *this;
}

ApplianceSpec& ApplianceSpec::withName(const std::string& name) {
    name_ = name;
    return *this;
}

double ApplianceSpec::co2Percent() const {
    return co2Override_ ? *co2Override_ : categoryInfo(category_).co2Default;
}

double ApplianceSpec::flueTemperature() const {
    return flueTempOverride_ ? *flueTempOverride_ : categoryInfo(category_).flueTempDefault;
}

CategoryMix summarizeCategories(const std::vector<ApplianceSpec>& appliances) {
    CategoryMix mix;
    for (const auto& app : appliances) {
        if (std::find(mix.present.begin(), mix.present.end(), app.category()) == mix.present.end()) {
            mix.present.push_back(app.category());
        }
    }
    std::sort(mix.present.begin(), mix.present.end());
    mix.mixed = mix.present.size() > 1;
    mix.allCatI = mix.present.size() == 1 && mix.present[0] == ApplianceCategory::CatI;
    mix.allCatIV = mix.present.size() == 1 && mix.present[0] == ApplianceCategory::CatIV;
    return mix;
}

} // namespace ventsizer
