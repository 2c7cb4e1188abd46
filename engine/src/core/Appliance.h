#pragma once

#include <string>
#include <vector>
#include <optional>

namespace ventsizer {

enum class ApplianceCategory {
    CatI,
    CatII,
    CatIII,
    CatIV,
    BuildingHeating
};

enum class FuelType {
    NaturalGas,
    Propane,
    Oil
};

// Vent pressure the appliance is listed to operate with
enum class PressureClass {
    NonPositive,
    Positive
};

// Per-category defaults (ANSI Z21.47 / CSA 2.3 classification)
// Outlet pressure range is the static pressure the appliance may see at its
// flue outlet, in. w.c., relative to atmosphere.
struct CategoryInfo {
    const char* name;
    double co2Default;       // %
    double flueTempDefault;  // °F
    PressureClass pressureClass;
    double outletPressureMin; // in. w.c.
    double outletPressureMax; // in. w.c.
    bool condensing;
};

const CategoryInfo& categoryInfo(ApplianceCategory category);

std::string categoryName(ApplianceCategory category);
std::string categoryTag(ApplianceCategory category);   // "I", "II", ..., "BH"
std::string fuelName(FuelType fuel);

// Parse "I".."IV", "BH"/"building_heating"; throws std::invalid_argument
ApplianceCategory parseCategory(const std::string& text);
// Parse "natural_gas"/"ng", "propane"/"lp", "oil"; throws std::invalid_argument
FuelType parseFuel(const std::string& text);

// Combustion appliance connected to the vent system
// CO2 % and flue temperature default to the category values unless overridden.
class ApplianceSpec {
public:
    ApplianceSpec() = default;
    ApplianceSpec(double mbh, double outletDiameter, ApplianceCategory category,
                  FuelType fuel = FuelType::NaturalGas);

    ApplianceSpec& withCo2(double co2Percent);
    ApplianceSpec& withFlueTemperature(double tempF);
    ApplianceSpec& withName(const std::string& name);

    double mbh() const { return mbh_; }
    double outletDiameter() const { return outletDiameter_; }
    ApplianceCategory category() const { return category_; }
    FuelType fuel() const { return fuel_; }
    const std::string& name() const { return name_; }

    double co2Percent() const;
    double flueTemperature() const;
    bool hasCo2Override() const { return co2Override_.has_value(); }
    bool hasFlueTemperatureOverride() const { return flueTempOverride_.has_value(); }

private:
    double mbh_ = 0.0;             // thousand BTU/hr
    double outletDiameter_ = 0.0;  // in
    ApplianceCategory category_ = ApplianceCategory::CatI;
    FuelType fuel_ = FuelType::NaturalGas;
    std::string name_;
    std::optional<double> co2Override_;
    std::optional<double> flueTempOverride_;
};

// Category summary over a set of appliances
struct CategoryMix {
    bool mixed = false;
    bool allCatI = false;
    bool allCatIV = false;
    std::vector<ApplianceCategory> present;  // distinct, in enum order
};

CategoryMix summarizeCategories(const std::vector<ApplianceSpec>& appliances);

} // namespace ventsizer
