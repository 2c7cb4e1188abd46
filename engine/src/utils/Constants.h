#pragma once

namespace ventsizer {

// Unit conversion and fixed physical constants (US customary units)
constexpr double PI = 3.14159265358979323846;
constexpr double RANKINE_OFFSET = 459.67;        // °F → °R
constexpr double INCHES_PER_FOOT = 12.0;
constexpr double SECONDS_PER_MINUTE = 60.0;
constexpr double MINUTES_PER_HOUR = 60.0;

// Sea-level standard atmosphere
constexpr double STD_BAROMETRIC_INHG = 29.92;    // in. Hg
constexpr double STD_PRESSURE_LBF_FT2 = 2116.2;  // lbf/ft² (14.7 psia)

// Elevation → barometric pressure (standard atmosphere fit, h in ft)
constexpr double ELEVATION_LAPSE_PER_FT = 6.87535e-6;
constexpr double ELEVATION_EXPONENT = 5.2561;

// Supported request domain
constexpr int MIN_APPLIANCES = 1;
constexpr int MAX_APPLIANCES = 6;
constexpr double MIN_BAROMETRIC_INHG = 15.0;
constexpr double MAX_BAROMETRIC_INHG = 32.0;
constexpr double MAX_CO2_PERCENT = 20.0;

} // namespace ventsizer
