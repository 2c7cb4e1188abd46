#pragma once
#include "core/VentRequest.h"
#include <string>

namespace ventsizer {

/// Vent calculation request file, one entry per line:
///
///   ambient 70
///   elevation 5280                 # or: barometric 29.92
///   appliance mbh=400 outlet=6 category=I fuel=natural_gas co2=7.5 flue_temp=350 name=B1
///   connector diameter=8 length=12 rise=4 vent=UL441 elbow90=2 tee=1 cap=0 additional_k=0.5
///   manifold diameter=14 length=40 rise=30 vent=UL441 cap=1
///   connector_appliance 2          # 1-based
///   prefer touchscreen=1 inducer=TRV supply_air=1 combustion_air_cfm=800
///
/// Syntax errors throw std::runtime_error; out-of-range values are left for
/// validateRequest() to report.
class RequestReader {
public:
    static VentRequest readFromFile(const std::string& filepath);
    static VentRequest readFromString(const std::string& content);
};

} // namespace ventsizer
