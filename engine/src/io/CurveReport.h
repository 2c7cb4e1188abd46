#pragma once
#include "select/FanCurve.h"
#include "select/ProductSelector.h"
#include <string>
#include <vector>

namespace ventsizer {

struct OperatingPoint {
    bool found = false;
    double flow = 0.0;      // CFM
    double pressure = 0.0;  // in. w.c.
};

struct CurveResult {
    std::string model;
    std::vector<FanCurvePoint> samples;
    double designFlow = 0.0;
    double designPressure = 0.0;
    double systemK = 0.0;                  // ΔP = k·Q²
    std::vector<FanCurvePoint> systemCurve;
    OperatingPoint operatingPoint;
    std::vector<double> fitCoeffs;         // smoothing polynomial, plotting only
    std::vector<FanCurvePoint> fitted;
};

class CurveReport {
public:
    static constexpr int DEFAULT_FIT_DEGREE = 3;
    static constexpr int DEFAULT_POINTS = 25;

    /// Selected inducer curve against the system resistance curve through
    /// the design point. Throws std::invalid_argument when nothing was selected.
    static CurveResult generate(const InducerSelection& inducer,
                                int fitDegree = DEFAULT_FIT_DEGREE,
                                int points = DEFAULT_POINTS);

    /// Intersection of a sampled fan curve with ΔP = k·Q²
    static OperatingPoint operatingPoint(const std::vector<FanCurvePoint>& curve, double k);

    static std::string formatCsv(const CurveResult& result);
};

} // namespace ventsizer
