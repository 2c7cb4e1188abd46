#pragma once

#include <string>
#include <vector>

namespace ventsizer {

// One published fan-curve sample at standard air (70 °F)
struct FanCurvePoint {
    double flow;      // CFM
    double pressure;  // in. w.c. static

    FanCurvePoint() : flow(0.0), pressure(0.0) {}
    FanCurvePoint(double q, double p) : flow(q), pressure(p) {}
};

struct CurveLookup {
    bool inDomain = false;
    double pressure = 0.0;  // valid only when inDomain
};

// Piecewise-linear interpolation over samples sorted by flow
// Outside [first.flow, last.flow] the lookup is out of domain; there is no
// clamping and no extrapolation.
CurveLookup interpolateCurve(const std::vector<FanCurvePoint>& points, double flow);

// Sampled pressure/flow curve of one fan model
// Samples must be strictly increasing in flow (at least two of them).
class FanCurve {
public:
    FanCurve() = default;
    FanCurve(const std::string& modelId, const std::vector<FanCurvePoint>& points);

    const std::string& modelId() const { return modelId_; }
    const std::vector<FanCurvePoint>& points() const { return points_; }

    double minFlow() const { return points_.front().flow; }
    double maxFlow() const { return points_.back().flow; }
    double shutoffPressure() const { return points_.front().pressure; }

    bool inDomain(double flow) const;
    CurveLookup pressureAt(double flow) const { return interpolateCurve(points_, flow); }

    // Least-squares polynomial ΔP = c0 + c1·Q + c2·Q² + ..., for plotting only
    std::vector<double> fitPolynomial(int degree) const;

private:
    std::string modelId_;
    std::vector<FanCurvePoint> points_;
};

// Evaluate c0 + c1·x + c2·x² + ...
double evalPolynomial(const std::vector<double>& coeffs, double x);

} // namespace ventsizer
