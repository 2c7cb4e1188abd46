#include "io/CurveReport.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ventsizer {

OperatingPoint CurveReport::operatingPoint(const std::vector<FanCurvePoint>& curve, double k) {
    OperatingPoint op;
    if (curve.size() < 2) return op;

    auto excess = [k](const FanCurvePoint& p) { return p.pressure - k * p.flow * p.flow; };

    for (size_t i = 0; i + 1 < curve.size(); ++i) {
        const FanCurvePoint& a = curve[i];
        const FanCurvePoint& b = curve[i + 1];
        double fa = excess(a);
        double fb = excess(b);
        if (fa < 0.0 || fb > 0.0) continue;

        // Bisection on the linear fan segment; the system curve is monotone
        double lo = a.flow, hi = b.flow;
        for (int iter = 0; iter < 60; ++iter) {
            double mid = 0.5 * (lo + hi);
            double alpha = (mid - a.flow) / (b.flow - a.flow);
            double fan = a.pressure * (1.0 - alpha) + b.pressure * alpha;
            if (fan - k * mid * mid > 0.0) lo = mid;
            else hi = mid;
        }
        op.found = true;
        op.flow = 0.5 * (lo + hi);
        op.pressure = k * op.flow * op.flow;
        return op;
    }
    return op;
}

CurveResult CurveReport::generate(const InducerSelection& inducer, int fitDegree, int points) {
    if (inducer.status != SelectionStatus::Selected || inducer.curve.size() < 2) {
        throw std::invalid_argument("CurveReport: no inducer selected");
    }
    if (points < 2) points = 2;

    FanCurve curve(inducer.model, inducer.curve);

    CurveResult r;
    r.model = inducer.model;
    r.samples = inducer.curve;
    r.designFlow = inducer.requiredCfm;
    r.designPressure = inducer.requiredPressure;
    r.systemK = r.designFlow > 0.0 ? r.designPressure / (r.designFlow * r.designFlow) : 0.0;
    r.operatingPoint = operatingPoint(r.samples, r.systemK);

    r.fitCoeffs = curve.fitPolynomial(fitDegree);
    const double q0 = curve.minFlow();
    const double q1 = curve.maxFlow();
    for (int i = 0; i < points; ++i) {
        double q = q0 + (q1 - q0) * i / (points - 1);
        r.systemCurve.emplace_back(q, r.systemK * q * q);
        r.fitted.emplace_back(q, evalPolynomial(r.fitCoeffs, q));
    }
    return r;
}

std::string CurveReport::formatCsv(const CurveResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);

    oss << "# Model," << result.model << "\n";
    oss << "# DesignFlow_cfm," << result.designFlow << "\n";
    oss << "# DesignPressure_inwc," << result.designPressure << "\n";
    oss << "# SystemK," << result.systemK << "\n";
    if (result.operatingPoint.found) {
        oss << "# OperatingFlow_cfm," << result.operatingPoint.flow << "\n";
        oss << "# OperatingPressure_inwc," << result.operatingPoint.pressure << "\n";
    }
    oss << "# FitCoefficients";
    for (double c : result.fitCoeffs) oss << "," << c;
    oss << "\n";

    oss << "Series,Flow_cfm,Pressure_inwc\n";
    for (const auto& p : result.samples) {
        oss << "fan," << p.flow << "," << p.pressure << "\n";
    }
    for (const auto& p : result.systemCurve) {
        oss << "system," << p.flow << "," << p.pressure << "\n";
    }
    for (const auto& p : result.fitted) {
        oss << "fit," << p.flow << "," << p.pressure << "\n";
    }
    return oss.str();
}

} // namespace ventsizer
