#include "select/FanCurve.h"
#include <Eigen/Dense>
#include <algorithm>
#include <stdexcept>

namespace ventsizer {

CurveLookup interpolateCurve(const std::vector<FanCurvePoint>& points, double flow) {
    CurveLookup out;
    if (points.size() < 2) return out;
    if (flow < points.front().flow || flow > points.back().flow) return out;

    // Find bracketing interval
    for (size_t i = 0; i < points.size() - 1; ++i) {
        const auto& a = points[i];
        const auto& b = points[i + 1];
        if (flow >= a.flow && flow <= b.flow) {
            double dq = b.flow - a.flow;
            double alpha = (flow - a.flow) / dq;
            out.inDomain = true;
            out.pressure = a.pressure * (1.0 - alpha) + b.pressure * alpha;
            return out;
        }
    }
    return out;
}

FanCurve::FanCurve(const std::string& modelId, const std::vector<FanCurvePoint>& points)
    : modelId_(modelId), points_(points)
{
    if (modelId_.empty()) {
        throw std::invalid_argument("FanCurve: model id must not be empty");
    }
    if (points_.size() < 2) {
        throw std::invalid_argument("FanCurve " + modelId_ + ": at least two samples required");
    }
    for (size_t i = 1; i < points_.size(); ++i) {
        if (!(points_[i].flow > points_[i - 1].flow)) {
            throw std::invalid_argument("FanCurve " + modelId_
                + ": samples must be strictly increasing in flow");
        }
    }
    if (points_.front().flow < 0.0) {
        throw std::invalid_argument("FanCurve " + modelId_ + ": negative flow sample");
    }
}

bool FanCurve::inDomain(double flow) const {
    return flow >= minFlow() && flow <= maxFlow();
}

std::vector<double> FanCurve::fitPolynomial(int degree) const {
    if (degree < 1) {
        throw std::invalid_argument("FanCurve::fitPolynomial: degree must be at least 1");
    }
    const int n = static_cast<int>(points_.size());
    const int terms = std::min(degree + 1, n);

    // Scale flow to [0, 1] to keep the Vandermonde system well conditioned
    const double scale = maxFlow() > 0.0 ? maxFlow() : 1.0;

    Eigen::MatrixXd A(n, terms);
    Eigen::VectorXd b(n);
    for (int i = 0; i < n; ++i) {
        double x = points_[i].flow / scale;
        double xp = 1.0;
        for (int j = 0; j < terms; ++j) {
            A(i, j) = xp;
            xp *= x;
        }
        b(i) = points_[i].pressure;
    }

    Eigen::VectorXd c = A.colPivHouseholderQr().solve(b);

    std::vector<double> coeffs(terms);
    double s = 1.0;
    for (int j = 0; j < terms; ++j) {
        coeffs[j] = c(j) / s;
        s *= scale;
    }
    return coeffs;
}

double evalPolynomial(const std::vector<double>& coeffs, double x) {
    double result = 0.0;
    double xp = 1.0;
    for (double c : coeffs) {
        result += c * xp;
        xp *= x;
    }
    return result;
}

} // namespace ventsizer
