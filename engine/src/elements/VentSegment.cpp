#include "elements/VentSegment.h"
#include "utils/Constants.h"
#include <stdexcept>

namespace ventsizer {

int FittingCounts::count(FittingType type) const {
    switch (type) {
        case FittingType::Elbow90:        return elbow90;
        case FittingType::Elbow45:        return elbow45;
        case FittingType::Elbow30:        return elbow30;
        case FittingType::Tee:            return tee;
        case FittingType::TerminationCap: return 0;
    }
    return 0;
}

void FittingCounts::set(FittingType type, int n) {
    if (n < 0) throw std::invalid_argument("Fitting count must be non-negative");
    switch (type) {
        case FittingType::Elbow90: elbow90 = n; break;
        case FittingType::Elbow45: elbow45 = n; break;
        case FittingType::Elbow30: elbow30 = n; break;
        case FittingType::Tee:     tee = n; break;
        case FittingType::TerminationCap:
            throw std::invalid_argument("Termination cap is a segment flag, not a count");
    }
}

VentSegment::VentSegment(double diameter, double length, double rise, VentType type)
    : diameter_(diameter), length_(length), rise_(rise), ventType_(type) {}

VentSegment& VentSegment::withFittings(const FittingCounts& fittings) {
    fittings_ = fittings;
    return *this;
}

VentSegment& VentSegment::withTerminationCap(bool cap) {
    terminationCap_ = cap;
    return *this;
}

VentSegment& VentSegment::withAdditionalK(double k) {
    additionalK_ = k;
    return *this;
}

VentSegment& VentSegment::withAdditionalLoss(double inWc) {
    additionalLoss_ = inWc;
    return *this;
}

double VentSegment::area() const {
    double dFt = diameter_ / INCHES_PER_FOOT;
    return PI * dFt * dFt / 4.0;
}

} // namespace ventsizer
