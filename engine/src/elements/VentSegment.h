#pragma once

#include "elements/FittingLossTable.h"
#include <array>
#include <string>

namespace ventsizer {

// Fitting counts on one segment (termination cap is a flag on the segment)
struct FittingCounts {
    int elbow90 = 0;
    int elbow45 = 0;
    int elbow30 = 0;
    int tee = 0;

    int count(FittingType type) const;
    void set(FittingType type, int n);
    int total() const { return elbow90 + elbow45 + elbow30 + tee; }
};

// One run of vent pipe: the appliance connector or the common manifold
// Developed length L includes the rise H; H drives stack effect, L drives friction.
class VentSegment {
public:
    VentSegment() = default;
    VentSegment(double diameter, double length, double rise, VentType type);

    VentSegment& withFittings(const FittingCounts& fittings);
    VentSegment& withTerminationCap(bool cap = true);
    VentSegment& withAdditionalK(double k);
    // Fixed loss of in-line equipment (dampers, heat recovery), in. w.c.
    VentSegment& withAdditionalLoss(double inWc);

    double diameter() const { return diameter_; }
    double length() const { return length_; }
    double rise() const { return rise_; }
    VentType ventType() const { return ventType_; }
    const FittingCounts& fittings() const { return fittings_; }
    bool hasTerminationCap() const { return terminationCap_; }
    double additionalK() const { return additionalK_; }
    double additionalLoss() const { return additionalLoss_; }

    // Cross-sectional area (ft²)
    double area() const;

private:
    double diameter_ = 0.0;  // in
    double length_ = 0.0;    // ft
    double rise_ = 0.0;      // ft
    VentType ventType_ = VentType::UL441;
    FittingCounts fittings_;
    bool terminationCap_ = false;
    double additionalK_ = 0.0;
    double additionalLoss_ = 0.0;  // in. w.c.
};

} // namespace ventsizer
