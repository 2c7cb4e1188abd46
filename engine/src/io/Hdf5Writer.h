#pragma once

#ifdef VENTSIZER_HAS_HDF5

#include "core/VentAnalyzer.h"
#include <string>

namespace ventsizer {

// HDF5 archive of one analysis
// Requires HDF5 C library + HighFive header-only wrapper
class Hdf5Writer {
public:
    static void writeAnalysis(const std::string& filepath,
                              const VentRequest& request,
                              const AnalysisOutcome& outcome);
};

} // namespace ventsizer

#endif // VENTSIZER_HAS_HDF5
