#pragma once

#include <string>
#include <memory>

#ifdef VENTSIZER_HAS_SQLITE3

#include "core/VentAnalyzer.h"

namespace ventsizer {

// Archives analyses into a SQLite database, one run id per analysis
class SqliteWriter {
public:
    explicit SqliteWriter(const std::string& filename);
    ~SqliteWriter();

    // Returns the run id the rows were stored under
    long long writeAnalysis(const VentRequest& request, const AnalysisOutcome& outcome);
    void finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ventsizer

#endif // VENTSIZER_HAS_SQLITE3
