#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "mathtune/tuning/search_space.h"

namespace mathtune::tuning {

struct SolveTelemetry {
    std::optional<double> elapsed_sec;
    std::map<std::string, std::string> extra;
};

struct SolveResult {
    std::int64_t answer{0};
    SolveTelemetry telemetry;
};

// Black-box problem solver. Implementations signal failure by throwing,
// preferably SolverError.
class ISolver {
   public:
    virtual ~ISolver() = default;

    virtual SolveResult Solve(const std::string& problem_id,
                              const std::string& problem_text,
                              const Configuration& config) = 0;
};

}  // namespace mathtune::tuning
