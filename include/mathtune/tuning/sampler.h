#pragma once

#include <cstdint>
#include <random>

#include "mathtune/tuning/search_space.h"
#include "mathtune/tuning/study.h"

namespace mathtune::tuning {

class ISampler {
   public:
    virtual ~ISampler() = default;

    // Every returned value has passed SearchSpace::Draw.
    virtual Configuration Propose(const Study& study, const SearchSpace& space) = 0;
};

// Deterministic per-proposal engine: the same seed and the same number of
// trials in the study always give the same stream.
std::mt19937_64 MakeTrialEngine(std::uint64_t seed, int trial_number);

// Uniform draw of a single parameter, already validated through `space`.
ParamValue SampleUniform(const SearchSpace& space, const ParameterSpec& spec, std::mt19937_64* rng);

}  // namespace mathtune::tuning
