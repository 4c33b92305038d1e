#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "mathtune/tuning/sampler.h"
#include "mathtune/tuning/tuning_config.h"

namespace mathtune::tuning {

// Tree-structured Parzen estimator, one independent density per parameter.
//
// Complete trials are split into a good group (top `gamma` by score) and a bad
// group. For every parameter, `n_ei_candidates` values are drawn from the good
// density l(x) and the one maximizing l(x) / g(x) is kept. Until more than
// `n_startup_trials` trials have completed, sampling is uniform.
class TpeSampler : public ISampler {
   public:
    TpeSampler(std::uint64_t seed, const SamplerConfig& config);

    Configuration Propose(const Study& study, const SearchSpace& space) override;

    static int GoodGroupSize(int n_complete, double gamma);

   private:
    ParamValue SampleNumeric(const SearchSpace& space,
                             const ParameterSpec& spec,
                             const std::vector<double>& good,
                             const std::vector<double>& bad,
                             std::mt19937_64* rng) const;

    ParamValue SampleCategorical(const SearchSpace& space,
                                 const ParameterSpec& spec,
                                 const std::vector<std::size_t>& good,
                                 const std::vector<std::size_t>& bad,
                                 std::mt19937_64* rng) const;

    std::uint64_t seed_{0};
    SamplerConfig config_;
};

}  // namespace mathtune::tuning
