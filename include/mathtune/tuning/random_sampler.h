#pragma once

#include <cstdint>

#include "mathtune/tuning/sampler.h"

namespace mathtune::tuning {

class RandomSampler : public ISampler {
   public:
    explicit RandomSampler(std::uint64_t seed) : seed_(seed) {}

    Configuration Propose(const Study& study, const SearchSpace& space) override;

   private:
    std::uint64_t seed_{0};
};

}  // namespace mathtune::tuning
