#include "mathtune/tuning/random_sampler.h"

#include <algorithm>
#include <stdexcept>

namespace mathtune::tuning {

std::mt19937_64 MakeTrialEngine(std::uint64_t seed, int trial_number) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffULL),
                      static_cast<std::uint32_t>(seed >> 32),
                      static_cast<std::uint32_t>(std::max(0, trial_number))};
    return std::mt19937_64(seq);
}

ParamValue SampleUniform(const SearchSpace& space, const ParameterSpec& spec, std::mt19937_64* rng) {
    if (rng == nullptr) {
        throw std::invalid_argument("sampler engine is null");
    }
    switch (spec.kind) {
        case ParamKind::kIntRange: {
            std::uniform_int_distribution<int> index(0, spec.GridSize() - 1);
            const int value = static_cast<int>(spec.low) + index(*rng) * spec.step;
            return space.Draw(spec, value);
        }
        case ParamKind::kFloatRange: {
            if (spec.high <= spec.low) {
                return space.Draw(spec, spec.low);
            }
            std::uniform_real_distribution<double> uniform(spec.low, spec.high);
            return space.Draw(spec, uniform(*rng));
        }
        case ParamKind::kCategorical: {
            std::uniform_int_distribution<std::size_t> index(0, spec.choices.size() - 1);
            return space.Draw(spec, spec.choices[index(*rng)]);
        }
    }
    throw std::invalid_argument("unknown parameter kind for " + spec.name);
}

Configuration RandomSampler::Propose(const Study& study, const SearchSpace& space) {
    std::mt19937_64 rng = MakeTrialEngine(seed_, study.n_trials());
    Configuration config;
    for (const ParameterSpec& spec : space.specs()) {
        config.values[spec.name] = SampleUniform(space, spec, &rng);
    }
    return config;
}

}  // namespace mathtune::tuning
