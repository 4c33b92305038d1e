#include "mathtune/tuning/tpe_sampler.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace mathtune::tuning {
namespace {

constexpr double kLogZero = -std::numeric_limits<double>::infinity();
constexpr int kMaxTruncatedDraws = 64;
constexpr double kPi = 3.14159265358979323846;

double NormalCdf(double x) { return 0.5 * std::erfc(-x / std::sqrt(2.0)); }

double LogSumExp(const std::vector<double>& terms) {
    double peak = kLogZero;
    for (double term : terms) {
        peak = std::max(peak, term);
    }
    if (!std::isfinite(peak)) {
        return peak;
    }
    double sum = 0.0;
    for (double term : terms) {
        sum += std::exp(term - peak);
    }
    return peak + std::log(sum);
}

// Gaussian mixture truncated to [low, high]: one component per observation
// plus a wide prior component centered in the domain.
class ParzenEstimator {
   public:
    ParzenEstimator(const std::vector<double>& observations,
                    double low,
                    double high,
                    double prior_weight)
        : low_(low), high_(high) {
        const double range = high - low;
        const std::size_t n = observations.size();

        std::vector<double> sorted = observations;
        std::sort(sorted.begin(), sorted.end());

        const double min_sigma = range / std::min(100.0, static_cast<double>(n) + 1.0);
        for (std::size_t i = 0; i < n; ++i) {
            const double value = sorted[i];
            const double left = i == 0 ? low : sorted[i - 1];
            const double right = i + 1 == n ? high : sorted[i + 1];
            const double sigma = std::clamp(std::max(value - left, right - value), min_sigma, range);
            AddComponent(value, sigma, 1.0);
        }
        AddComponent(0.5 * (low + high), range, prior_weight);

        double total = 0.0;
        for (double weight : weights_) {
            total += weight;
        }
        for (double& weight : weights_) {
            weight /= total;
        }
    }

    double LogPdf(double x) const {
        std::vector<double> terms;
        terms.reserve(mus_.size());
        for (std::size_t k = 0; k < mus_.size(); ++k) {
            const double z = (x - mus_[k]) / sigmas_[k];
            const double mass = NormalCdf((high_ - mus_[k]) / sigmas_[k]) -
                                NormalCdf((low_ - mus_[k]) / sigmas_[k]);
            if (!(mass > 0.0) || !(weights_[k] > 0.0)) {
                terms.push_back(kLogZero);
                continue;
            }
            terms.push_back(std::log(weights_[k]) - 0.5 * z * z -
                            std::log(sigmas_[k] * std::sqrt(2.0 * kPi)) - std::log(mass));
        }
        return LogSumExp(terms);
    }

    double Sample(std::mt19937_64* rng) const {
        std::discrete_distribution<std::size_t> pick(weights_.begin(), weights_.end());
        const std::size_t k = pick(*rng);
        std::normal_distribution<double> normal(mus_[k], sigmas_[k]);
        for (int attempt = 0; attempt < kMaxTruncatedDraws; ++attempt) {
            const double x = normal(*rng);
            if (x >= low_ && x <= high_) {
                return x;
            }
        }
        return std::clamp(mus_[k], low_, high_);
    }

   private:
    void AddComponent(double mu, double sigma, double weight) {
        mus_.push_back(mu);
        sigmas_.push_back(sigma);
        weights_.push_back(weight);
    }

    double low_{0.0};
    double high_{0.0};
    std::vector<double> mus_;
    std::vector<double> sigmas_;
    std::vector<double> weights_;
};

double NumericValue(const ParamValue& value) {
    if (std::holds_alternative<int>(value)) {
        return static_cast<double>(std::get<int>(value));
    }
    return std::get<double>(value);
}

std::vector<double> CategoricalWeights(const std::vector<std::size_t>& observed,
                                       std::size_t n_choices,
                                       double prior_weight) {
    std::vector<double> weights(n_choices, prior_weight);
    for (std::size_t index : observed) {
        weights[index] += 1.0;
    }
    const double total = static_cast<double>(observed.size()) + prior_weight * n_choices;
    for (double& weight : weights) {
        weight /= total;
    }
    return weights;
}

}  // namespace

TpeSampler::TpeSampler(std::uint64_t seed, const SamplerConfig& config)
    : seed_(seed), config_(config) {
    if (!(config_.gamma > 0.0) || config_.gamma > 1.0) {
        throw std::invalid_argument("tpe gamma must be in (0, 1]");
    }
    if (config_.n_ei_candidates <= 0) {
        throw std::invalid_argument("tpe n_ei_candidates must be > 0");
    }
    if (!(config_.prior_weight > 0.0)) {
        throw std::invalid_argument("tpe prior_weight must be > 0");
    }
    if (config_.n_startup_trials < 0) {
        throw std::invalid_argument("tpe n_startup_trials must be >= 0");
    }
}

int TpeSampler::GoodGroupSize(int n_complete, double gamma) {
    if (n_complete <= 0) {
        return 0;
    }
    const int n_good = static_cast<int>(std::ceil(gamma * static_cast<double>(n_complete)));
    return std::clamp(n_good, 1, n_complete);
}

Configuration TpeSampler::Propose(const Study& study, const SearchSpace& space) {
    std::mt19937_64 rng = MakeTrialEngine(seed_, study.n_trials());

    std::vector<const Trial*> complete = study.CompleteTrials();
    Configuration config;
    if (static_cast<int>(complete.size()) <= config_.n_startup_trials) {
        for (const ParameterSpec& spec : space.specs()) {
            config.values[spec.name] = SampleUniform(space, spec, &rng);
        }
        return config;
    }

    std::stable_sort(complete.begin(), complete.end(), [](const Trial* left, const Trial* right) {
        if (*left->score != *right->score) {
            return *left->score > *right->score;
        }
        return left->trial_id < right->trial_id;
    });
    const std::size_t n_good =
        static_cast<std::size_t>(GoodGroupSize(static_cast<int>(complete.size()), config_.gamma));

    for (const ParameterSpec& spec : space.specs()) {
        if (spec.kind == ParamKind::kCategorical) {
            std::vector<std::size_t> good;
            std::vector<std::size_t> bad;
            for (std::size_t i = 0; i < complete.size(); ++i) {
                const auto it = complete[i]->config.values.find(spec.name);
                if (it == complete[i]->config.values.end() ||
                    !std::holds_alternative<std::string>(it->second)) {
                    continue;
                }
                const auto choice = std::find(spec.choices.begin(), spec.choices.end(),
                                              std::get<std::string>(it->second));
                if (choice == spec.choices.end()) {
                    continue;
                }
                const auto index = static_cast<std::size_t>(choice - spec.choices.begin());
                (i < n_good ? good : bad).push_back(index);
            }
            config.values[spec.name] = SampleCategorical(space, spec, good, bad, &rng);
            continue;
        }

        std::vector<double> good;
        std::vector<double> bad;
        for (std::size_t i = 0; i < complete.size(); ++i) {
            const auto it = complete[i]->config.values.find(spec.name);
            if (it == complete[i]->config.values.end() ||
                std::holds_alternative<std::string>(it->second)) {
                continue;
            }
            (i < n_good ? good : bad).push_back(NumericValue(it->second));
        }
        config.values[spec.name] = SampleNumeric(space, spec, good, bad, &rng);
    }
    return config;
}

ParamValue TpeSampler::SampleNumeric(const SearchSpace& space,
                                     const ParameterSpec& spec,
                                     const std::vector<double>& good,
                                     const std::vector<double>& bad,
                                     std::mt19937_64* rng) const {
    if (spec.high <= spec.low) {
        return SampleUniform(space, spec, rng);
    }

    const bool is_int = spec.kind == ParamKind::kIntRange;
    const double half_step = is_int ? 0.5 * spec.step : 0.0;
    const double low = spec.low - half_step;
    const double high = spec.high + half_step;

    const ParzenEstimator below(good, low, high, config_.prior_weight);
    const ParzenEstimator above(bad, low, high, config_.prior_weight);

    const auto to_grid = [&](double x) -> double {
        if (!is_int) {
            return std::clamp(x, spec.low, spec.high);
        }
        const long long max_index = spec.GridSize() - 1;
        const long long index = std::clamp<long long>(std::llround((x - spec.low) / spec.step),
                                                      0LL, max_index);
        return spec.low + static_cast<double>(index * spec.step);
    };

    double best_value = to_grid(below.Sample(rng));
    double best_score = below.LogPdf(best_value) - above.LogPdf(best_value);
    for (int i = 1; i < config_.n_ei_candidates; ++i) {
        const double candidate = to_grid(below.Sample(rng));
        const double score = below.LogPdf(candidate) - above.LogPdf(candidate);
        if (score > best_score) {
            best_score = score;
            best_value = candidate;
        }
    }

    if (is_int) {
        return space.Draw(spec, static_cast<int>(std::llround(best_value)));
    }
    return space.Draw(spec, best_value);
}

ParamValue TpeSampler::SampleCategorical(const SearchSpace& space,
                                         const ParameterSpec& spec,
                                         const std::vector<std::size_t>& good,
                                         const std::vector<std::size_t>& bad,
                                         std::mt19937_64* rng) const {
    const std::vector<double> below = CategoricalWeights(good, spec.choices.size(), config_.prior_weight);
    const std::vector<double> above = CategoricalWeights(bad, spec.choices.size(), config_.prior_weight);

    std::discrete_distribution<std::size_t> pick(below.begin(), below.end());
    std::size_t best_index = pick(*rng);
    double best_score = std::log(below[best_index]) - std::log(above[best_index]);
    for (int i = 1; i < config_.n_ei_candidates; ++i) {
        const std::size_t candidate = pick(*rng);
        const double score = std::log(below[candidate]) - std::log(above[candidate]);
        if (score > best_score) {
            best_score = score;
            best_index = candidate;
        }
    }
    return space.Draw(spec, spec.choices[best_index]);
}

}  // namespace mathtune::tuning
