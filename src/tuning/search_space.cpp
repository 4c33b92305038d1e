#include "mathtune/tuning/search_space.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

#include "mathtune/tuning/errors.h"
#include "mathtune/tuning/tuning_config.h"

namespace mathtune::tuning {
namespace {

constexpr double kIntegralEps = 1e-9;

std::string FormatDouble(double value) {
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

bool IsIntegral(double value) {
    return std::isfinite(value) && std::fabs(value - std::round(value)) <= kIntegralEps;
}

bool ValidateSpec(const ParameterSpec& spec, std::string* error) {
    if (spec.name.empty()) {
        return SetError("parameter name is required", error);
    }
    const std::string prefix = "parameter `" + spec.name + "`: ";
    switch (spec.kind) {
        case ParamKind::kIntRange:
            if (!IsIntegral(spec.low) || !IsIntegral(spec.high)) {
                return SetError(prefix + "int range bounds must be integers", error);
            }
            if (spec.high < spec.low) {
                return SetError(prefix + "range high must be >= low", error);
            }
            if (spec.step <= 0) {
                return SetError(prefix + "step must be > 0", error);
            }
            return true;
        case ParamKind::kFloatRange:
            if (!std::isfinite(spec.low) || !std::isfinite(spec.high)) {
                return SetError(prefix + "float range bounds must be finite", error);
            }
            if (spec.high < spec.low) {
                return SetError(prefix + "range high must be >= low", error);
            }
            return true;
        case ParamKind::kCategorical: {
            if (spec.choices.empty()) {
                return SetError(prefix + "categorical choices must not be empty", error);
            }
            std::vector<std::string> sorted = spec.choices;
            std::sort(sorted.begin(), sorted.end());
            if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
                return SetError(prefix + "categorical choices must be unique", error);
            }
            return true;
        }
    }
    return SetError(prefix + "unknown parameter kind", error);
}

}  // namespace

ParameterSpec ParameterSpec::IntRange(const std::string& name, int low, int high, int step) {
    ParameterSpec spec;
    spec.name = name;
    spec.kind = ParamKind::kIntRange;
    spec.low = static_cast<double>(low);
    spec.high = static_cast<double>(high);
    spec.step = step;
    return spec;
}

ParameterSpec ParameterSpec::FloatRange(const std::string& name, double low, double high) {
    ParameterSpec spec;
    spec.name = name;
    spec.kind = ParamKind::kFloatRange;
    spec.low = low;
    spec.high = high;
    return spec;
}

ParameterSpec ParameterSpec::Categorical(const std::string& name, std::vector<std::string> choices) {
    ParameterSpec spec;
    spec.name = name;
    spec.kind = ParamKind::kCategorical;
    spec.choices = std::move(choices);
    return spec;
}

int ParameterSpec::GridSize() const {
    if (kind != ParamKind::kIntRange || step <= 0) {
        return 0;
    }
    const int span = static_cast<int>(std::llround(high - low));
    return span / step + 1;
}

SearchSpace::SearchSpace(std::vector<ParameterSpec> specs) : specs_(std::move(specs)) {
    for (std::size_t i = 0; i < specs_.size(); ++i) {
        index_[specs_[i].name] = i;
    }
}

bool SearchSpace::Create(std::vector<ParameterSpec> specs, SearchSpace* out, std::string* error) {
    if (out == nullptr) {
        return SetError("search space output is null", error);
    }
    if (specs.empty()) {
        return SetError("search space must declare at least one parameter", error);
    }
    std::unordered_map<std::string, int> seen;
    for (const ParameterSpec& spec : specs) {
        if (!ValidateSpec(spec, error)) {
            return false;
        }
        if (++seen[spec.name] > 1) {
            return SetError("duplicate parameter name: " + spec.name, error);
        }
    }
    *out = SearchSpace(std::move(specs));
    return true;
}

const ParameterSpec* SearchSpace::Find(const std::string& name) const {
    const auto it = index_.find(name);
    return it == index_.end() ? nullptr : &specs_[it->second];
}

ParamValue SearchSpace::Draw(const std::string& name, const ParamValue& raw) const {
    const ParameterSpec* spec = Find(name);
    if (spec == nullptr) {
        throw InvalidParameterError(name, "parameter is not declared in the search space");
    }
    return Draw(*spec, raw);
}

ParamValue SearchSpace::Draw(const ParameterSpec& spec, const ParamValue& raw) const {
    switch (spec.kind) {
        case ParamKind::kIntRange: {
            double numeric = 0.0;
            if (std::holds_alternative<int>(raw)) {
                numeric = static_cast<double>(std::get<int>(raw));
            } else if (std::holds_alternative<double>(raw)) {
                numeric = std::get<double>(raw);
                if (!IsIntegral(numeric)) {
                    throw InvalidParameterError(spec.name,
                                                "non-integral value " + FormatDouble(numeric));
                }
            } else {
                throw InvalidParameterError(spec.name, "expected an integer, got a string");
            }
            const int value = static_cast<int>(std::llround(numeric));
            const int low = static_cast<int>(std::llround(spec.low));
            const int high = static_cast<int>(std::llround(spec.high));
            if (value < low || value > high) {
                throw InvalidParameterError(spec.name, std::to_string(value) + " outside [" +
                                                           std::to_string(low) + ", " +
                                                           std::to_string(high) + "]");
            }
            if ((value - low) % spec.step != 0) {
                throw InvalidParameterError(spec.name, std::to_string(value) +
                                                           " is not on the step grid (step=" +
                                                           std::to_string(spec.step) + ")");
            }
            return value;
        }
        case ParamKind::kFloatRange: {
            double value = 0.0;
            if (std::holds_alternative<int>(raw)) {
                value = static_cast<double>(std::get<int>(raw));
            } else if (std::holds_alternative<double>(raw)) {
                value = std::get<double>(raw);
            } else {
                throw InvalidParameterError(spec.name, "expected a number, got a string");
            }
            if (!std::isfinite(value) || value < spec.low || value > spec.high) {
                throw InvalidParameterError(spec.name, FormatDouble(value) + " outside [" +
                                                           FormatDouble(spec.low) + ", " +
                                                           FormatDouble(spec.high) + "]");
            }
            return value;
        }
        case ParamKind::kCategorical: {
            if (!std::holds_alternative<std::string>(raw)) {
                throw InvalidParameterError(spec.name, "expected one of the declared choices");
            }
            const std::string& value = std::get<std::string>(raw);
            if (std::find(spec.choices.begin(), spec.choices.end(), value) == spec.choices.end()) {
                throw InvalidParameterError(spec.name, "`" + value + "` is not a declared choice");
            }
            return value;
        }
    }
    throw InvalidParameterError(spec.name, "unknown parameter kind");
}

bool SearchSpace::Contains(const Configuration& config, std::string* error) const {
    if (config.values.size() != specs_.size()) {
        return SetError("configuration has " + std::to_string(config.values.size()) +
                            " values, search space declares " + std::to_string(specs_.size()),
                        error);
    }
    for (const ParameterSpec& spec : specs_) {
        const auto it = config.values.find(spec.name);
        if (it == config.values.end()) {
            return SetError("configuration is missing parameter: " + spec.name, error);
        }
        try {
            if (Draw(spec, it->second) != it->second) {
                return SetError("parameter `" + spec.name + "` is not in canonical form", error);
            }
        } catch (const InvalidParameterError& ex) {
            return SetError(ex.what(), error);
        }
    }
    return true;
}

SearchSpace DefaultSearchSpace(const TuningConfig& config) {
    std::vector<ParameterSpec> specs;
    specs.push_back(ParameterSpec::IntRange("k", config.k_min, config.k_max));
    specs.push_back(
        ParameterSpec::FloatRange("temperature", config.temperature_min, config.temperature_max));
    specs.push_back(ParameterSpec::IntRange("max_new_tokens", config.max_tokens_min,
                                            config.max_tokens_max, config.max_tokens_step));
    specs.push_back(ParameterSpec::Categorical("prompt_style", config.prompt_styles));
    specs.push_back(ParameterSpec::Categorical("selection_strategy", config.selection_strategies));
    specs.push_back(ParameterSpec::FloatRange("top_p", config.top_p_min, config.top_p_max));

    SearchSpace space;
    std::string error;
    if (!SearchSpace::Create(std::move(specs), &space, &error)) {
        throw std::invalid_argument("invalid default search space: " + error);
    }
    return space;
}

std::string ParamKindName(ParamKind kind) {
    switch (kind) {
        case ParamKind::kIntRange:
            return "int";
        case ParamKind::kFloatRange:
            return "float";
        case ParamKind::kCategorical:
            return "categorical";
    }
    return "unknown";
}

std::string ParamValueToString(const ParamValue& value) {
    if (std::holds_alternative<int>(value)) {
        return std::to_string(std::get<int>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return FormatDouble(std::get<double>(value));
    }
    return std::get<std::string>(value);
}

}  // namespace mathtune::tuning
