#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mathtune::tuning {

using ParamValue = std::variant<int, double, std::string>;

struct Configuration {
    std::map<std::string, ParamValue> values;

    bool empty() const { return values.empty(); }
    bool operator==(const Configuration& other) const { return values == other.values; }
    bool operator!=(const Configuration& other) const { return !(*this == other); }
};

enum class ParamKind {
    kIntRange,
    kFloatRange,
    kCategorical,
};

struct ParameterSpec {
    std::string name;
    ParamKind kind{ParamKind::kFloatRange};
    double low{0.0};
    double high{0.0};
    // IntRange only.
    int step{1};
    // Categorical only, in declaration order.
    std::vector<std::string> choices;

    static ParameterSpec IntRange(const std::string& name, int low, int high, int step = 1);
    static ParameterSpec FloatRange(const std::string& name, double low, double high);
    static ParameterSpec Categorical(const std::string& name, std::vector<std::string> choices);

    // Number of grid points of an IntRange.
    int GridSize() const;
};

struct TuningConfig;

class SearchSpace {
   public:
    SearchSpace() = default;

    static bool Create(std::vector<ParameterSpec> specs, SearchSpace* out, std::string* error);

    const std::vector<ParameterSpec>& specs() const { return specs_; }
    std::size_t size() const { return specs_.size(); }
    const ParameterSpec* Find(const std::string& name) const;

    // Validates a proposed raw value and returns it in canonical form
    // (int for IntRange, double for FloatRange, choice string for Categorical).
    // Throws InvalidParameterError.
    ParamValue Draw(const std::string& name, const ParamValue& raw) const;
    ParamValue Draw(const ParameterSpec& spec, const ParamValue& raw) const;

    bool Contains(const Configuration& config, std::string* error) const;

   private:
    explicit SearchSpace(std::vector<ParameterSpec> specs);

    std::vector<ParameterSpec> specs_;
    std::unordered_map<std::string, std::size_t> index_;
};

SearchSpace DefaultSearchSpace(const TuningConfig& config);

std::string ParamKindName(ParamKind kind);
std::string ParamValueToString(const ParamValue& value);

}  // namespace mathtune::tuning
