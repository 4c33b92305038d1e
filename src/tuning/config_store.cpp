#include "mathtune/tuning/config_store.h"

#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>

#include "mathtune/apps/cli_support.h"
#include "mathtune/core/simple_json.h"

namespace mathtune::tuning {
namespace {

using mathtune::apps::JsonEscape;
using mathtune::simple_json::Value;

// Keeps a decimal point so the value reads back as a double.
std::string FormatJsonDouble(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    std::string text = oss.str();
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string ParamValueToJson(const ParamValue& value) {
    if (std::holds_alternative<int>(value)) {
        return std::to_string(std::get<int>(value));
    }
    if (std::holds_alternative<double>(value)) {
        return FormatJsonDouble(std::get<double>(value));
    }
    return "\"" + JsonEscape(std::get<std::string>(value)) + "\"";
}

bool JsonToParamValue(const Value& json, ParamValue* out) {
    if (json.IsString()) {
        *out = json.string_value;
        return true;
    }
    if (!json.IsNumber()) {
        return false;
    }
    if (json.is_integer && json.integer_value >= std::numeric_limits<int>::min() &&
        json.integer_value <= std::numeric_limits<int>::max()) {
        *out = static_cast<int>(json.integer_value);
        return true;
    }
    *out = json.number_value;
    return true;
}

Configuration FailLoad(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return Configuration{};
}

}  // namespace

std::string ConfigurationToJson(const Configuration& config) {
    std::string json = "{";
    bool first = true;
    for (const auto& [name, value] : config.values) {
        if (!first) {
            json += ", ";
        }
        json += "\"" + JsonEscape(name) + "\": " + ParamValueToJson(value);
        first = false;
    }
    return json + "}";
}

std::string TuningResultToJson(const TuningResult& result) {
    std::ostringstream json;
    json << "{\n"
         << "  \"best_config\": {";
    bool first = true;
    for (const auto& [name, value] : result.best_config.values) {
        json << (first ? "\n" : ",\n") << "    \"" << JsonEscape(name)
             << "\": " << ParamValueToJson(value);
        first = false;
    }
    json << (first ? "" : "\n  ") << "},\n"
         << "  \"best_score\": " << FormatJsonDouble(result.best_score) << ",\n"
         << "  \"best_trial_id\": " << result.best_trial_id << ",\n"
         << "  \"n_trials\": " << result.n_trials << ",\n"
         << "  \"n_complete\": " << result.n_complete << ",\n"
         << "  \"n_pruned\": " << result.n_pruned << ",\n"
         << "  \"n_failed\": " << result.n_failed << ",\n"
         << "  \"interrupted\": " << (result.interrupted ? "true" : "false") << ",\n"
         << "  \"mode\": \"" << JsonEscape(result.mode) << "\",\n"
         << "  \"timestamp\": \"" << JsonEscape(result.timestamp) << "\",\n"
         << "  \"solver_errors\": [";
    for (std::size_t i = 0; i < result.solver_errors.size(); ++i) {
        if (i > 0) {
            json << ", ";
        }
        json << "\"" << JsonEscape(result.solver_errors[i]) << "\"";
    }
    json << "]\n"
         << "}\n";
    return json.str();
}

bool JsonFileConfigStore::Save(const TuningResult& result, std::string* error) {
    if (!result.has_best) {
        if (error != nullptr) {
            *error = "tuning result has no best configuration";
        }
        return false;
    }
    return mathtune::apps::WriteTextFileAtomic(path_, TuningResultToJson(result), error);
}

Configuration LoadBestConfig(const std::string& path, std::string* error) {
    if (error != nullptr) {
        error->clear();
    }
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Configuration{};
    }

    std::string text;
    if (!mathtune::apps::ReadTextFile(path, &text, error)) {
        return Configuration{};
    }

    Value root;
    std::string parse_error;
    if (!mathtune::simple_json::Parse(text, &root, &parse_error)) {
        return FailLoad("invalid best config json " + path + ": " + parse_error, error);
    }
    const Value* best = root.Find("best_config");
    if (best == nullptr) {
        return Configuration{};
    }
    if (!best->IsObject()) {
        return FailLoad("best_config in " + path + " is not an object", error);
    }

    Configuration config;
    for (const auto& [name, json] : best->object_value) {
        ParamValue value;
        if (!JsonToParamValue(json, &value)) {
            return FailLoad("best_config." + name + " in " + path + " is not a number or string",
                            error);
        }
        config.values[name] = value;
    }
    return config;
}

}  // namespace mathtune::tuning
