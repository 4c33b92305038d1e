#include "mathtune/tuning/tuning_config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "mathtune/tuning/objective_evaluator.h"

namespace mathtune::tuning {
namespace {

struct ParameterDraft {
    std::string name;
    std::string type_text;
    std::vector<std::string> values;
    std::vector<std::string> range;
    std::optional<double> step;
    int line_no{0};
};

std::string Trim(const std::string& text) {
    std::size_t begin = 0;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string Unquote(std::string value) {
    value = Trim(value);
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string StripInlineComment(const std::string& input) {
    bool in_single_quote = false;
    bool in_double_quote = false;
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if (ch == '\'' && !in_double_quote) {
            in_single_quote = !in_single_quote;
            continue;
        }
        if (ch == '"' && !in_single_quote) {
            in_double_quote = !in_double_quote;
            continue;
        }
        if (ch == '#' && !in_single_quote && !in_double_quote) {
            return input.substr(0, i);
        }
    }
    return input;
}

bool ParseKeyValue(const std::string& text, std::string* out_key, std::string* out_value) {
    const std::size_t pos = text.find(':');
    if (pos == std::string::npos) {
        return false;
    }
    *out_key = Trim(text.substr(0, pos));
    *out_value = Trim(text.substr(pos + 1));
    return !out_key->empty();
}

bool ParseDouble(const std::string& text, double* out) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const double value = std::stod(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            return false;
        }
        *out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseInt(const std::string& text, int* out) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const long value = std::stol(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            return false;
        }
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            return false;
        }
        *out = static_cast<int>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseBracketTokens(const std::string& text, std::vector<std::string>* out_tokens) {
    out_tokens->clear();
    const std::string trimmed = Trim(text);
    if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
        return false;
    }
    const std::string body = trimmed.substr(1, trimmed.size() - 2);
    std::string current;
    bool in_single_quote = false;
    bool in_double_quote = false;
    for (char ch : body) {
        if (ch == '\'' && !in_double_quote) {
            in_single_quote = !in_single_quote;
            current.push_back(ch);
            continue;
        }
        if (ch == '"' && !in_single_quote) {
            in_double_quote = !in_double_quote;
            current.push_back(ch);
            continue;
        }
        if (ch == ',' && !in_single_quote && !in_double_quote) {
            out_tokens->push_back(Unquote(current));
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    if (!Trim(current).empty() || !out_tokens->empty()) {
        out_tokens->push_back(Unquote(current));
    }
    return true;
}

std::string FormatLineError(int line_no, const std::string& message) {
    return "line " + std::to_string(line_no) + ": " + message;
}

bool Fail(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

bool SetInt(const std::string& key, const std::string& value, int line_no, int* out,
            std::string* error) {
    if (!ParseInt(value, out)) {
        return Fail(FormatLineError(line_no, "invalid " + key + " int"), error);
    }
    return true;
}

bool SetDouble(const std::string& key, const std::string& value, int line_no, double* out,
               std::string* error) {
    if (!ParseDouble(value, out)) {
        return Fail(FormatLineError(line_no, "invalid " + key + " number"), error);
    }
    return true;
}

bool SetTuningField(const std::string& key,
                    const std::string& value,
                    TuningConfig* config,
                    std::string* error,
                    int line_no) {
    if (key == "k_min") {
        return SetInt(key, value, line_no, &config->k_min, error);
    }
    if (key == "k_max") {
        return SetInt(key, value, line_no, &config->k_max, error);
    }
    if (key == "temperature_min") {
        return SetDouble(key, value, line_no, &config->temperature_min, error);
    }
    if (key == "temperature_max") {
        return SetDouble(key, value, line_no, &config->temperature_max, error);
    }
    if (key == "max_tokens_min") {
        return SetInt(key, value, line_no, &config->max_tokens_min, error);
    }
    if (key == "max_tokens_max") {
        return SetInt(key, value, line_no, &config->max_tokens_max, error);
    }
    if (key == "max_tokens_step") {
        return SetInt(key, value, line_no, &config->max_tokens_step, error);
    }
    if (key == "top_p_min") {
        return SetDouble(key, value, line_no, &config->top_p_min, error);
    }
    if (key == "top_p_max") {
        return SetDouble(key, value, line_no, &config->top_p_max, error);
    }
    if (key == "prompt_styles" || key == "selection_strategies") {
        std::vector<std::string> tokens;
        if (!ParseBracketTokens(value, &tokens)) {
            return Fail(FormatLineError(line_no, key + " must be [a, b, c]"), error);
        }
        (key == "prompt_styles" ? config->prompt_styles : config->selection_strategies) =
            std::move(tokens);
        return true;
    }
    if (key == "quick_trials") {
        return SetInt(key, value, line_no, &config->quick_trials, error);
    }
    if (key == "full_trials") {
        return SetInt(key, value, line_no, &config->full_trials, error);
    }
    if (key == "timeout_quick") {
        return SetDouble(key, value, line_no, &config->timeout_quick, error);
    }
    if (key == "timeout_full") {
        return SetDouble(key, value, line_no, &config->timeout_full, error);
    }
    if (key == "config_save_path") {
        config->config_save_path = Unquote(value);
        return true;
    }
    return Fail(FormatLineError(line_no, "unsupported tuning field: " + key), error);
}

bool SetSamplerField(const std::string& key,
                     const std::string& value,
                     SamplerConfig* config,
                     std::string* error,
                     int line_no) {
    if (key == "algorithm") {
        config->algorithm = ToLower(Unquote(value));
        return true;
    }
    if (key == "n_startup_trials") {
        return SetInt(key, value, line_no, &config->n_startup_trials, error);
    }
    if (key == "n_ei_candidates") {
        return SetInt(key, value, line_no, &config->n_ei_candidates, error);
    }
    if (key == "gamma") {
        return SetDouble(key, value, line_no, &config->gamma, error);
    }
    if (key == "prior_weight") {
        return SetDouble(key, value, line_no, &config->prior_weight, error);
    }
    return Fail(FormatLineError(line_no, "unsupported sampler field: " + key), error);
}

bool SetPrunerField(const std::string& key,
                    const std::string& value,
                    PrunerConfig* config,
                    std::string* error,
                    int line_no) {
    if (key == "algorithm") {
        config->algorithm = ToLower(Unquote(value));
        return true;
    }
    if (key == "n_startup_trials") {
        return SetInt(key, value, line_no, &config->n_startup_trials, error);
    }
    if (key == "n_warmup_steps") {
        return SetInt(key, value, line_no, &config->n_warmup_steps, error);
    }
    return Fail(FormatLineError(line_no, "unsupported pruner field: " + key), error);
}

bool SetScoringField(const std::string& key,
                     const std::string& value,
                     ScoringConfig* config,
                     std::string* error,
                     int line_no) {
    if (key == "time_budget_per_problem") {
        return SetDouble(key, value, line_no, &config->time_budget_per_problem, error);
    }
    if (key == "time_penalty_weight") {
        return SetDouble(key, value, line_no, &config->time_penalty_weight, error);
    }
    if (key == "penalty_exponent") {
        return SetDouble(key, value, line_no, &config->penalty_exponent, error);
    }
    if (key == "penalty_cap") {
        // std::stod accepts "inf".
        return SetDouble(key, value, line_no, &config->penalty_cap, error);
    }
    return Fail(FormatLineError(line_no, "unsupported scoring field: " + key), error);
}

bool SetLoggingField(const std::string& key,
                     const std::string& value,
                     LogConfig* config,
                     std::string* error,
                     int line_no) {
    if (key == "log_level" || key == "level") {
        config->log_level = NormalizeLogLevel(Unquote(value));
        return true;
    }
    if (key == "log_sink" || key == "sink") {
        config->log_sink = ToLower(Unquote(value));
        return true;
    }
    return Fail(FormatLineError(line_no, "unsupported logging field: " + key), error);
}

bool SetParameterDraftField(ParameterDraft* draft,
                            const std::string& key,
                            const std::string& value,
                            int line_no,
                            std::string* error) {
    if (key == "name") {
        draft->name = Unquote(value);
        return true;
    }
    if (key == "type") {
        draft->type_text = ToLower(Unquote(value));
        return true;
    }
    if (key == "range") {
        std::vector<std::string> tokens;
        if (!ParseBracketTokens(value, &tokens) || tokens.size() != 2) {
            return Fail(FormatLineError(line_no, "range must be [min, max]"), error);
        }
        draft->range = std::move(tokens);
        return true;
    }
    if (key == "values" || key == "choices") {
        std::vector<std::string> tokens;
        if (!ParseBracketTokens(value, &tokens)) {
            return Fail(FormatLineError(line_no, "values must be [a, b, c]"), error);
        }
        draft->values = std::move(tokens);
        return true;
    }
    if (key == "step") {
        double parsed = 0.0;
        if (!ParseDouble(value, &parsed)) {
            return Fail(FormatLineError(line_no, "invalid step"), error);
        }
        draft->step = parsed;
        return true;
    }
    return Fail(FormatLineError(line_no, "unsupported parameter field: " + key), error);
}

bool FinalizeParameterDraft(const ParameterDraft& draft, ParameterSpec* out, std::string* error) {
    const int line_no = draft.line_no;
    if (draft.name.empty()) {
        return Fail(FormatLineError(line_no, "parameter name is required"), error);
    }
    if (draft.type_text.empty()) {
        return Fail(FormatLineError(line_no, "parameter type is required"), error);
    }

    if (draft.type_text == "categorical" || draft.type_text == "enum" ||
        draft.type_text == "string") {
        if (!draft.range.empty() || draft.step.has_value()) {
            return Fail(FormatLineError(line_no, "categorical parameter does not support range"),
                        error);
        }
        if (draft.values.empty()) {
            return Fail(FormatLineError(line_no, "categorical parameter must define values"),
                        error);
        }
        *out = ParameterSpec::Categorical(draft.name, draft.values);
        return true;
    }

    if (!draft.values.empty()) {
        return Fail(FormatLineError(line_no, "numeric parameter must define range, not values"),
                    error);
    }
    if (draft.range.size() != 2) {
        return Fail(FormatLineError(line_no, "numeric parameter must define range"), error);
    }

    if (draft.type_text == "int") {
        int low = 0;
        int high = 0;
        if (!ParseInt(draft.range[0], &low) || !ParseInt(draft.range[1], &high)) {
            return Fail(FormatLineError(line_no, "invalid int value for range"), error);
        }
        const double step = draft.step.value_or(1.0);
        if (!(step > 0.0) || std::fabs(step - std::round(step)) > 1e-9) {
            return Fail(FormatLineError(line_no, "int parameter step must be a positive integer"),
                        error);
        }
        *out = ParameterSpec::IntRange(draft.name, low, high, static_cast<int>(std::round(step)));
        return true;
    }

    if (draft.type_text == "float" || draft.type_text == "double") {
        if (draft.step.has_value()) {
            return Fail(FormatLineError(line_no, "step is only allowed for int parameters"), error);
        }
        double low = 0.0;
        double high = 0.0;
        if (!ParseDouble(draft.range[0], &low) || !ParseDouble(draft.range[1], &high)) {
            return Fail(FormatLineError(line_no, "invalid float value for range"), error);
        }
        *out = ParameterSpec::FloatRange(draft.name, low, high);
        return true;
    }

    return Fail(FormatLineError(line_no, "unsupported parameter type: " + draft.type_text), error);
}

bool IsSection(const std::string& key) {
    return key == "tuning" || key == "sampler" || key == "pruner" || key == "scoring" ||
           key == "logging" || key == "parameters";
}

}  // namespace

bool ResolveModeBudget(const TuningConfig& config,
                       const std::string& mode,
                       ModeBudget* out,
                       std::string* error) {
    if (out == nullptr) {
        return Fail("mode budget output is null", error);
    }
    if (mode == "quick") {
        out->max_trials = config.quick_trials;
        out->timeout_sec = config.timeout_quick;
        return true;
    }
    if (mode == "full") {
        out->max_trials = config.full_trials;
        out->timeout_sec = config.timeout_full;
        return true;
    }
    return Fail("unknown tuning mode: " + mode + " (expected quick or full)", error);
}

bool BuildSearchSpace(const TuningConfig& config, SearchSpace* out, std::string* error) {
    if (out == nullptr) {
        return Fail("search space output is null", error);
    }
    if (!config.parameters.empty()) {
        return SearchSpace::Create(config.parameters, out, error);
    }
    try {
        *out = DefaultSearchSpace(config);
        return true;
    } catch (const std::invalid_argument& ex) {
        return Fail(ex.what(), error);
    }
}

bool ValidateTuningConfig(const TuningConfig& config, std::string* error) {
    if (config.quick_trials <= 0 || config.full_trials <= 0) {
        return Fail("tuning.quick_trials and tuning.full_trials must be > 0", error);
    }
    if (!(config.timeout_quick > 0.0) || !(config.timeout_full > 0.0)) {
        return Fail("tuning.timeout_quick and tuning.timeout_full must be > 0", error);
    }
    if (!ValidateScoringConfig(config.scoring, error)) {
        return false;
    }
    if (config.sampler.algorithm != "tpe" && config.sampler.algorithm != "random") {
        return Fail("unsupported sampler.algorithm: " + config.sampler.algorithm, error);
    }
    if (config.sampler.n_startup_trials < 0 || config.sampler.n_ei_candidates <= 0) {
        return Fail("sampler.n_startup_trials must be >= 0 and n_ei_candidates > 0", error);
    }
    if (!(config.sampler.gamma > 0.0) || config.sampler.gamma > 1.0) {
        return Fail("sampler.gamma must be in (0, 1]", error);
    }
    if (!(config.sampler.prior_weight > 0.0)) {
        return Fail("sampler.prior_weight must be > 0", error);
    }
    if (config.pruner.algorithm != "median" && config.pruner.algorithm != "none") {
        return Fail("unsupported pruner.algorithm: " + config.pruner.algorithm, error);
    }
    if (config.pruner.n_startup_trials < 0 || config.pruner.n_warmup_steps < 0) {
        return Fail("pruner.n_startup_trials and pruner.n_warmup_steps must be >= 0", error);
    }
    if (!IsKnownLogLevel(config.logging.log_level)) {
        return Fail("unsupported logging.log_level: " + config.logging.log_level, error);
    }
    if (config.logging.log_sink != "stderr" && config.logging.log_sink != "stdout") {
        return Fail("unsupported logging.log_sink: " + config.logging.log_sink, error);
    }
    SearchSpace space;
    return BuildSearchSpace(config, &space, error);
}

bool ParseTuningConfig(const std::string& yaml_text, TuningConfig* out, std::string* error) {
    if (out == nullptr) {
        return Fail("tuning config output is null", error);
    }

    TuningConfig config;
    std::string section;
    ParameterDraft current_param;
    bool has_current_param = false;

    auto finalize_param = [&]() -> bool {
        if (!has_current_param) {
            return true;
        }
        ParameterSpec spec;
        if (!FinalizeParameterDraft(current_param, &spec, error)) {
            return false;
        }
        config.parameters.push_back(std::move(spec));
        has_current_param = false;
        current_param = ParameterDraft{};
        return true;
    };

    std::istringstream input(yaml_text);
    std::string raw_line;
    int line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;
        const std::string no_comment = StripInlineComment(raw_line);
        const std::size_t first_non_space = no_comment.find_first_not_of(' ');
        if (first_non_space == std::string::npos) {
            continue;
        }
        const int indent = static_cast<int>(first_non_space);
        const std::string text = Trim(no_comment);
        if (text.empty()) {
            continue;
        }

        if (indent == 0) {
            if (section == "parameters" && !finalize_param()) {
                return false;
            }

            std::string key;
            std::string value;
            if (!ParseKeyValue(text, &key, &value)) {
                return Fail(FormatLineError(line_no, "invalid top-level key/value"), error);
            }
            if (value.empty()) {
                if (!IsSection(key)) {
                    return Fail(FormatLineError(line_no, "unsupported section: " + key), error);
                }
                section = key;
                continue;
            }

            section.clear();
            if (key == "problems_csv") {
                config.problems_csv = Unquote(value);
                continue;
            }
            if (key == "solver_command") {
                config.solver_command = Unquote(value);
                continue;
            }
            if (key == "config_save_path") {
                config.config_save_path = Unquote(value);
                continue;
            }
            return Fail(FormatLineError(line_no, "unsupported top-level field: " + key), error);
        }

        if (section == "parameters") {
            if (indent == 2 && text.rfind('-', 0) == 0) {
                if (!finalize_param()) {
                    return false;
                }
                has_current_param = true;
                current_param = ParameterDraft{};
                current_param.line_no = line_no;

                const std::string remainder = Trim(text.substr(1));
                if (!remainder.empty()) {
                    std::string key;
                    std::string value;
                    if (!ParseKeyValue(remainder, &key, &value) || value.empty()) {
                        return Fail(FormatLineError(line_no, "invalid parameter list item"), error);
                    }
                    if (!SetParameterDraftField(&current_param, key, value, line_no, error)) {
                        return false;
                    }
                }
                continue;
            }
            if (indent >= 4) {
                if (!has_current_param) {
                    return Fail(FormatLineError(line_no, "parameter field without list item"),
                                error);
                }
                std::string key;
                std::string value;
                if (!ParseKeyValue(text, &key, &value) || value.empty()) {
                    return Fail(FormatLineError(line_no, "invalid parameter field"), error);
                }
                if (!SetParameterDraftField(&current_param, key, value, line_no, error)) {
                    return false;
                }
                continue;
            }
            return Fail(FormatLineError(line_no, "invalid parameters indentation"), error);
        }

        if (section.empty()) {
            return Fail(FormatLineError(line_no, "field is not inside a known section"), error);
        }
        if (indent < 2) {
            return Fail(FormatLineError(line_no, "invalid indentation for " + section), error);
        }
        std::string key;
        std::string value;
        if (!ParseKeyValue(text, &key, &value) || value.empty()) {
            return Fail(FormatLineError(line_no, "invalid " + section + " entry"), error);
        }

        bool ok = false;
        if (section == "tuning") {
            ok = SetTuningField(key, value, &config, error, line_no);
        } else if (section == "sampler") {
            ok = SetSamplerField(key, value, &config.sampler, error, line_no);
        } else if (section == "pruner") {
            ok = SetPrunerField(key, value, &config.pruner, error, line_no);
        } else if (section == "scoring") {
            ok = SetScoringField(key, value, &config.scoring, error, line_no);
        } else {
            ok = SetLoggingField(key, value, &config.logging, error, line_no);
        }
        if (!ok) {
            return false;
        }
    }

    if (section == "parameters" && !finalize_param()) {
        return false;
    }
    if (!ValidateTuningConfig(config, error)) {
        return false;
    }

    *out = std::move(config);
    return true;
}

bool LoadTuningConfig(const std::string& yaml_path, TuningConfig* out, std::string* error) {
    std::ifstream input(yaml_path);
    if (!input.is_open()) {
        return Fail("unable to open tuning config: " + yaml_path, error);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    std::string parse_error;
    if (!ParseTuningConfig(buffer.str(), out, &parse_error)) {
        return Fail(yaml_path + ": " + parse_error, error);
    }
    return true;
}

std::vector<std::string> PresetNames() { return {"conservative", "exploratory", "fast"}; }

bool PresetConfiguration(const std::string& name, Configuration* out, std::string* error) {
    if (out == nullptr) {
        return Fail("preset output is null", error);
    }
    Configuration config;
    if (name == "conservative") {
        config.values = {{"k", 8},
                         {"temperature", 0.5},
                         {"max_new_tokens", 2048},
                         {"prompt_style", std::string("strict_final")},
                         {"selection_strategy", std::string("consensus")},
                         {"top_p", 0.9}};
    } else if (name == "exploratory") {
        config.values = {{"k", 12},
                         {"temperature", 0.8},
                         {"max_new_tokens", 3072},
                         {"prompt_style", std::string("strict_final")},
                         {"selection_strategy", std::string("verifier_weighted")},
                         {"top_p", 0.95}};
    } else if (name == "fast") {
        config.values = {{"k", 4},
                         {"temperature", 0.3},
                         {"max_new_tokens", 1024},
                         {"prompt_style", std::string("tir")},
                         {"selection_strategy", std::string("majority_vote")},
                         {"top_p", 0.9}};
    } else {
        return Fail("unknown preset: " + name, error);
    }
    *out = std::move(config);
    return true;
}

}  // namespace mathtune::tuning
