#include "mathtune/tuning/study_report.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "mathtune/apps/cli_support.h"
#include "mathtune/tuning/config_store.h"

namespace mathtune::tuning {
namespace {

using mathtune::apps::JsonEscape;
using mathtune::apps::WriteTextFile;

std::string FormatDouble(double value) {
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

std::string OptionalToJson(const std::optional<double>& value) {
    return value.has_value() ? FormatDouble(*value) : "null";
}

void WriteTrialJson(const Trial& trial, const std::string& indent, std::ostringstream* json) {
    *json << indent << "\"trial_id\": " << trial.trial_id << ",\n"
          << indent << "\"state\": \"" << TrialStateName(trial.state) << "\",\n"
          << indent << "\"score\": " << OptionalToJson(trial.score) << ",\n"
          << indent << "\"correct\": " << trial.correct << ",\n"
          << indent << "\"problems_evaluated\": " << trial.problems_evaluated << ",\n"
          << indent << "\"total_elapsed_sec\": " << FormatDouble(trial.total_elapsed_sec) << ",\n"
          << indent << "\"duration_sec\": " << FormatDouble(trial.duration_sec) << ",\n"
          << indent << "\"interrupted\": " << (trial.interrupted ? "true" : "false") << ",\n"
          << indent << "\"error_msg\": \"" << JsonEscape(trial.error_msg) << "\",\n"
          << indent << "\"config\": " << ConfigurationToJson(trial.config) << "\n";
}

}  // namespace

StudyReport AnalyzeStudy(const Study& study, const std::string& mode, bool interrupted) {
    StudyReport report;
    report.study_name = study.name();
    report.mode = mode;
    report.interrupted = interrupted;
    report.trials = study.trials();
    report.total_trials = study.n_trials();

    std::optional<double> best_so_far;
    for (const Trial& trial : study.trials()) {
        switch (trial.state) {
            case TrialState::kComplete:
                ++report.complete_trials;
                break;
            case TrialState::kPruned:
                ++report.pruned_trials;
                break;
            case TrialState::kFailed:
                ++report.failed_trials;
                break;
            case TrialState::kRunning:
                break;
        }
        report.all_scores.push_back(trial.score);
        if (trial.score.has_value()) {
            best_so_far = best_so_far.has_value() ? std::max(*best_so_far, *trial.score)
                                                  : *trial.score;
        }
        report.convergence_curve.push_back(best_so_far);
    }

    const Trial* best = study.best_trial();
    if (best != nullptr) {
        report.has_best = true;
        report.best_trial = *best;
    }
    return report;
}

std::string StudyReportToJson(const StudyReport& report) {
    std::ostringstream json;
    json << "{\n"
         << "  \"study\": \"" << JsonEscape(report.study_name) << "\",\n"
         << "  \"mode\": \"" << JsonEscape(report.mode) << "\",\n"
         << "  \"interrupted\": " << (report.interrupted ? "true" : "false") << ",\n"
         << "  \"total_trials\": " << report.total_trials << ",\n"
         << "  \"complete_trials\": " << report.complete_trials << ",\n"
         << "  \"pruned_trials\": " << report.pruned_trials << ",\n"
         << "  \"failed_trials\": " << report.failed_trials << ",\n";
    if (report.has_best) {
        json << "  \"best_trial\": {\n";
        WriteTrialJson(report.best_trial, "    ", &json);
        json << "  },\n";
    } else {
        json << "  \"best_trial\": null,\n";
    }

    json << "  \"all_scores\": [";
    for (std::size_t i = 0; i < report.all_scores.size(); ++i) {
        json << (i > 0 ? ", " : "") << OptionalToJson(report.all_scores[i]);
    }
    json << "],\n"
         << "  \"convergence_curve\": [";
    for (std::size_t i = 0; i < report.convergence_curve.size(); ++i) {
        json << (i > 0 ? ", " : "") << OptionalToJson(report.convergence_curve[i]);
    }
    json << "],\n"
         << "  \"trials\": [\n";
    for (std::size_t i = 0; i < report.trials.size(); ++i) {
        json << "    {\n";
        WriteTrialJson(report.trials[i], "      ", &json);
        json << "    }" << (i + 1 < report.trials.size() ? "," : "") << "\n";
    }
    json << "  ]\n"
         << "}\n";
    return json.str();
}

std::string StudyReportToMarkdown(const StudyReport& report) {
    std::ostringstream md;
    md << "# Tuning report: " << report.study_name << "\n\n"
       << "- mode: `" << report.mode << "`\n"
       << "- trials: `" << report.total_trials << "`\n"
       << "- complete: `" << report.complete_trials << "`\n"
       << "- pruned: `" << report.pruned_trials << "`\n"
       << "- failed: `" << report.failed_trials << "`\n"
       << "- interrupted: `" << (report.interrupted ? "true" : "false") << "`\n\n"
       << "## Best trial\n\n";
    if (!report.has_best) {
        md << "No trial completed.\n";
    } else {
        md << "- trial_id: `" << report.best_trial.trial_id << "`\n"
           << "- score: `" << OptionalToJson(report.best_trial.score) << "`\n"
           << "- correct: `" << report.best_trial.correct << "/"
           << report.best_trial.problems_evaluated << "`\n\n"
           << "## Best configuration\n\n";
        for (const auto& [name, value] : report.best_trial.config.values) {
            md << "- " << name << ": `" << ParamValueToString(value) << "`\n";
        }
    }

    md << "\n## Trials\n\n"
       << "| trial | state | score | correct | evaluated | duration_sec |\n"
       << "|---|---|---|---|---|---|\n";
    for (const Trial& trial : report.trials) {
        md << "| " << trial.trial_id << " | " << TrialStateName(trial.state) << " | "
           << (trial.score.has_value() ? FormatDouble(*trial.score) : "-") << " | "
           << trial.correct << " | " << trial.problems_evaluated << " | "
           << FormatDouble(trial.duration_sec) << " |\n";
    }

    bool has_failures = false;
    for (const Trial& trial : report.trials) {
        if (trial.state != TrialState::kFailed) {
            continue;
        }
        if (!has_failures) {
            md << "\n## Failed trials\n\n";
            has_failures = true;
        }
        md << "- " << trial.trial_id << ": " << trial.error_msg << "\n";
    }
    return md.str();
}

bool WriteStudyReport(const StudyReport& report,
                      const std::string& json_path,
                      const std::string& md_path,
                      std::string* error) {
    if (!WriteTextFile(json_path, StudyReportToJson(report), error)) {
        return false;
    }
    return WriteTextFile(md_path, StudyReportToMarkdown(report), error);
}

}  // namespace mathtune::tuning
