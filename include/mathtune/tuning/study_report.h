#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mathtune/tuning/study.h"

namespace mathtune::tuning {

struct StudyReport {
    std::string study_name;
    std::string mode;
    bool interrupted{false};
    int total_trials{0};
    int complete_trials{0};
    int pruned_trials{0};
    int failed_trials{0};
    bool has_best{false};
    Trial best_trial;
    std::vector<Trial> trials;
    // Best score so far after each trial; empty until a trial completes.
    std::vector<std::optional<double>> convergence_curve;
    // Score of each trial in creation order; empty unless complete.
    std::vector<std::optional<double>> all_scores;
};

StudyReport AnalyzeStudy(const Study& study, const std::string& mode, bool interrupted);

// Either path may be empty to skip that output.
bool WriteStudyReport(const StudyReport& report,
                      const std::string& json_path,
                      const std::string& md_path,
                      std::string* error);

std::string StudyReportToJson(const StudyReport& report);
std::string StudyReportToMarkdown(const StudyReport& report);

}  // namespace mathtune::tuning
