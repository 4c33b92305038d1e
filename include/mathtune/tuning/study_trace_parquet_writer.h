#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mathtune/tuning/study.h"

namespace mathtune::tuning {

struct StudyTraceRow {
    int trial_id{0};
    int step{0};
    double value{0.0};
    // Terminal state of the trial that made the report.
    std::string state;
    std::optional<double> trial_score;
};

// Buffers intermediate reports and writes them as one parquet table on Close().
class StudyTraceParquetWriter {
   public:
    StudyTraceParquetWriter() = default;
    ~StudyTraceParquetWriter() = default;

    bool Open(const std::string& output_path, std::string* error);
    bool Append(const StudyTraceRow& row, std::string* error);
    bool Close(std::string* error);

    std::int64_t rows_written() const noexcept { return rows_written_; }
    const std::string& output_path() const noexcept { return output_path_; }
    bool is_open() const noexcept { return is_open_; }

   private:
    bool is_open_{false};
    std::int64_t rows_written_{0};
    std::string output_path_;

#if MATHTUNE_ENABLE_ARROW_PARQUET
    std::vector<StudyTraceRow> rows_;
#endif
};

// Appends one row per intermediate report of every finished trial.
bool AppendStudyTrace(const Study& study, StudyTraceParquetWriter* writer, std::string* error);

}  // namespace mathtune::tuning
