#include "mathtune/tuning/study_trace_parquet_writer.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

#if MATHTUNE_ENABLE_ARROW_PARQUET
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#endif

namespace mathtune::tuning {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

#if MATHTUNE_ENABLE_ARROW_PARQUET
bool ExpectArrowStatus(const arrow::Status& status, const std::string& prefix, std::string* error) {
    if (status.ok()) {
        return true;
    }
    return SetError(prefix + ": " + status.ToString(), error);
}

template <typename BuilderT>
bool FinishArray(BuilderT* builder, const std::string& name, std::shared_ptr<arrow::Array>* out,
                 std::string* error) {
    const auto status = builder->Finish(out);
    return ExpectArrowStatus(status, "failed to finalize study trace field '" + name + "'", error);
}
#endif

}  // namespace

bool StudyTraceParquetWriter::Open(const std::string& output_path, std::string* error) {
    if (is_open_) {
        return SetError("study trace writer is already open", error);
    }
    if (output_path.empty()) {
        return SetError("study trace output path is empty", error);
    }

#if !MATHTUNE_ENABLE_ARROW_PARQUET
    return SetError("study trace requires MATHTUNE_ENABLE_ARROW_PARQUET=ON", error);
#else
    try {
        const std::filesystem::path path(output_path);
        if (std::filesystem::exists(path)) {
            return SetError("study trace output already exists: " + path.string(), error);
        }
        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path());
        }
    } catch (const std::exception& ex) {
        return SetError(std::string("failed to prepare study trace path: ") + ex.what(), error);
    }

    output_path_ = output_path;
    rows_written_ = 0;
    rows_.clear();
    is_open_ = true;
    return true;
#endif
}

bool StudyTraceParquetWriter::Append(const StudyTraceRow& row, std::string* error) {
    if (!is_open_) {
        return SetError("study trace writer is not open", error);
    }
    if (row.trial_id < 0 || row.step < 0) {
        return SetError("study trace row has a negative trial_id or step", error);
    }
    if (row.state.empty()) {
        return SetError("study trace row state is empty", error);
    }

#if !MATHTUNE_ENABLE_ARROW_PARQUET
    return SetError("study trace requires MATHTUNE_ENABLE_ARROW_PARQUET=ON", error);
#else
    rows_.push_back(row);
    ++rows_written_;
    return true;
#endif
}

bool StudyTraceParquetWriter::Close(std::string* error) {
    if (!is_open_) {
        return true;
    }

#if !MATHTUNE_ENABLE_ARROW_PARQUET
    return SetError("study trace requires MATHTUNE_ENABLE_ARROW_PARQUET=ON", error);
#else
    arrow::Int32Builder trial_id_builder;
    arrow::Int32Builder step_builder;
    arrow::DoubleBuilder value_builder;
    arrow::StringBuilder state_builder;
    arrow::DoubleBuilder trial_score_builder;

    for (const auto& row : rows_) {
        const arrow::Status score_status = row.trial_score.has_value()
                                               ? trial_score_builder.Append(*row.trial_score)
                                               : trial_score_builder.AppendNull();
        if (!ExpectArrowStatus(trial_id_builder.Append(row.trial_id), "failed appending trial_id",
                               error) ||
            !ExpectArrowStatus(step_builder.Append(row.step), "failed appending step", error) ||
            !ExpectArrowStatus(value_builder.Append(row.value), "failed appending value", error) ||
            !ExpectArrowStatus(state_builder.Append(row.state), "failed appending state", error) ||
            !ExpectArrowStatus(score_status, "failed appending trial_score", error)) {
            return false;
        }
    }

    std::shared_ptr<arrow::Array> trial_id_array;
    std::shared_ptr<arrow::Array> step_array;
    std::shared_ptr<arrow::Array> value_array;
    std::shared_ptr<arrow::Array> state_array;
    std::shared_ptr<arrow::Array> trial_score_array;
    if (!FinishArray(&trial_id_builder, "trial_id", &trial_id_array, error) ||
        !FinishArray(&step_builder, "step", &step_array, error) ||
        !FinishArray(&value_builder, "value", &value_array, error) ||
        !FinishArray(&state_builder, "state", &state_array, error) ||
        !FinishArray(&trial_score_builder, "trial_score", &trial_score_array, error)) {
        return false;
    }

    auto schema = arrow::schema({
        arrow::field("trial_id", arrow::int32(), false),
        arrow::field("step", arrow::int32(), false),
        arrow::field("value", arrow::float64(), false),
        arrow::field("state", arrow::utf8(), false),
        arrow::field("trial_score", arrow::float64(), true),
    });
    auto table = arrow::Table::Make(
        schema, {trial_id_array, step_array, value_array, state_array, trial_score_array});

    const std::filesystem::path output_path(output_path_);
    const std::filesystem::path tmp_path(output_path_ + ".tmp");

    auto file_result = arrow::io::FileOutputStream::Open(tmp_path.string());
    if (!file_result.ok()) {
        return SetError(
            "failed to open study trace parquet output: " + file_result.status().ToString(),
            error);
    }
    std::shared_ptr<arrow::io::FileOutputStream> output_stream = file_result.ValueOrDie();

    parquet::WriterProperties::Builder writer_props_builder;
    writer_props_builder.compression(parquet::Compression::SNAPPY);
    std::shared_ptr<parquet::WriterProperties> writer_props = writer_props_builder.build();
    parquet::ArrowWriterProperties::Builder arrow_props_builder;
    std::shared_ptr<parquet::ArrowWriterProperties> arrow_props = arrow_props_builder.build();

    const auto write_status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), output_stream,
        std::max<std::int64_t>(1, rows_written_), writer_props, arrow_props);
    if (!write_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to write study trace parquet: " + write_status.ToString(), error);
    }

    const auto close_status = output_stream->Close();
    if (!close_status.ok()) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to close study trace parquet file: " + close_status.ToString(),
                        error);
    }

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, output_path, rename_ec);
    if (rename_ec) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return SetError("failed to finalize study trace parquet: " + rename_ec.message(), error);
    }

    rows_.clear();
    is_open_ = false;
    return true;
#endif
}

bool AppendStudyTrace(const Study& study, StudyTraceParquetWriter* writer, std::string* error) {
    if (writer == nullptr) {
        return SetError("study trace writer is null", error);
    }
    for (const Trial& trial : study.trials()) {
        if (!trial.IsFinished()) {
            continue;
        }
        for (const IntermediateReport& report : trial.reports) {
            StudyTraceRow row;
            row.trial_id = trial.trial_id;
            row.step = report.step;
            row.value = report.value;
            row.state = TrialStateName(trial.state);
            row.trial_score = trial.score;
            if (!writer->Append(row, error)) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace mathtune::tuning
