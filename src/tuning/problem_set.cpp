#include "mathtune/tuning/problem_set.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace mathtune::tuning {
namespace {

bool SetError(const std::string& message, std::string* error) {
    if (error != nullptr) {
        *error = message;
    }
    return false;
}

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

bool ParseInt64(const std::string& text, std::int64_t* out) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(trimmed, &consumed);
        if (consumed != trimmed.size()) {
            return false;
        }
        *out = static_cast<std::int64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

using CsvRow = std::vector<std::string>;

// Splits RFC 4180 text into rows. `row_lines` receives the 1-based line each
// row starts on.
bool SplitCsv(const std::string& text,
              std::vector<CsvRow>* rows,
              std::vector<int>* row_lines,
              std::string* error) {
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;
    int line_no = 1;
    int row_start = 1;

    const auto end_row = [&]() {
        row.push_back(field);
        field.clear();
        if (row_has_content || row.size() > 1) {
            rows->push_back(std::move(row));
            row_lines->push_back(row_start);
        }
        row = CsvRow{};
        row_has_content = false;
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (in_quotes) {
            if (ch == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
                continue;
            }
            if (ch == '\n') {
                ++line_no;
            }
            field.push_back(ch);
            continue;
        }
        if (ch == '"') {
            in_quotes = true;
            row_has_content = true;
            continue;
        }
        if (ch == ',') {
            row.push_back(field);
            field.clear();
            row_has_content = true;
            continue;
        }
        if (ch == '\r') {
            continue;
        }
        if (ch == '\n') {
            end_row();
            ++line_no;
            row_start = line_no;
            continue;
        }
        field.push_back(ch);
        row_has_content = true;
    }
    if (in_quotes) {
        return SetError("line " + std::to_string(row_start) + ": unterminated quoted field", error);
    }
    end_row();
    return true;
}

}  // namespace

bool ProblemSet::Create(std::vector<ProblemRecord> records, ProblemSet* out, std::string* error) {
    if (out == nullptr) {
        return SetError("problem set output is null", error);
    }
    if (records.empty()) {
        return SetError("problem set must not be empty", error);
    }
    std::unordered_set<std::string> ids;
    for (const ProblemRecord& record : records) {
        if (record.id.empty()) {
            return SetError("problem id must not be empty", error);
        }
        if (!ids.insert(record.id).second) {
            return SetError("duplicate problem id: " + record.id, error);
        }
    }
    *out = ProblemSet(std::move(records));
    return true;
}

bool ParseProblemSetCsv(const std::string& csv_text, ProblemSet* out, std::string* error) {
    std::vector<CsvRow> rows;
    std::vector<int> row_lines;
    if (!SplitCsv(csv_text, &rows, &row_lines, error)) {
        return false;
    }
    if (rows.empty()) {
        return SetError("csv is empty", error);
    }

    const CsvRow& header = rows.front();
    std::size_t id_col = header.size();
    std::size_t problem_col = header.size();
    std::size_t answer_col = header.size();
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string name = Trim(header[i]);
        if (name == "id") {
            id_col = i;
        } else if (name == "problem") {
            problem_col = i;
        } else if (name == "answer") {
            answer_col = i;
        }
    }
    if (id_col == header.size() || problem_col == header.size() || answer_col == header.size()) {
        return SetError("csv header must contain id, problem and answer columns", error);
    }

    const std::size_t needed = std::max({id_col, problem_col, answer_col}) + 1;
    std::vector<ProblemRecord> records;
    for (std::size_t r = 1; r < rows.size(); ++r) {
        const CsvRow& row = rows[r];
        const std::string where = "line " + std::to_string(row_lines[r]) + ": ";
        if (row.size() < needed) {
            return SetError(where + "expected at least " + std::to_string(needed) + " columns",
                            error);
        }
        ProblemRecord record;
        record.id = Trim(row[id_col]);
        record.problem = row[problem_col];
        if (!ParseInt64(row[answer_col], &record.answer)) {
            return SetError(where + "answer is not an integer: " + row[answer_col], error);
        }
        records.push_back(std::move(record));
    }
    return ProblemSet::Create(std::move(records), out, error);
}

bool LoadProblemSetCsv(const std::string& csv_path, ProblemSet* out, std::string* error) {
    std::ifstream input(csv_path);
    if (!input.is_open()) {
        return SetError("unable to open problem csv: " + csv_path, error);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return ParseProblemSetCsv(buffer.str(), out, error);
}

}  // namespace mathtune::tuning
