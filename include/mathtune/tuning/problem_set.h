#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mathtune::tuning {

struct ProblemRecord {
    std::string id;
    std::string problem;
    std::int64_t answer{0};
};

// Ordered, non-empty, immutable list of problems. Iteration order is the order
// the records were given in and stays fixed for a whole study.
class ProblemSet {
   public:
    ProblemSet() = default;

    static bool Create(std::vector<ProblemRecord> records, ProblemSet* out, std::string* error);

    const std::vector<ProblemRecord>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

   private:
    explicit ProblemSet(std::vector<ProblemRecord> records) : records_(std::move(records)) {}

    std::vector<ProblemRecord> records_;
};

// CSV with header `id,problem,answer` (RFC 4180 quoting; quoted fields may
// span lines). Extra columns are ignored.
bool LoadProblemSetCsv(const std::string& csv_path, ProblemSet* out, std::string* error);
bool ParseProblemSetCsv(const std::string& csv_text, ProblemSet* out, std::string* error);

}  // namespace mathtune::tuning
