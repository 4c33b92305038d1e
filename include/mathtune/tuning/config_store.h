#pragma once

#include <string>
#include <utility>

#include "mathtune/tuning/search_space.h"
#include "mathtune/tuning/tuning_result.h"

namespace mathtune::tuning {

class IConfigStore {
   public:
    virtual ~IConfigStore() = default;

    virtual bool Save(const TuningResult& result, std::string* error) = 0;
};

// Stores the result as a JSON document:
// {"best_config": {...}, "best_score": ..., "n_trials": ..., "mode": ..., "timestamp": ...}
class JsonFileConfigStore : public IConfigStore {
   public:
    explicit JsonFileConfigStore(std::string path) : path_(std::move(path)) {}

    bool Save(const TuningResult& result, std::string* error) override;

    const std::string& path() const { return path_; }

   private:
    std::string path_;
};

std::string TuningResultToJson(const TuningResult& result);

// Single-line JSON object; doubles keep a decimal point so they read back as
// doubles.
std::string ConfigurationToJson(const Configuration& config);

// Returns the stored best_config, or an empty configuration when `path` does
// not exist. Unreadable or malformed files also give an empty configuration;
// the reason goes to `error` when provided.
Configuration LoadBestConfig(const std::string& path, std::string* error = nullptr);

}  // namespace mathtune::tuning
