#include <iostream>
#include <string>

#include "mathtune/apps/cli_support.h"
#include "mathtune/tuning/config_store.h"
#include "mathtune/tuning/tuning_config.h"

namespace {

using mathtune::apps::ArgMap;
using mathtune::apps::GetArg;
using mathtune::apps::HasArg;
using mathtune::apps::ParseArgs;
using mathtune::tuning::Configuration;

void PrintUsage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--path <best_config.json>] | --preset <name> | --list_presets\n";
}

void PrintConfiguration(const Configuration& config) {
    for (const auto& [name, value] : config.values) {
        std::cout << name << ": " << mathtune::tuning::ParamValueToString(value) << '\n';
    }
}

}  // namespace

int main(int argc, char** argv) {
    const ArgMap args = ParseArgs(argc, argv);
    if (HasArg(args, "help") || HasArg(args, "h")) {
        PrintUsage(argv[0]);
        return 0;
    }

    if (HasArg(args, "list_presets")) {
        for (const std::string& name : mathtune::tuning::PresetNames()) {
            std::cout << name << '\n';
        }
        return 0;
    }

    std::string error;
    if (HasArg(args, "preset")) {
        Configuration preset;
        if (!mathtune::tuning::PresetConfiguration(GetArg(args, "preset"), &preset, &error)) {
            std::cerr << "best_config_cli: " << error << '\n';
            return 2;
        }
        PrintConfiguration(preset);
        return 0;
    }

    const std::string path = GetArg(args, "path", mathtune::tuning::TuningConfig{}.config_save_path);
    const Configuration config = mathtune::tuning::LoadBestConfig(path, &error);
    if (!error.empty()) {
        std::cerr << "best_config_cli: " << error << '\n';
        return 1;
    }
    if (config.empty()) {
        std::cerr << "best_config_cli: no stored configuration at " << path << '\n';
        return 1;
    }
    PrintConfiguration(config);
    return 0;
}
