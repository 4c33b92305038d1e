#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

namespace mathtune::apps {

using ArgMap = std::unordered_map<std::string, std::string>;

inline ArgMap ParseArgs(int argc, char** argv) {
    ArgMap args;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            continue;
        }
        token = token.substr(2);
        const auto eq_pos = token.find('=');
        if (eq_pos != std::string::npos) {
            args[token.substr(0, eq_pos)] = token.substr(eq_pos + 1);
            continue;
        }
        if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
            args[token] = argv[++i];
            continue;
        }
        args[token] = "true";
    }
    return args;
}

inline std::string GetArg(const ArgMap& args,
                          const std::string& key,
                          const std::string& fallback = "") {
    const auto it = args.find(key);
    if (it == args.end()) {
        return fallback;
    }
    return it->second;
}

inline bool HasArg(const ArgMap& args, const std::string& key) {
    return args.find(key) != args.end();
}

inline bool GetIntArg(const ArgMap& args, const std::string& key, std::int64_t* out, std::string* error) {
    const auto it = args.find(key);
    if (it == args.end()) {
        return true;
    }
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
        *out = static_cast<std::int64_t>(value);
        return true;
    } catch (const std::exception&) {
        if (error != nullptr) {
            *error = "--" + key + " must be an integer: " + it->second;
        }
        return false;
    }
}

inline bool WriteTextFile(const std::string& path, const std::string& content, std::string* error) {
    if (path.empty()) {
        return true;
    }
    try {
        const std::filesystem::path file_path(path);
        if (!file_path.parent_path().empty()) {
            std::filesystem::create_directories(file_path.parent_path());
        }
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            if (error != nullptr) {
                *error = "unable to open output file: " + path;
            }
            return false;
        }
        out << content;
        return true;
    } catch (const std::exception& ex) {
        if (error != nullptr) {
            *error = ex.what();
        }
        return false;
    }
}

// Writes next to `path` first and renames over it, so readers never see a
// partially written file.
inline bool WriteTextFileAtomic(const std::string& path, const std::string& content, std::string* error) {
    if (path.empty()) {
        if (error != nullptr) {
            *error = "output path is empty";
        }
        return false;
    }
    const std::string tmp_path = path + ".tmp";
    if (!WriteTextFile(tmp_path, content, error)) {
        return false;
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp_path, cleanup_ec);
        if (error != nullptr) {
            *error = "unable to replace " + path + ": " + ec.message();
        }
        return false;
    }
    return true;
}

inline bool ReadTextFile(const std::string& path, std::string* out, std::string* error) {
    std::ifstream input(path);
    if (!input.is_open()) {
        if (error != nullptr) {
            *error = "unable to open file: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    *out = buffer.str();
    return true;
}

inline std::string JsonEscape(const std::string& text) {
    std::ostringstream oss;
    for (const char ch : text) {
        switch (ch) {
            case '\"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                oss << ch;
                break;
        }
    }
    return oss.str();
}

// "%Y-%m-%d %H:%M:%S" in local time.
inline std::string LocalTimestampNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_value{};
    if (localtime_r(&now, &tm_value) == nullptr) {
        return "";
    }
    char buffer[20];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_value) == 0) {
        return "";
    }
    return std::string(buffer);
}

}  // namespace mathtune::apps
