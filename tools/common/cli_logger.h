#pragma once

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace thicket::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

// verbosity_args returns the flags that reproduce the current level in a
// child thicket_db process ("-v", "-vv" or nothing).
inline std::vector<std::string> verbosity_args() {
    if (current_level >= VerbosityLevel::Debug) return {"-vv"};
    if (current_level >= VerbosityLevel::Verbose) return {"-v"};
    return {};
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    stream << '[' << level_name(min_level) << "] thicket_db: ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

// Warnings and errors are always shown, whatever the verbosity.
template <typename... Args>
void warn(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[WARN] thicket_db: ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[ERROR] thicket_db: ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

} // namespace thicket::log

namespace thicket::cli {
    using namespace thicket::log;
}

#define LOGI(...) ::thicket::log::info(__VA_ARGS__)
#define LOGW(...) ::thicket::log::warn(__VA_ARGS__)
#define LOGE(...) ::thicket::log::error(__VA_ARGS__)
#define LOGD(...) ::thicket::log::debug(__VA_ARGS__)
