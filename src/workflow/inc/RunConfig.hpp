#pragma once

#include <stdexcept>
#include <string>

enum class RunMode {
    Parallel,
    Serial
};

struct RunConfig {
    RunMode mode = RunMode::Parallel;
    long default_timeout_ms = -1;   // Negative waits forever at a sync
    int repeat = 1;                 // Full runs, the barrier is refreshed in between
    bool dry_run = false;

    static RunMode parse_mode(const std::string& mode);
    static std::string mode_name(RunMode mode);
};

inline RunMode RunConfig::parse_mode(const std::string& mode) {
    if (mode == "parallel") return RunMode::Parallel;
    if (mode == "serial") return RunMode::Serial;
    throw std::invalid_argument("Unknown run mode: " + mode);
}

inline std::string RunConfig::mode_name(RunMode mode) {
    return mode == RunMode::Serial ? "serial" : "parallel";
}
