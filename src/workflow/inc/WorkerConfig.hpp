#pragma once

#include <string>
#include <unordered_map>

struct WorkerConfig {
    std::string name;
    std::unordered_map<std::string, std::string> properties;
    bool can_kill = true;
    bool ignore_setup_failure = false; // Setup errors still fail the worker but are not failure causes
};
