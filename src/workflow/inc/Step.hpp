#pragma once

#include <string>
#include <vector>
#include <variant>
#include <yaml-cpp/yaml.h>
#include "StepActions.hpp"

struct Step {
    std::string name; // Step name
    std::string uses; // Step kind: sleep, sync, fail, log
    YAML::Node with;  // Original parameter config
    std::vector<std::string> workers; // Empty: every worker runs the step
    StepActionVariant action;

    bool applies_to(const std::string& worker) const {
        if (workers.empty()) return true;
        for (const auto& name : workers) {
            if (name == worker) return true;
        }
        return false;
    }
};
