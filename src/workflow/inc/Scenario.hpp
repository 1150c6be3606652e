#pragma once

#include "Step.hpp"
#include <string>
#include <vector>

struct Scenario {
    std::string name;
    std::vector<Step> steps;

    Scenario() = default;
    Scenario(const std::string& name, const std::vector<Step>& steps)
        : name(name), steps(steps) {}
};
