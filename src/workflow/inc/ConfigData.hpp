#pragma once

#include <vector>
#include "GlobalConfig.hpp"
#include "RunConfig.hpp"
#include "WorkerConfig.hpp"
#include "Scenario.hpp"

// Top-level config
struct ConfigData {
    GlobalConfig global;
    RunConfig run;
    std::vector<WorkerConfig> workers;
    std::vector<Step> setup;            // Before the post-setup checkpoint
    std::vector<Scenario> scenarios;
    std::vector<Step> cleanup;          // Always runs, even for failed workers
};
