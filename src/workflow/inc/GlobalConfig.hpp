#pragma once

#include <string>

struct GlobalConfig {
    bool verbose = false;
    std::string log_file = "log/flexsync.log";
    std::string log_level = "info";
};
