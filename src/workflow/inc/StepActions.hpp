#pragma once

#include <string>
#include <variant>

struct SleepAction {
    long ms = 0;
};

struct SyncAction {
    long timeout_ms = -1;
    bool has_timeout = false;   // false: falls back to run.default_timeout_ms
};

struct FailAction {
    std::string message = "step failed";
};

struct LogAction {
    std::string message;
};

using StepActionVariant = std::variant<
    std::monostate,
    SleepAction,
    SyncAction,
    FailAction,
    LogAction
>;
