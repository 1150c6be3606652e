#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "GlobalConfig.hpp"
#include "LogUtils.hpp"
#include "WorkerRoster.hpp"

// Process-wide state of a flexsync invocation: the logger, the failure causes
// collected across every run, and the roster of the run in progress so a
// signal can stop it. Created once by main and handed to each runner.
class RunLifecycle {
public:
    explicit RunLifecycle(const GlobalConfig& global);

    RunLifecycle(const RunLifecycle&) = delete;
    RunLifecycle& operator=(const RunLifecycle&) = delete;

    void add_failure_cause(const std::string& cause);
    std::vector<std::string> failure_causes() const;
    bool has_failures() const;

    void set_active_roster(WorkerRoster* roster) { active_roster_.store(roster); }

    // Cancels every worker of the active run, if any
    void terminate_active();

    // Logs the collected causes; true when there were none
    bool report() const;

private:
    static LogUtils::Level level_for(const GlobalConfig& global);

    LogUtils::LoggerGuard logger_guard_;
    mutable std::mutex mutex_;
    std::vector<std::string> failure_causes_;
    std::atomic<WorkerRoster*> active_roster_{nullptr};
};
