#include "RunLifecycle.hpp"

RunLifecycle::RunLifecycle(const GlobalConfig& global)
    : logger_guard_(level_for(global), global.log_file) {
}

LogUtils::Level RunLifecycle::level_for(const GlobalConfig& global) {
    if (global.verbose) {
        return LogUtils::Level::Debug;
    }
    return LogUtils::parse_level(global.log_level);
}

void RunLifecycle::add_failure_cause(const std::string& cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_causes_.push_back(cause);
}

std::vector<std::string> RunLifecycle::failure_causes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_causes_;
}

bool RunLifecycle::has_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !failure_causes_.empty();
}

void RunLifecycle::terminate_active() {
    WorkerRoster* roster = active_roster_.load();
    if (roster != nullptr) {
        roster->terminate_all();
    }
}

bool RunLifecycle::report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_causes_.empty()) {
        return true;
    }

    LogUtils::error("{} failure(s) recorded:", failure_causes_.size());
    for (const auto& cause : failure_causes_) {
        LogUtils::error("  {}", cause);
    }
    return false;
}
