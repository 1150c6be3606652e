#include "WorkerRoster.hpp"
#include "LogUtils.hpp"
#include <stdexcept>

WorkerContext& WorkerRoster::add(const std::string& name,
                                 WorkerContext::Properties properties,
                                 bool can_kill) {
    if (name.empty()) {
        throw std::invalid_argument("WorkerRoster: worker name cannot be empty");
    }
    if (find(name) != nullptr) {
        throw std::invalid_argument("WorkerRoster: duplicate worker name: " + name);
    }
    workers_.push_back(std::make_unique<WorkerContext>(name, std::move(properties), can_kill));
    return *workers_.back();
}

WorkerContext* WorkerRoster::find(const std::string& name) const {
    for (const auto& worker : workers_) {
        if (worker->name() == name) {
            return worker.get();
        }
    }
    return nullptr;
}

void WorkerRoster::terminate(WorkerContext& worker) {
    if (!worker.can_kill()) {
        LogUtils::debug("Worker {} is not killable, leaving it running", worker.name());
        return;
    }
    LogUtils::debug("Terminating worker {}", worker.name());
    worker.token().cancel();
}

void WorkerRoster::terminate_all() {
    for (auto& worker : workers_) {
        worker->token().cancel();
    }
}

void WorkerRoster::revive_all() {
    failed_.clear();
    for (auto& worker : workers_) {
        worker->token().rearm();
    }
}
