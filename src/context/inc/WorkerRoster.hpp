#pragma once
#include <memory>
#include <string>
#include <vector>
#include "WorkerContext.hpp"
#include "FailedSet.hpp"

// Every worker configured for a run, the shared failed-set, and the
// capability to stop a worker. Populated before any worker thread starts.
class WorkerRoster {
public:
    WorkerRoster() = default;

    WorkerRoster(const WorkerRoster&) = delete;
    WorkerRoster& operator=(const WorkerRoster&) = delete;

    WorkerContext& add(const std::string& name,
                       WorkerContext::Properties properties = {},
                       bool can_kill = true);

    const std::vector<std::unique_ptr<WorkerContext>>& workers() const { return workers_; }
    std::size_t size() const { return workers_.size(); }
    WorkerContext* find(const std::string& name) const;

    FailedSet& failed() { return failed_; }
    const FailedSet& failed() const { return failed_; }
    std::size_t alive_count() const { return workers_.size() - failed_.size(); }

    // Hard cancellation of one worker; a no-op for workers that are not killable
    void terminate(WorkerContext& worker);

    // Cancels every worker regardless of can_kill (process shutdown)
    void terminate_all();

    // Forgets all failures and re-arms every token for a new run
    void revive_all();

private:
    std::vector<std::unique_ptr<WorkerContext>> workers_;
    FailedSet failed_;
};
