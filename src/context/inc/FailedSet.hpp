#pragma once
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

class WorkerContext;

// Workers irrecoverably removed from a run. Shared by the orchestrator and
// the barrier; membership only grows until clear() starts a new run.
class FailedSet {
public:
    // Returns true when the worker was not failed before this call
    bool insert(const WorkerContext& worker);

    bool contains(const WorkerContext& worker) const;
    std::size_t size() const;
    bool empty() const;

    // Names in the order the workers failed
    std::vector<std::string> names() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_set<const WorkerContext*> failed_;
    std::vector<const WorkerContext*> order_;
};
