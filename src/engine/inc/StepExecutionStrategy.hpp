#pragma once

#include "Step.hpp"
#include "RunConfig.hpp"
#include "WorkerContext.hpp"


// Abstract base class: step execution strategy
class StepExecutionStrategy {
public:
    explicit StepExecutionStrategy(const RunConfig& run) : run_(run) {}

    virtual ~StepExecutionStrategy() = default;

    // Runs one step on behalf of `worker`, in the worker's own thread.
    // Throws on step failure; WorkerTerminated when the worker was stopped.
    virtual void execute(const Step& step, WorkerContext& worker) = 0;

protected:
    long sync_timeout(const SyncAction& sync) const {
        return sync.has_timeout ? sync.timeout_ms : run_.default_timeout_ms;
    }

    const RunConfig& run_;
};

// Production environment strategy
class ProductionStepStrategy : public StepExecutionStrategy {
public:
    explicit ProductionStepStrategy(const RunConfig& run) : StepExecutionStrategy(run) {}

    void execute(const Step& step, WorkerContext& worker) override;
};

// Logs sleep and fail steps instead of running them; syncs still happen
class DryRunStepStrategy : public StepExecutionStrategy {
public:
    explicit DryRunStepStrategy(const RunConfig& run) : StepExecutionStrategy(run) {}

    void execute(const Step& step, WorkerContext& worker) override;
};
