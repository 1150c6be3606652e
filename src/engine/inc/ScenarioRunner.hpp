#pragma once

#include <vector>
#include <thread>
#include <memory>
#include <atomic>
#include <string>
#include <unordered_set>

#include "ConfigData.hpp"
#include "FlexibleBarrier.hpp"
#include "RunLifecycle.hpp"
#include "StaticBarrier.hpp"
#include "StepExecutionStrategy.hpp"
#include "WorkerRoster.hpp"


// Outcome of one full run over every worker
struct RunResult {
    std::size_t launched = 0;
    std::size_t joined = 0;
    std::size_t failures = 0;                // Workers whose execution failed
    std::vector<std::string> failed_workers; // Failure order

    bool success() const { return joined == launched && failures == 0; }
};

// Runs the configured setup, scenarios and cleanup once per worker, either
// concurrently with one thread per worker synchronized through a
// FlexibleBarrier, or one worker after another with no barrier at all.
class ScenarioRunner {
public:
    ScenarioRunner(const ConfigData& config, RunLifecycle& lifecycle);

    // Constructor, allow custom strategy
    ScenarioRunner(const ConfigData& config, RunLifecycle& lifecycle,
                   std::unique_ptr<StepExecutionStrategy> strategy);

    static std::unique_ptr<ScenarioRunner> create_dry_run(const ConfigData& config, RunLifecycle& lifecycle) {
        return std::make_unique<ScenarioRunner>(
            config, lifecycle, std::make_unique<DryRunStepStrategy>(config.run)
        );
    }

    // One full run. Every run after the first starts from a refreshed barrier.
    RunResult run();

    // `run.repeat` runs; true when all of them succeeded
    bool run_all();

    WorkerRoster& roster() { return roster_; }

    // Null in serial mode
    FlexibleBarrier* barrier() { return barrier_.get(); }

private:
    RunResult run_parallel();
    RunResult run_serial();

    // Setup, scenarios and cleanup for one worker; false when the worker failed
    bool run_worker(WorkerContext& worker);
    bool run_setup(WorkerContext& worker);
    bool run_scenarios(WorkerContext& worker);
    // False only when the worker was terminated, cleanup errors are failure causes
    bool run_cleanup(WorkerContext& worker);
    void run_steps(const std::vector<Step>& steps, WorkerContext& worker);

    void fail_worker(WorkerContext& worker);
    RunResult collect(std::size_t launched, std::size_t joined, std::size_t failures) const;

    const ConfigData& config_;
    RunLifecycle& lifecycle_;
    std::unique_ptr<StepExecutionStrategy> step_strategy_;
    WorkerRoster roster_;
    std::unique_ptr<FlexibleBarrier> barrier_;
    std::unique_ptr<StaticBarrier> pre_run_;      // All worker threads started
    std::unique_ptr<StaticBarrier> post_setup_;   // All setups finished
    std::unordered_set<std::string> ignored_setup_; // Workers whose setup errors are not causes
    int runs_ = 0;
};
