#include "ScenarioRunner.hpp"
#include "LogUtils.hpp"
#include <stdexcept>


ScenarioRunner::ScenarioRunner(const ConfigData& config, RunLifecycle& lifecycle)
    : ScenarioRunner(config, lifecycle,
                     config.run.dry_run
                         ? std::unique_ptr<StepExecutionStrategy>(std::make_unique<DryRunStepStrategy>(config.run))
                         : std::unique_ptr<StepExecutionStrategy>(std::make_unique<ProductionStepStrategy>(config.run))) {
}

ScenarioRunner::ScenarioRunner(const ConfigData& config, RunLifecycle& lifecycle,
                               std::unique_ptr<StepExecutionStrategy> strategy)
    : config_(config),
      lifecycle_(lifecycle),
      step_strategy_(std::move(strategy)) {

    if (config.workers.empty()) {
        throw std::runtime_error("No workers configured");
    }

    for (const auto& worker : config.workers) {
        roster_.add(worker.name, worker.properties, worker.can_kill);
        if (worker.ignore_setup_failure) {
            ignored_setup_.insert(worker.name);
        }
    }

    if (config.run.mode == RunMode::Parallel) {
        barrier_ = std::make_unique<FlexibleBarrier>(roster_);
        for (const auto& worker : roster_.workers()) {
            worker->attach_barrier(barrier_.get());
        }
        pre_run_ = std::make_unique<StaticBarrier>(roster_.size());
        post_setup_ = std::make_unique<StaticBarrier>(roster_.size());
    }
}

RunResult ScenarioRunner::run() {
    if (runs_ > 0) {
        if (barrier_) {
            barrier_->refresh();
        } else {
            roster_.revive_all();
        }
    }
    runs_++;

    LogUtils::info("Run {}: {} workers in {} mode",
                   runs_, roster_.size(), RunConfig::mode_name(config_.run.mode));

    lifecycle_.set_active_roster(&roster_);
    RunResult result = barrier_ ? run_parallel() : run_serial();
    lifecycle_.set_active_roster(nullptr);

    if (result.success()) {
        LogUtils::info("Run {} completed, all {} workers passed", runs_, result.launched);
    } else {
        std::string names;
        for (const auto& name : result.failed_workers) {
            names += names.empty() ? name : ", " + name;
        }
        LogUtils::error("Run {} failed: {} of {} workers failed [{}]",
                        runs_, result.failures, result.launched, names);
    }
    return result;
}

bool ScenarioRunner::run_all() {
    bool all_passed = true;
    for (int i = 0; i < config_.run.repeat; ++i) {
        if (!run().success()) {
            all_passed = false;
        }
    }
    return all_passed;
}

RunResult ScenarioRunner::run_parallel() {
    LogUtils::trace("Running workers in parallel");

    std::atomic<std::size_t> failures{0};
    std::vector<std::thread> threads;
    threads.reserve(roster_.size());

    for (const auto& worker_ptr : roster_.workers()) {
        WorkerContext& worker = *worker_ptr;
        threads.emplace_back([this, &worker, &failures] {
            WorkerContext::Scope scope(worker);
            pre_run_->arrive();
            if (!run_worker(worker)) {
                failures++;
            }
        });
        LogUtils::trace("Started worker {}", worker.name());
    }

    std::size_t joined = 0;
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
            joined++;
        }
    }

    if (joined != threads.size()) {
        LogUtils::error("There were {} workers launched, but only {} rejoined", threads.size(), joined);
    }
    return collect(threads.size(), joined, failures.load());
}

RunResult ScenarioRunner::run_serial() {
    LogUtils::trace("Running workers in serial");

    std::size_t failures = 0;
    for (const auto& worker_ptr : roster_.workers()) {
        WorkerContext::Scope scope(*worker_ptr);
        if (!run_worker(*worker_ptr)) {
            failures++;
        }
    }
    return collect(roster_.size(), roster_.size(), failures);
}

bool ScenarioRunner::run_worker(WorkerContext& worker) {
    LogUtils::debug("Worker {} starting", worker.name());

    bool passed = run_setup(worker);

    // Everyone, failed or not, passes the post-setup checkpoint
    if (post_setup_) {
        post_setup_->arrive();
    }

    if (passed) {
        passed = run_scenarios(worker);
    }

    if (!run_cleanup(worker)) {
        passed = false;
    }

    LogUtils::debug("Worker {} finished", worker.name());
    return passed;
}

bool ScenarioRunner::run_setup(WorkerContext& worker) {
    try {
        run_steps(config_.setup, worker);
        return true;
    } catch (const WorkerTerminated&) {
        LogUtils::warn("Worker {} was terminated during setup", worker.name());
        fail_worker(worker);
        return false;
    } catch (const std::exception& e) {
        std::string cause = fmt::format("Setup failed on worker {}: {}", worker.name(), e.what());
        LogUtils::error("{}", cause);
        if (ignored_setup_.count(worker.name()) == 0) {
            lifecycle_.add_failure_cause(cause);
        }
        fail_worker(worker);
        return false;
    }
}

bool ScenarioRunner::run_scenarios(WorkerContext& worker) {
    const Scenario* current = nullptr;
    try {
        for (const auto& scenario : config_.scenarios) {
            current = &scenario;
            LogUtils::debug("Worker {} running scenario {}", worker.name(), scenario.name);
            run_steps(scenario.steps, worker);
        }
        return true;
    } catch (const WorkerTerminated&) {
        LogUtils::warn("Worker {} was terminated", worker.name());
        fail_worker(worker);
        return false;
    } catch (const std::exception& e) {
        LogUtils::error("Worker {} failed in scenario {}: {}",
                        worker.name(), current ? current->name : "", e.what());
        fail_worker(worker);
        return false;
    }
}

bool ScenarioRunner::run_cleanup(WorkerContext& worker) {
    try {
        run_steps(config_.cleanup, worker);
    } catch (const WorkerTerminated&) {
        LogUtils::debug("Cleanup of worker {} stopped, the worker was terminated", worker.name());
        fail_worker(worker);
        return false;
    } catch (const std::exception& e) {
        std::string cause = fmt::format("Cleanup failed on worker {}: {}", worker.name(), e.what());
        LogUtils::error("{}", cause);
        lifecycle_.add_failure_cause(cause);
    }
    return true;
}

void ScenarioRunner::run_steps(const std::vector<Step>& steps, WorkerContext& worker) {
    for (const auto& step : steps) {
        if (!step.applies_to(worker.name())) {
            continue;
        }
        step_strategy_->execute(step, worker);
    }
}

// Idempotent, a worker already in the failed-set keeps its single decrement
void ScenarioRunner::fail_worker(WorkerContext& worker) {
    if (barrier_) {
        barrier_->remove(worker);
    } else {
        roster_.failed().insert(worker);
    }
}

RunResult ScenarioRunner::collect(std::size_t launched, std::size_t joined, std::size_t failures) const {
    RunResult result;
    result.launched = launched;
    result.joined = joined;
    result.failures = failures;
    result.failed_workers = roster_.failed().names();
    return result;
}
