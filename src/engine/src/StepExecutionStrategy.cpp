#include "StepExecutionStrategy.hpp"
#include "Checkpoint.hpp"
#include "LogUtils.hpp"
#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace {

void run_sync(const Step& step, WorkerContext& worker, long timeout_ms) {
    int order = Checkpoint::sync(timeout_ms);
    LogUtils::debug("Worker {} passed {} as order {}", worker.name(), step.name, order);
}

}

// Implementation of production environment strategy
void ProductionStepStrategy::execute(const Step& step, WorkerContext& worker) {
    worker.token().throw_if_cancelled();
    LogUtils::debug("Executing step: {} ({}) on {}", step.name, step.uses, worker.name());

    std::visit([&](const auto& action) {
        using T = std::decay_t<decltype(action)>;
        if constexpr (std::is_same_v<T, SleepAction>) {
            worker.token().sleep_for(std::chrono::milliseconds(action.ms));
        } else if constexpr (std::is_same_v<T, SyncAction>) {
            run_sync(step, worker, sync_timeout(action));
        } else if constexpr (std::is_same_v<T, FailAction>) {
            throw std::runtime_error(worker.expand(action.message));
        } else if constexpr (std::is_same_v<T, LogAction>) {
            LogUtils::info("{}", worker.expand(action.message));
        } else {
            throw std::runtime_error("Step has no action: " + step.name);
        }
    }, step.action);
}

void DryRunStepStrategy::execute(const Step& step, WorkerContext& worker) {
    worker.token().throw_if_cancelled();

    std::visit([&](const auto& action) {
        using T = std::decay_t<decltype(action)>;
        if constexpr (std::is_same_v<T, SleepAction>) {
            LogUtils::info("dry run: {} would sleep {} ms", step.name, action.ms);
        } else if constexpr (std::is_same_v<T, SyncAction>) {
            run_sync(step, worker, sync_timeout(action));
        } else if constexpr (std::is_same_v<T, FailAction>) {
            LogUtils::info("dry run: {} would fail with \"{}\"", step.name, worker.expand(action.message));
        } else if constexpr (std::is_same_v<T, LogAction>) {
            LogUtils::info("{}", worker.expand(action.message));
        } else {
            LogUtils::error("Unknown action type: {}", step.uses);
            throw std::runtime_error("Step has no action: " + step.name);
        }
    }, step.action);
}
