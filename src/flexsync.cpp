#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "RunLifecycle.hpp"
#include "ScenarioRunner.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <csignal>

static RunLifecycle* active_lifecycle = nullptr;

void signal_handler(int signum) {
    LogUtils::info("Interrupt signal (" + std::to_string(signum) + ") received. Stopping workers...");
    if (active_lifecycle) {
        active_lifecycle->terminate_active();
    }
    exit(signum);
}

int main(int argc, char* argv[]) {
    int result = 0;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;

        if (!context.init(argc, argv)) {
            return 0;
        }

        // 2. Get parsed configuration data
        const ConfigData& config = context.get_config_data();

        // 3. Logging and failure bookkeeping live until every run is over
        RunLifecycle lifecycle(context.get_global_config());
        active_lifecycle = &lifecycle;

        // 4. Create and run scenario runner
        try {
            ScenarioRunner runner(config, lifecycle);

            bool success = runner.run_all();
            if (!lifecycle.report()) {
                success = false;
            }

            if (success) {
                LogUtils::info("All runs completed successfully!");
            } else {
                result = 1;
            }
        } catch (const std::exception& e) {
            LogUtils::error("Error during run: " + std::string(e.what()));
            result = 1;
        }

        active_lifecycle = nullptr;

    } catch (const std::exception& e) {
        LogUtils::error("Error: " + std::string(e.what()));
        LogUtils::error("Use --help or -? to show usage information");
        result = 1;
    }

    return result;
}
