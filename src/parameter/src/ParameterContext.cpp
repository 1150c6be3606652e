#include "ParameterContext.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

#ifndef FLEXSYNC_VERSION
#define FLEXSYNC_VERSION "0.1.0"
#endif
#ifndef FLEXSYNC_BUILD_TARGET
#define FLEXSYNC_BUILD_TARGET "unknown"
#endif

namespace {

long parse_number(const std::string& value, const std::string& what) {
    try {
        size_t pos = 0;
        long number = std::stol(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + ": " + value);
    }
}

}

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config-file", 'c', "Specify scenario file path", true},
    {"--workers", 'w', "Worker count or comma-separated worker names, replaces the configured list", true},
    {"--timeout", 't', "Default sync timeout in milliseconds, negative waits forever", true},
    {"--serial", 's', "Run workers one after another without a barrier", false},
    {"--repeat", 'r', "Number of full runs", true},
    {"--dry-run", 'n', "Log sleep and fail steps instead of executing them", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: flexsync [OPTIONS]...\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;

        size_t current_len = 4 + opt.long_opt.length();

        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');

        std::cout << opt.description << "\n";
    }

    std::cout << "\nEnvironment:\n"
              << "  FLEXSYNC_SERIALIZE   yes, y, true or 1 selects serial mode\n"
              << "  FLEXSYNC_TIMEOUT_MS  Default sync timeout in milliseconds\n"
              << "  FLEXSYNC_LOG_FILE    Log file path\n"
              << "\nExamples:\n"
              << "  flexsync --config-file=conf/barrier-timeout.yaml\n"
              << "  flexsync -w 8 -t 500 -r 3\n"
              << "  flexsync -w alpha,beta,gamma --serial\n\n";
}

void ParameterContext::show_version() {
    std::cout << "flexsync version: " << FLEXSYNC_VERSION << std::endl;
    std::cout << "build: " << FLEXSYNC_BUILD_TARGET << std::endl;
}

void ParameterContext::generate_workers(long count) {
    if (count <= 0) {
        throw std::runtime_error("Worker count must be greater than 0.");
    }
    config_data.workers.clear();
    for (long i = 0; i < count; ++i) {
        WorkerConfig worker;
        worker.name = worker_prefix + std::to_string(i);
        config_data.workers.push_back(worker);
    }
}

void ParameterContext::parse_worker_option(const std::string& value) {
    // A count generates prefixed workers, anything else is a list of names
    if (!value.empty() && (std::isdigit(static_cast<unsigned char>(value[0])) || value[0] == '-')) {
        generate_workers(parse_number(value, "worker count"));
        return;
    }

    auto names = StringUtils::split(value, ',');
    if (names.empty()) {
        throw std::runtime_error("Invalid worker list: " + value);
    }
    config_data.workers.clear();
    for (const auto& name : names) {
        WorkerConfig worker;
        worker.name = name;
        config_data.workers.push_back(worker);
    }
}

void ParameterContext::parse_workers(const YAML::Node& workers_yaml) {
    // Either a generated set {count, prefix} or an explicit list
    if (workers_yaml.IsMap()) {
        static const std::set<std::string> valid_keys = {"count", "prefix"};
        YAML::check_unknown_keys(workers_yaml, valid_keys, "workers");

        if (workers_yaml["prefix"]) {
            worker_prefix = workers_yaml["prefix"].as<std::string>();
        }
        if (!workers_yaml["count"]) {
            throw std::runtime_error("Missing required field 'count' in workers.");
        }
        generate_workers(workers_yaml["count"].as<long>());
    } else if (workers_yaml.IsSequence()) {
        config_data.workers = workers_yaml.as<std::vector<WorkerConfig>>();
    } else {
        throw std::runtime_error("workers must be a map with 'count' or a list of workers.");
    }
}

void ParameterContext::parse_scenarios(const YAML::Node& scenarios_yaml) {
    config_data.scenarios.clear();
    size_t index = 0;
    for (const auto& scenario_node : scenarios_yaml) {
        Scenario scenario;

        static const std::set<std::string> valid_keys = {
            "name", "steps"
        };
        YAML::check_unknown_keys(scenario_node, valid_keys, "scenario");

        if (scenario_node["name"]) {
            scenario.name = scenario_node["name"].as<std::string>();
        } else {
            scenario.name = "scenario-" + std::to_string(index);
        }

        if (scenario_node["steps"]) {
            scenario.steps = parse_steps(scenario_node["steps"], "scenario: " + scenario.name);
        }
        config_data.scenarios.push_back(scenario);
        index++;
    }
}

std::vector<Step> ParameterContext::parse_steps(const YAML::Node& steps_yaml, const std::string& context) {
    std::vector<Step> steps;
    for (const auto& step_node : steps_yaml) {
        Step step;

        // Detect unknown configuration keys
        static const std::set<std::string> valid_keys = {
            "name", "uses", "with", "workers"
        };
        YAML::check_unknown_keys(step_node, valid_keys, "steps");

        if (step_node["uses"]) {
            step.uses = step_node["uses"].as<std::string>();
        } else {
            throw std::runtime_error("Missing required field 'uses' for step in " + context);
        }

        if (step_node["name"]) {
            step.name = step_node["name"].as<std::string>();
        } else {
            step.name = step.uses;
        }

        if (step_node["with"]) {
            step.with = step_node["with"];
        } else {
            step.with = YAML::Node(YAML::NodeType::Map);
        }

        if (step_node["workers"]) {
            step.workers = step_node["workers"].as<std::vector<std::string>>();
        }

        parse_step_action(step, context);
        steps.push_back(step);
    }
    return steps;
}

void ParameterContext::parse_step_action(Step& step, const std::string& context) {
    if (step.uses == "sleep") {
        step.action = step.with.as<SleepAction>();
    } else if (step.uses == "sync") {
        // A sync every worker does not reach would fail the others
        if (!step.workers.empty()) {
            throw std::runtime_error("Step '" + step.name + "' in " + context + ": sync steps cannot be limited to workers");
        }
        step.action = step.with.as<SyncAction>();
    } else if (step.uses == "fail") {
        step.action = step.with.as<FailAction>();
    } else if (step.uses == "log") {
        step.action = step.with.as<LogAction>();
    } else {
        throw std::runtime_error("Unknown step kind '" + step.uses + "' in " + context);
    }
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    static const std::set<std::string> valid_keys = {
        "global", "run", "workers", "setup", "scenarios", "cleanup"
    };
    YAML::check_unknown_keys(config, valid_keys, "root");

    if (config["global"]) {
        config_data.global = config["global"].as<GlobalConfig>();
    }

    if (config["run"]) {
        config_data.run = config["run"].as<RunConfig>();
    }

    if (config["workers"]) {
        parse_workers(config["workers"]);
    }

    if (config["setup"]) {
        config_data.setup = parse_steps(config["setup"], "setup");
    }

    if (config["scenarios"]) {
        parse_scenarios(config["scenarios"]);
    }

    if (config["cleanup"]) {
        config_data.cleanup = parse_steps(config["cleanup"], "cleanup");
    }
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw std::runtime_error("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::merge_yaml() {
    if (cli_params.count("--config-file")) {
        const std::string& config_file = cli_params["--config-file"];
        merge_yaml(config_file);
    } else {
        load_default_config();
    }
}

void ParameterContext::load_default_config() {
    YAML::Node config = YAML::Load(R"(
run:
  mode: parallel
  default_timeout_ms: -1
  repeat: 1

workers:
  count: 5
  prefix: worker-

scenarios:
  - name: checkpoint
    steps:
      - uses: log
        with:
          message: reached checkpoint
      - uses: sync
)");

    merge_yaml(config);
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else if (arg[0] == '-') {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + key);
                }
                value = argv[++i];
            } else {
                value = "";
            }

            cli_params[key] = value;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    auto& run = config_data.run;

    if (cli_params.count("--workers")) {
        parse_worker_option(cli_params["--workers"]);
    }

    if (cli_params.count("--timeout")) {
        run.default_timeout_ms = parse_number(cli_params["--timeout"], "timeout");
    }

    if (cli_params.count("--serial")) {
        run.mode = RunMode::Serial;
    }

    if (cli_params.count("--repeat")) {
        long repeat = parse_number(cli_params["--repeat"], "repeat count");
        if (repeat < 1) {
            throw std::runtime_error("Invalid repeat count: " + cli_params["--repeat"]);
        }
        run.repeat = static_cast<int>(repeat);
    }

    if (cli_params.count("--dry-run")) {
        run.dry_run = true;
    }

    if (cli_params.count("--verbose")) {
        config_data.global.verbose = true;
    }
}

void ParameterContext::merge_environment_vars() {
    if (const char* serialize = std::getenv("FLEXSYNC_SERIALIZE")) {
        config_data.run.mode = StringUtils::is_truthy(serialize) ? RunMode::Serial : RunMode::Parallel;
    }

    if (const char* timeout = std::getenv("FLEXSYNC_TIMEOUT_MS")) {
        config_data.run.default_timeout_ms = parse_number(timeout, "FLEXSYNC_TIMEOUT_MS");
    }

    if (const char* log_file = std::getenv("FLEXSYNC_LOG_FILE")) {
        config_data.global.log_file = log_file;
    }
}

void ParameterContext::validate() const {
    if (config_data.workers.empty()) {
        throw std::runtime_error("At least one worker must be configured.");
    }

    std::unordered_set<std::string> names;
    for (const auto& worker : config_data.workers) {
        if (!names.insert(worker.name).second) {
            throw std::runtime_error("Duplicate worker name: " + worker.name);
        }
    }

    auto check_filters = [&names](const std::vector<Step>& steps, const std::string& context) {
        for (const auto& step : steps) {
            for (const auto& name : step.workers) {
                if (names.count(name) == 0) {
                    throw std::runtime_error("Step '" + step.name + "' in " + context + " names unknown worker: " + name);
                }
            }
        }
    };

    check_filters(config_data.setup, "setup");
    for (const auto& scenario : config_data.scenarios) {
        check_filters(scenario.steps, "scenario: " + scenario.name);
    }
    check_filters(config_data.cleanup, "cleanup");
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    merge_yaml();
    merge_environment_vars();
    merge_commandline();
    validate();
    return true;
}

const ConfigData& ParameterContext::get_config_data() const {
    return config_data;
}

const GlobalConfig& ParameterContext::get_global_config() const {
    return config_data.global;
}

const RunConfig& ParameterContext::get_run_config() const {
    return config_data.run;
}
