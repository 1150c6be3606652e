#pragma once

#include "GlobalConfig.hpp"
#include "RunConfig.hpp"
#include "WorkerConfig.hpp"
#include "StepActions.hpp"

#include <set>
#include <string>
#include <stdexcept>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    template<>
    struct convert<GlobalConfig> {
        static bool decode(const Node& node, GlobalConfig& rhs) {
            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "verbose", "log_file", "log_level"
            };
            check_unknown_keys(node, valid_keys, "global");

            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            if (node["log_file"]) {
                rhs.log_file = node["log_file"].as<std::string>();
            }
            if (node["log_level"]) {
                rhs.log_level = node["log_level"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<RunConfig> {
        static bool decode(const Node& node, RunConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "mode", "default_timeout_ms", "repeat", "dry_run"
            };
            check_unknown_keys(node, valid_keys, "run");

            if (node["mode"]) {
                try {
                    rhs.mode = RunConfig::parse_mode(node["mode"].as<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error(std::string(e.what()) + " in run::mode, expected parallel or serial");
                }
            }
            if (node["default_timeout_ms"]) {
                rhs.default_timeout_ms = node["default_timeout_ms"].as<long>();
            }
            if (node["repeat"]) {
                rhs.repeat = node["repeat"].as<int>();
                if (rhs.repeat < 1) {
                    throw std::runtime_error("repeat must be greater than 0 in run.");
                }
            }
            if (node["dry_run"]) {
                rhs.dry_run = node["dry_run"].as<bool>();
            }
            return true;
        }
    };

    template<>
    struct convert<WorkerConfig> {
        static bool decode(const Node& node, WorkerConfig& rhs) {
            static const std::set<std::string> valid_keys = {
                "name", "properties", "can_kill", "ignore_setup_failure"
            };
            check_unknown_keys(node, valid_keys, "workers");

            if (!node["name"]) {
                throw std::runtime_error("Missing required field 'name' in workers.");
            }
            rhs.name = node["name"].as<std::string>();
            if (rhs.name.empty()) {
                throw std::runtime_error("Worker name must not be empty.");
            }

            if (node["properties"]) {
                const auto& props = node["properties"];
                if (!props.IsMap()) {
                    throw std::runtime_error("properties of worker " + rhs.name + " must be a map.");
                }
                for (auto it = props.begin(); it != props.end(); ++it) {
                    rhs.properties[it->first.as<std::string>()] = it->second.as<std::string>();
                }
            }
            if (node["can_kill"]) {
                rhs.can_kill = node["can_kill"].as<bool>();
            }
            if (node["ignore_setup_failure"]) {
                rhs.ignore_setup_failure = node["ignore_setup_failure"].as<bool>();
            }
            return true;
        }
    };

    template<>
    struct convert<SleepAction> {
        static bool decode(const Node& node, SleepAction& rhs) {
            static const std::set<std::string> valid_keys = {"ms"};
            check_unknown_keys(node, valid_keys, "sleep");

            if (!node["ms"]) {
                throw std::runtime_error("Missing required field 'ms' in sleep.");
            }
            rhs.ms = node["ms"].as<long>();
            if (rhs.ms < 0) {
                throw std::runtime_error("ms must not be negative in sleep.");
            }
            return true;
        }
    };

    template<>
    struct convert<SyncAction> {
        static bool decode(const Node& node, SyncAction& rhs) {
            static const std::set<std::string> valid_keys = {"timeout_ms"};
            check_unknown_keys(node, valid_keys, "sync");

            if (node["timeout_ms"]) {
                rhs.timeout_ms = node["timeout_ms"].as<long>();
                rhs.has_timeout = true;
            }
            return true;
        }
    };

    template<>
    struct convert<FailAction> {
        static bool decode(const Node& node, FailAction& rhs) {
            static const std::set<std::string> valid_keys = {"message"};
            check_unknown_keys(node, valid_keys, "fail");

            if (node["message"]) {
                rhs.message = node["message"].as<std::string>();
            }
            return true;
        }
    };

    template<>
    struct convert<LogAction> {
        static bool decode(const Node& node, LogAction& rhs) {
            static const std::set<std::string> valid_keys = {"message"};
            check_unknown_keys(node, valid_keys, "log");

            if (!node["message"]) {
                throw std::runtime_error("Missing required field 'message' in log.");
            }
            rhs.message = node["message"].as<std::string>();
            return true;
        }
    };

}
