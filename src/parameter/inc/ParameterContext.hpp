#pragma once

#include "ConfigParser.hpp"
#include "ConfigData.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);
    void merge_yaml();

    // Cross-section checks once every source is merged
    void validate() const;

    const ConfigData& get_config_data() const;
    const GlobalConfig& get_global_config() const;
    const RunConfig& get_run_config() const;

private:
    ConfigData config_data; // Top-level config data
    std::string worker_prefix = "worker-";

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;

    // Helper methods
    void load_default_config();
    void parse_workers(const YAML::Node& workers_node);
    void generate_workers(long count);
    void parse_worker_option(const std::string& value);
    void parse_scenarios(const YAML::Node& scenarios_node);
    std::vector<Step> parse_steps(const YAML::Node& steps_node, const std::string& context);
    void parse_step_action(Step& step, const std::string& context);

private:
    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--workers")
        char short_opt;          // Short option (e.g. 'w')
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
