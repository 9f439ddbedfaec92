// patch_cli configuration YAML read/write implementation
#include "cli_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include "oxp_types.hpp" // for oxp::fs alias
#include "kernel/param_utils.hpp"

using namespace oxp; // for fs

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "ooxpatch CLI configuration.";
    root["_comment2"] = "recovery_strategy: fail_fast | skip_failed | retry_with_fallback | best_effort";
    root["recovery_strategy"] = config.recovery_strategy;
    root["validation_level"] = config.validation_level;
    root["enable_result_cache"] = config.enable_result_cache;
    root["result_cache_capacity"] = config.result_cache_capacity;
    root["result_cache_ttl_seconds"] = config.result_cache_ttl_seconds;
    root["optimize_order"] = config.optimize_order;
    root["enable_batching"] = config.enable_batching;
    root["quiet"] = config.quiet;
    root["pretty_output"] = config.pretty_output;
    root["default_report_path"] = config.default_report_path;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            config.recovery_strategy = as_str(root, "recovery_strategy", config.recovery_strategy);
            config.validation_level = as_str(root, "validation_level", config.validation_level);
            config.enable_result_cache = as_bool_flexible(root, "enable_result_cache", config.enable_result_cache);
            config.result_cache_capacity = as_int_flexible(root, "result_cache_capacity", config.result_cache_capacity);
            config.result_cache_ttl_seconds =
                as_int_flexible(root, "result_cache_ttl_seconds", config.result_cache_ttl_seconds);
            config.optimize_order = as_bool_flexible(root, "optimize_order", config.optimize_order);
            config.enable_batching = as_bool_flexible(root, "enable_batching", config.enable_batching);
            config.quiet = as_bool_flexible(root, "quiet", config.quiet);
            config.pretty_output = as_bool_flexible(root, "pretty_output", config.pretty_output);
            config.default_report_path = as_str(root, "default_report_path", config.default_report_path);
            if (!config.quiet) {
                std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
            }
        } catch (const YAML::Exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        }
    }
}

ProcessorOptions processor_options_from(const CliConfig& config) {
    ProcessorOptions options;
    if (auto strategy = parse_recovery_strategy(config.recovery_strategy)) {
        options.recovery = *strategy;
    } else {
        std::cerr << "Warning: Unknown recovery_strategy '" << config.recovery_strategy
                  << "'. Using " << to_string(options.recovery) << "." << std::endl;
    }
    options.enable_result_cache = config.enable_result_cache;
    options.optimize_order = config.optimize_order;
    options.enable_batching = config.enable_batching;
    options.quiet = config.quiet;
    return options;
}

OptimizerConfig optimizer_config_from(const CliConfig& config) {
    OptimizerConfig out;
    if (config.result_cache_capacity > 0) out.cache_capacity = static_cast<size_t>(config.result_cache_capacity);
    if (config.result_cache_ttl_seconds > 0) out.cache_ttl = std::chrono::seconds(config.result_cache_ttl_seconds);
    return out;
}

ValidationLevel validation_level_from(const CliConfig& config) {
    if (auto level = parse_validation_level(config.validation_level)) return *level;
    std::cerr << "Warning: Unknown validation_level '" << config.validation_level
              << "'. Using lenient." << std::endl;
    return ValidationLevel::Lenient;
}
