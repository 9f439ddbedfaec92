// patch_cli configuration definition and I/O declarations
#pragma once

#include <string>

#include "patch_file.hpp"
#include "kernel/patch_processor.hpp"

struct CliConfig {
    std::string loaded_config_path;
    std::string recovery_strategy = "retry_with_fallback";
    std::string validation_level = "lenient";
    bool enable_result_cache = true;
    int result_cache_capacity = 1000;
    int result_cache_ttl_seconds = 300;
    bool optimize_order = true;
    bool enable_batching = true;
    bool quiet = false;
    bool pretty_output = false;
    // Empty means no JSON report unless -r is given.
    std::string default_report_path = "";
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, CliConfig& config);

// Unknown strategy names fall back to the default with a warning.
oxp::ProcessorOptions processor_options_from(const CliConfig& config);
oxp::OptimizerConfig optimizer_config_from(const CliConfig& config);
oxp::ValidationLevel validation_level_from(const CliConfig& config);
