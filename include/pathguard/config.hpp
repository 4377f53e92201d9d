#pragma once

#include "pathguard/file_processor.hpp"
#include "pathguard/pipeline.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Pipeline Configuration
// ============================================================================
//
// {
//   "$schema": "pathguard.config.v1",
//   "root": "/srv/uploads",
//   "allow_absolute": true,
//   "confine_output": false,
//   "log_level": "info",
//   "policy": { "kind": "extension_rewrite", "suffix": ".zip" }
// }

inline constexpr const char* kConfigSchema = "pathguard.config.v1";

struct PipelineConfig {
    std::string schema;
    std::string root;
    PipelineOptions options;
    std::optional<FileProcessor> policy;
    std::string log_level = "info";  // debug | info | warn | error

    // Source path for diagnostics
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    PipelineConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration from a JSON string
ConfigParseResult parse_pipeline_config(const std::string& json_str,
                                        const std::string& source_path = "");

// Read and parse a configuration file
ConfigParseResult load_pipeline_config(const std::string& path);

struct PolicyParseResult {
    bool ok = false;
    std::string error;
    std::optional<FileProcessor> processor;
};

// Parse a "policy" object:
//   {"kind": "extension_rewrite", "suffix": ".zip"}
//   {"kind": "relocate", "target_dir": "/backup"}
//   {"kind": "timestamp_rotate", "token": "2025-01-04"}
//   {"kind": "timestamp_rotate", "format": "%Y-%m-%d", "separator": "_"}
PolicyParseResult parse_policy(const std::string& json_str);

// Build a Pipeline from a parsed configuration
PipelineCreateResult make_pipeline(const PipelineConfig& config);

} // namespace pathguard
