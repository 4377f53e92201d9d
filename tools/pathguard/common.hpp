/**
 * pathguard CLI - Common utilities and types
 */

#pragma once

#include <pathguard/pathguard.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace pathguard::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline void apply_log_level(const std::string& level) {
    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Load the config named by --config, if any, and set the log level.
 * Flags win over the config: -v forces debug, -q and --json force error.
 */
inline std::optional<PipelineConfig> load_config(const GlobalOptions& opts, std::string& error) {
    std::optional<PipelineConfig> config;
    std::string level = "warn";

    if (!opts.config.empty()) {
        auto parsed = load_pipeline_config(opts.config);
        if (!parsed.ok) {
            error = parsed.error;
            return std::nullopt;
        }
        level = parsed.config.log_level;
        config = std::move(parsed.config);
    }

    if (opts.verbose) {
        level = "debug";
    } else if (opts.quiet || opts.json) {
        level = "error";
    }
    apply_log_level(level);

    if (!config) {
        config = PipelineConfig{};
    }
    return config;
}

/**
 * Resolve the trusted root.
 * Priority: --root flag > PATHGUARD_ROOT env > config "root"
 */
inline std::string resolve_root(const GlobalOptions& opts, const PipelineConfig& config) {
    if (!opts.root.empty()) {
        return opts.root;
    }

    std::string env_root = safe_getenv("PATHGUARD_ROOT");
    if (!env_root.empty()) {
        return env_root;
    }

    return config.root;
}

/**
 * Build the pipeline for a command from flags, environment and config.
 */
inline std::optional<Pipeline> open_pipeline(const GlobalOptions& opts,
                                             const PipelineConfig& config) {
    std::string root = resolve_root(opts, config);
    if (root.empty()) {
        print_error("no trusted root (use --root, PATHGUARD_ROOT or a config file)", opts.json);
        return std::nullopt;
    }

    auto created = Pipeline::create(root, config.options);
    if (!created.ok) {
        print_error("invalid trusted root: " + root, opts.json);
        return std::nullopt;
    }
    return std::move(created.pipeline);
}

inline nlohmann::json result_to_json(const std::string& input, const PipelineResult& result) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["input"] = input;
    j["stage"] = pipeline_stage_to_string(result.stage);
    if (result.ok) {
        j["path"] = result.path;
    } else {
        j["error"] = path_error_to_string(result.error);
    }
    return j;
}

} // namespace pathguard::cli
