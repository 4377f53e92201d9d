#include "pathguard/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

bool is_known_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

PolicyParseResult parse_policy_object(const nlohmann::json& j) {
    PolicyParseResult result;

    if (!j.is_object()) {
        result.error = "policy must be an object";
        return result;
    }

    auto kind = get_string(j, "kind");
    if (!kind) {
        result.error = "policy.kind missing";
        return result;
    }
    std::string k = to_lower(trim(*kind));

    if (k == "extension_rewrite") {
        auto suffix = get_string(j, "suffix");
        if (!suffix) {
            result.error = "extension_rewrite requires suffix";
            return result;
        }
        if (!is_single_component(*suffix)) {
            result.error = "extension_rewrite suffix must not contain a path separator";
            return result;
        }
        result.processor = ExtensionRewrite{*suffix};
    } else if (k == "relocate") {
        auto target = get_string(j, "target_dir");
        if (!target || trim(*target).empty()) {
            result.error = "relocate requires target_dir";
            return result;
        }
        result.processor = Relocate{*target};
    } else if (k == "timestamp_rotate") {
        TimestampRotate rotate;
        if (auto sep = get_string(j, "separator")) {
            rotate.separator = *sep;
        }
        auto token = get_string(j, "token");
        auto format = get_string(j, "format");
        if (token && format) {
            result.error = "timestamp_rotate takes either token or format, not both";
            return result;
        }
        if ((token && token->empty()) || (format && format->empty())) {
            result.error = "timestamp_rotate token and format must not be empty";
            return result;
        }
        if (!is_single_component(rotate.separator) ||
            (token && !is_single_component(*token)) ||
            (format && !is_single_component(*format))) {
            result.error = "timestamp_rotate must not contain a path separator";
            return result;
        }
        if (token) {
            rotate.clock = fixed_clock(*token);
        } else {
            rotate.clock = utc_clock(format ? *format : "%Y-%m-%d");
        }
        result.processor = std::move(rotate);
    } else {
        result.error = "unknown policy kind: " + *kind;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace

PolicyParseResult parse_policy(const std::string& json_str) {
    try {
        return parse_policy_object(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::parse_error& e) {
        PolicyParseResult result;
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        PolicyParseResult result;
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult parse_pipeline_config(const std::string& json_str,
                                        const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        // root (REQUIRED, absolute)
        if (auto root = get_string(j, "root")) {
            result.config.root = trim(*root);
        }
        if (result.config.root.empty()) {
            result.error = "root missing";
            return result;
        }
        if (!make_trusted_root(result.config.root).ok) {
            result.error = "root must be an absolute path: " + result.config.root;
            return result;
        }

        if (auto allow = get_bool(j, "allow_absolute")) {
            result.config.options.allow_absolute = *allow;
        }
        if (auto confine = get_bool(j, "confine_output")) {
            result.config.options.confine_output = *confine;
        }

        if (auto level = get_string(j, "log_level")) {
            std::string lower = to_lower(trim(*level));
            if (is_known_log_level(lower)) {
                result.config.log_level = lower;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_log_level");
            }
        }

        if (j.contains("policy")) {
            auto policy = parse_policy_object(j["policy"]);
            if (!policy.ok) {
                result.error = policy.error;
                return result;
            }
            result.config.policy = std::move(policy.processor);
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_pipeline_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "cannot read config: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();

    auto result = parse_pipeline_config(ss.str(), path);
    if (result.ok) {
        spdlog::debug("Loaded config {} (root {})", path, result.config.root);
    }
    for (const auto& w : result.warnings) {
        spdlog::warn("{}: {}", path, w);
    }
    return result;
}

PipelineCreateResult make_pipeline(const PipelineConfig& config) {
    return Pipeline::create(config.root, config.options);
}

} // namespace pathguard
