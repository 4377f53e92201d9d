/**
 * pathguard CLI - transform command
 *
 * Resolve a fragment under the root and compute its destination path with
 * one policy. Nothing is moved or copied.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <optional>

namespace pathguard::cli::commands {

namespace {

struct TransformOptions {
    std::string fragment;
    std::optional<std::string> suffix;      // --suffix
    std::optional<std::string> relocate;    // --relocate
    std::optional<std::string> timestamp;   // --timestamp (fixed token)
    std::optional<std::string> format;      // --format (UTC strftime)
    std::string separator = "_";
};

// Flags win over the config policy
std::optional<FileProcessor> select_processor(const TransformOptions& t,
                                              const PipelineConfig& config,
                                              std::string& error) {
    int chosen = (t.suffix ? 1 : 0) + (t.relocate ? 1 : 0) +
                 ((t.timestamp || t.format) ? 1 : 0);
    if (chosen > 1) {
        error = "choose one of --suffix, --relocate, --timestamp/--format";
        return std::nullopt;
    }
    if (t.timestamp && t.format) {
        error = "--timestamp and --format are mutually exclusive";
        return std::nullopt;
    }

    if ((t.timestamp && t.timestamp->empty()) || (t.format && t.format->empty())) {
        error = "--timestamp and --format must not be empty";
        return std::nullopt;
    }
    for (const auto* text : {t.suffix ? &*t.suffix : nullptr,
                             t.timestamp ? &*t.timestamp : nullptr,
                             t.format ? &*t.format : nullptr,
                             &t.separator}) {
        if (text && !is_single_component(*text)) {
            error = "policy text must not contain a path separator: " + *text;
            return std::nullopt;
        }
    }

    if (t.suffix) {
        return FileProcessor{ExtensionRewrite{*t.suffix}};
    }
    if (t.relocate) {
        return FileProcessor{Relocate{*t.relocate}};
    }
    if (t.timestamp || t.format) {
        TimestampRotate rotate;
        rotate.clock = t.timestamp ? fixed_clock(*t.timestamp) : utc_clock(*t.format);
        rotate.separator = t.separator;
        return FileProcessor{std::move(rotate)};
    }
    if (config.policy) {
        return config.policy;
    }

    error = "no policy (use --suffix, --relocate, --timestamp or a config policy)";
    return std::nullopt;
}

int cmd_transform(const GlobalOptions& opts, const TransformOptions& t) {
    std::string error;
    auto config = load_config(opts, error);
    if (!config) {
        print_error(error, opts.json);
        return 1;
    }

    auto processor = select_processor(t, *config, error);
    if (!processor) {
        print_error(error, opts.json);
        return 1;
    }

    auto pipeline = open_pipeline(opts, *config);
    if (!pipeline) {
        return 1;
    }

    auto result = pipeline->run(t.fragment, *processor);

    if (opts.json) {
        auto j = result_to_json(t.fragment, result);
        j["policy"] = processor_kind(*processor);
        output_json(j);
    } else if (result.ok) {
        std::cout << result.path << std::endl;
    } else {
        std::cerr << "Blocked: " << t.fragment << " ("
                  << path_error_to_string(result.error) << ", at "
                  << pipeline_stage_to_string(result.stage) << ")" << std::endl;
    }

    return result.ok ? 0 : 1;
}

} // anonymous namespace

void setup_transform(CLI::App* app, GlobalOptions& opts) {
    static TransformOptions transform_opts;

    app->add_option("fragment", transform_opts.fragment, "Path fragment under the root")->required();
    app->add_option("--suffix", transform_opts.suffix, "Rewrite the last suffix");
    app->add_option("--relocate", transform_opts.relocate, "Move under this directory");
    app->add_option("--timestamp", transform_opts.timestamp, "Insert this token before the first suffix");
    app->add_option("--format", transform_opts.format, "Insert the current UTC time (strftime format)");
    app->add_option("--separator", transform_opts.separator, "Separator before the timestamp")
        ->capture_default_str();

    app->callback([&opts]() {
        std::exit(cmd_transform(opts, transform_opts));
    });
}

} // namespace pathguard::cli::commands
