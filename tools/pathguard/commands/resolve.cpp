/**
 * pathguard CLI - resolve command
 *
 * Print the validated absolute path for each fragment, or why it was blocked.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <vector>

namespace pathguard::cli::commands {

namespace {

struct ResolveCmdOptions {
    std::vector<std::string> fragments;
    bool relative = false;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveCmdOptions& cmd_opts) {
    std::string error;
    auto config = load_config(opts, error);
    if (!config) {
        print_error(error, opts.json);
        return 1;
    }

    auto pipeline = open_pipeline(opts, *config);
    if (!pipeline) {
        return 1;
    }

    int exit_code = 0;
    nlohmann::json results = nlohmann::json::array();

    for (const auto& fragment : cmd_opts.fragments) {
        auto result = pipeline->run(fragment);
        if (!result.ok) {
            exit_code = 1;
        }

        std::string shown = result.path;
        if (result.ok && cmd_opts.relative) {
            shown = pipeline->relative_to_root(result.path).value_or(result.path);
        }

        if (opts.json) {
            auto j = result_to_json(fragment, result);
            if (result.ok) {
                j["path"] = shown;
            }
            results.push_back(j);
        } else if (result.ok) {
            std::cout << shown << std::endl;
        } else {
            std::cerr << "Blocked: " << fragment << " ("
                      << path_error_to_string(result.error) << ")" << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json out;
        out["root"] = pipeline->root().path();
        out["results"] = results;
        output_json(out);
    }

    return exit_code;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveCmdOptions resolve_opts;

    app->add_option("fragments", resolve_opts.fragments, "Path fragments to resolve")->required();
    app->add_flag("--relative", resolve_opts.relative, "Print paths relative to the root");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace pathguard::cli::commands
