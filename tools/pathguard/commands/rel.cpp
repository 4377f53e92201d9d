/**
 * pathguard CLI - rel command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct RelOptions {
    std::string base;
    std::string target;
};

int cmd_rel(const GlobalOptions& opts, const RelOptions& rel_opts) {
    auto rel = relative_path(rel_opts.base, rel_opts.target);
    if (!rel) {
        print_error("cannot make " + rel_opts.target + " relative to " + rel_opts.base, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["base"] = rel_opts.base;
        j["target"] = rel_opts.target;
        j["relative"] = *rel;
        output_json(j);
    } else {
        std::cout << *rel << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_rel(CLI::App* app, GlobalOptions& opts) {
    static RelOptions rel_opts;

    app->add_option("base", rel_opts.base, "Starting directory")->required();
    app->add_option("target", rel_opts.target, "Destination path")->required();

    app->callback([&opts]() {
        std::exit(cmd_rel(opts, rel_opts));
    });
}

} // namespace pathguard::cli::commands
