/**
 * pathguard CLI - Entry Point
 *
 * Resolve, validate and transform paths against a trusted root.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pathguard::cli::commands {
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_split(CLI::App* app, GlobalOptions& opts);
    void setup_transform(CLI::App* app, GlobalOptions& opts);
    void setup_rel(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pathguard::cli;

    CLI::App app{"pathguard - sandboxed path resolution"};
    app.set_version_flag("-V,--version", PATHGUARD_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Trusted root directory");
    app.add_option("--config", opts.config, "Pipeline configuration (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* resolve_cmd = app.add_subcommand("resolve", "Resolve and validate a path under the root");
    commands::setup_resolve(resolve_cmd, opts);

    auto* split_cmd = app.add_subcommand("split", "Split a filename into stem and suffixes");
    commands::setup_split(split_cmd, opts);

    auto* transform_cmd = app.add_subcommand("transform", "Resolve a path and compute its new name");
    commands::setup_transform(transform_cmd, opts);

    auto* rel_cmd = app.add_subcommand("rel", "Print the relative path between two paths");
    commands::setup_rel(rel_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
