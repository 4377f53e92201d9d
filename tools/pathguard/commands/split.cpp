/**
 * pathguard CLI - split command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pathguard::cli::commands {

namespace {

struct SplitOptions {
    std::string name;
};

int cmd_split(const GlobalOptions& opts, const SplitOptions& split_opts) {
    auto split = split_extensions(split_opts.name);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["stem"] = split.stem;
        j["chain"] = split.chain;
        j["extension"] = split.extension();
        output_json(j);
        return 0;
    }

    std::cout << "Stem: " << split.stem << std::endl;
    if (split.chain.empty()) {
        std::cout << "Suffixes: (none)" << std::endl;
    } else {
        std::cout << "Suffixes:";
        for (const auto& suffix : split.chain) {
            std::cout << " " << suffix;
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_split(CLI::App* app, GlobalOptions& opts) {
    static SplitOptions split_opts;

    app->add_option("name", split_opts.name, "Filename or path")->required();

    app->callback([&opts]() {
        std::exit(cmd_split(opts, split_opts));
    });
}

} // namespace pathguard::cli::commands
