#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    // Blocked paths are logged at warn; keep test output readable
    spdlog::set_level(spdlog::level::off);

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    return context.run();
}
