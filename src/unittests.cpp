#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "spdlog/spdlog.h"

int main(int argc, char* argv[]) {
    // Keep test output to errors.
    spdlog::set_level(spdlog::level::err);
    doctest::Context context;
    context.setOption("order-by", "file");
    context.applyCommandLine(argc, argv);
    return context.run();
}
