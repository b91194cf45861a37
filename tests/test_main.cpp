// tests/test_main.cpp
//
// The only translation unit that defines DOCTEST_CONFIG_IMPLEMENT. Other test
// files include doctest without it.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#undef DOCTEST_CONFIG_IMPLEMENT

#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>

namespace {

bool env_truthy(const char* v) {
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    context.setOption("order-by", "name");
    context.setOption("duration", true);

    if (env_truthy(std::getenv("CI"))) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // generation logs are noise here; MAZEGEN_TEST_LOG=1 brings them back
    spdlog::set_level(env_truthy(std::getenv("MAZEGEN_TEST_LOG")) ? spdlog::level::debug
                                                                  : spdlog::level::warn);

    context.applyCommandLine(argc, argv);

    return context.run();
}
