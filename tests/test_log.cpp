#include <catch2/catch.hpp>
#include <fencelint/log.hpp>
#include "test_helpers.hpp"
#include <cstdio>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace fencelint::log;

using fencelint::testing::capture_stderr;

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("level_for_verbosity maps -v and -q counts", "[log]") {
    REQUIRE(level_for_verbosity(-1) == Error);
    REQUIRE(level_for_verbosity(0) == Info);
    REQUIRE(level_for_verbosity(1) == Debug);
    REQUIRE(level_for_verbosity(2) == Trace);
    REQUIRE(level_for_verbosity(5) == Trace);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled() == true);

    set_color_enabled(false);
    REQUIRE(is_color_enabled() == false);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("docs/a.md:3: unterminated code fence");
        error("analyzer missing");
    });
    REQUIRE(output == "warn: docs/a.md:3: unterminated code fence\n"
                      "error: analyzer missing\n");

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("found %zu document(s), linting %s blocks", static_cast<size_t>(4), "python");
    });
    REQUIRE(output == "info: found 4 document(s), linting python blocks\n");
}

TEST_CASE("Concurrent messages do not interleave within a line", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([t] {
                for (int i = 0; i < 20; ++i) info("worker %d message %d", t, i);
            });
        }
        for (auto& th : threads) th.join();
    });

    size_t lines = 0;
    size_t start = 0;
    while (start < output.size()) {
        auto nl = output.find('\n', start);
        REQUIRE(nl != std::string::npos);
        auto line = output.substr(start, nl - start);
        REQUIRE(line.rfind("info: worker ", 0) == 0);
        REQUIRE(line.find("message") != std::string::npos);
        ++lines;
        start = nl + 1;
    }
    REQUIRE(lines == 80);
}
