#include "stmeta/log.hpp"

#include "test_common.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

int main() {
    // Debug startup: named logger, everything from debug up
    {
        stmeta::log::init(true, false);
        auto logger = spdlog::default_logger();
        CHECK(logger->name() == "stmeta");
        CHECK(logger->level() == spdlog::level::debug);
        CHECK(logger->should_log(spdlog::level::debug));
        CHECK(logger->sinks().size() == 1);
        spdlog::debug("debug line {}", 1);
    }

    // Default startup drops debug lines
    {
        stmeta::log::init(false, false);
        auto logger = spdlog::default_logger();
        CHECK(logger->name() == "stmeta");
        CHECK(logger->level() == spdlog::level::info);
        CHECK(!logger->should_log(spdlog::level::debug));
        CHECK(logger->should_log(spdlog::level::warn));
        spdlog::info("info line {}", 2);
    }

    // Colour off for CLI output
    {
        stmeta::Ansi ansi;
        ansi.enabled = false;
        CHECK(ansi.red().empty());
        CHECK(ansi.reset().empty());
        ansi.enabled = true;
        CHECK(ansi.red() == "\x1b[31m");
    }

    std::cout << "All tests passed.\n";
    return 0;
}
