#include "stmeta/log.hpp"

#include <cstdio>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace stmeta {

bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

namespace log {

void init(bool debug, bool color) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
        color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    auto logger = std::make_shared<spdlog::logger>("stmeta", std::move(sink));
    logger->set_pattern("%Y-%m-%d %H:%M:%S %^%l%$ %v");
    logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace log
} // namespace stmeta
