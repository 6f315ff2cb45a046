#include "mcplink/log.hpp"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace mcplink::log {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current;

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto lg = std::make_shared<spdlog::logger>("mcplink", std::move(sink));
    lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    lg->set_level(spdlog::level::info);
    // Register so SPDLOG_LEVEL=mcplink=debug (or a global level) applies.
    spdlog::register_logger(lg);
    spdlog::cfg::load_env_levels();
    return lg;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current) {
        current = spdlog::get("mcplink");
        if (!current) current = make_default_logger();
    }
    return current;
}

void set_logger(std::shared_ptr<spdlog::logger> lg) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current = std::move(lg);
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace mcplink::log
