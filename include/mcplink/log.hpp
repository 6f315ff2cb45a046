#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace mcplink::log {

/// Library-wide logger ("mcplink"). Writes to stderr by default, since
/// stdout usually carries the protocol. The initial level is info unless
/// SPDLOG_LEVEL says otherwise.
std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger (e.g. with a null sink in tests).
void set_logger(std::shared_ptr<spdlog::logger> logger);

void set_level(spdlog::level::level_enum level);

} // namespace mcplink::log
