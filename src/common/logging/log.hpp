#pragma once

#include <spdlog/spdlog.h>
#include <map>
#include <string>
#include <string_view>

namespace srunner::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process-wide async logger configured from the logging flags.
/// Later calls are no-ops until shutdown().
void init();

void shutdown();

/// Emit `event key=value ...` at info level.
void info(std::string_view event, const std::map<std::string, std::string>& fields);

}  // namespace srunner::log
