#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sid::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the async logger described by the --log_* flags. Idempotent.
void init();

void shutdown();

auto parse_level(std::string_view level) -> spdlog::level::level_enum;

/// "event key=value ..." at info level.
void info(std::string_view event, const std::unordered_map<std::string, std::string>& fields);

}  // namespace sid::log
