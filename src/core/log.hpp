#pragma once

#include <filesystem>
#include <string_view>
#include <spdlog/spdlog.h>

namespace tc::log {

/// Install the "tilecore" default logger: colored console, plus a file sink
/// when log_file is non-empty. Unknown level names fall back to info.
void init(const std::filesystem::path& log_file = {},
          std::string_view level = "info");

/// Flush and shutdown logging.
void shutdown();

/// Map a level name ("trace", "debug", "info", "warn", "error", "off").
spdlog::level::level_enum parse_level(std::string_view name);

} // namespace tc::log
