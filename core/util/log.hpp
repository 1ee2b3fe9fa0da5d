#pragma once

#include <fmt/format.h>

#include <string>
#include <utility>

namespace advtext {
namespace log {

// ─── Log Level ─────────────────────────────────────────────────
// Process-wide threshold. Defaults to Warn; ADVTEXT_LOG_LEVEL
// (debug|info|warn|error|off) overrides it on first use.

enum class Level { Debug = 0, Info, Warn, Error, Off };

void setLevel(Level level);
Level level();

/// Parse a level name. Unknown names map to Warn.
Level parseLevel(const std::string& name);

bool enabled(Level level);

/// Emit one already-formatted line, prefixed with the level tag.
void write(Level level, const std::string& message);

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace log
} // namespace advtext
