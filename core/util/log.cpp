#include "util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace advtext {
namespace log {

namespace {

Level levelFromEnvironment() {
    const char* value = std::getenv("ADVTEXT_LOG_LEVEL");
    if (!value) return Level::Warn;
    return parseLevel(value);
}

std::atomic<Level>& currentLevel() {
    static std::atomic<Level> current{levelFromEnvironment()};
    return current;
}

char tag(Level level) {
    switch (level) {
        case Level::Debug: return 'D';
        case Level::Info:  return 'I';
        case Level::Warn:  return 'W';
        case Level::Error: return 'E';
        case Level::Off:   break;
    }
    return '?';
}

} // namespace

void setLevel(Level level) { currentLevel().store(level); }

Level level() { return currentLevel().load(); }

Level parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info")  return Level::Info;
    if (lowered == "error") return Level::Error;
    if (lowered == "off")   return Level::Off;
    return Level::Warn;
}

bool enabled(Level l) {
    return l != Level::Off && static_cast<int>(l) >= static_cast<int>(level());
}

void write(Level l, const std::string& message) {
    fmt::print(stderr, "[{}] {}\n", tag(l), message);
}

} // namespace log
} // namespace advtext
