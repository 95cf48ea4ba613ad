#ifndef TILEBOX_LOGGING_H
#define TILEBOX_LOGGING_H
#pragma once

#include <functional>
#include <optional>
#include <string>

namespace tilebox {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

std::string to_string(LogLevel level);
// Accepts the names printed by to_string, in any case.
std::optional<LogLevel> log_level_from_string(const std::string &name);
// 0 -> WARNING, 1 (-v) -> INFO, 2 and more (-vv) -> DEBUG.
LogLevel log_level_for_verbosity(int verbosity);

using LogCallback = std::function<void(LogLevel level, const std::string &message)>;

// Process wide AixLog setup. Messages below the level are dropped; the rest
// go to stderr, or to the callback while one is installed.
class Logger {
public:
    static void set_level(LogLevel level);
    static LogLevel level();

    // An empty callback restores the stderr sink.
    static void set_callback(LogCallback callback);
};

}  // namespace tilebox

#endif // TILEBOX_LOGGING_H
