#include "tilebox/logging.h"

#include "string_util.h"

#include "aixlog.hpp"

#include <memory>
#include <mutex>

namespace tilebox {

namespace {

struct LevelName {
    LogLevel level;
    const char *name;
    AixLog::Severity severity;
};

constexpr LevelName kLevels[] = {
    {LogLevel::DEBUG, "debug", AixLog::Severity::debug},
    {LogLevel::INFO, "info", AixLog::Severity::info},
    {LogLevel::WARNING, "warning", AixLog::Severity::warning},
    {LogLevel::ERROR, "error", AixLog::Severity::error},
};

const LevelName &entry_for(LogLevel level) {
    for (const auto &entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[2];
}

// AixLog severities between ours (notice) round down; trace counts as debug, fatal as error.
LogLevel from_severity(AixLog::Severity severity) {
    LogLevel result = LogLevel::DEBUG;
    for (const auto &entry : kLevels) {
        if (static_cast<int>(entry.severity) <= static_cast<int>(severity)) {
            result = entry.level;
        }
    }
    return result;
}

class LogSetup {
public:
    static LogSetup &instance() {
        static LogSetup setup;
        return setup;
    }

    LogLevel level() {
        std::lock_guard<std::mutex> lock(_mutex);
        return _level;
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(_mutex);
        _level = level;
        install();
    }

    void set_callback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(_mutex);
        _callback = std::move(callback);
        install();
    }

private:
    LogSetup() { install(); }

    void install() {
        AixLog::Filter filter;
        filter.add_filter(entry_for(_level).severity);
        if (_callback) {
            LogCallback callback = _callback;
            AixLog::Log::init({std::make_shared<AixLog::SinkCallback>(
                filter, [callback](const AixLog::Metadata &metadata, const std::string &message) {
                    callback(from_severity(metadata.severity), message);
                })});
        } else {
            AixLog::Log::init({std::make_shared<AixLog::SinkCerr>(filter, "[#severity] #message")});
        }
    }

    std::mutex _mutex;
    LogLevel _level = LogLevel::WARNING;
    LogCallback _callback;
};

}  // namespace

std::string to_string(LogLevel level) {
    return entry_for(level).name;
}

std::optional<LogLevel> log_level_from_string(const std::string &name) {
    const std::string wanted = detail::to_lower(detail::trim(name));
    for (const auto &entry : kLevels) {
        if (wanted == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

LogLevel log_level_for_verbosity(int verbosity) {
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    }
    return verbosity == 1 ? LogLevel::INFO : LogLevel::WARNING;
}

void Logger::set_level(LogLevel level) {
    LogSetup::instance().set_level(level);
}

LogLevel Logger::level() {
    return LogSetup::instance().level();
}

void Logger::set_callback(LogCallback callback) {
    LogSetup::instance().set_callback(std::move(callback));
}

}  // namespace tilebox
