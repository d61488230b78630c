// Console logger with a process-wide severity floor.
#pragma once

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace Forge {

enum class LogLevel { Debug, Info, Warning, Error, Silent };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    // Messages below this level are dropped. Tests raise it to keep output quiet.
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
};

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Forge
