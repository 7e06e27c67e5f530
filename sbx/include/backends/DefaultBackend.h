#pragma once

#include "common/ILoggerBackend.h"
#include <mutex>
#include <string>

namespace SBX {

/**
 * @brief Dependency-free stderr logger
 *
 * Used when SBX is built with SBX_USE_SPDLOG=OFF. Serializes writes with a mutex and
 * prints "[HH:MM:SS.mmm] [level] message" with ANSI level colors. No file sink.
 */
class DefaultBackend : public ILoggerBackend {
public:
    DefaultBackend();

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    LogLevel currentLevel_;
    std::mutex mutex_;

    static const char *levelToString(LogLevel level);
    static const char *levelToColor(LogLevel level);
    static std::string getTimestamp();
};

}  // namespace SBX
