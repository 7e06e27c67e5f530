#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace SBX {

/**
 * @brief spdlog-based logger backend
 *
 * Default backend for SBX_USE_SPDLOG=ON builds. Writes to a colored stderr sink and,
 * when a log directory is given, to <logDir>/sbx.log as well.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace SBX
