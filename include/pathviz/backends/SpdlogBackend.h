#pragma once

#include "pathviz/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace pathviz {

/**
 * @brief spdlog-based logger backend
 *
 * Console sink (stderr) always; a file sink (pathviz.log) when a log directory is
 * given. The initial level honours LOG_LEVEL / SPDLOG_LEVEL.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    /// @throws std::filesystem::filesystem_error or spdlog::spdlog_ex when the
    ///         log directory or file cannot be created
    SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    spdlog::level::level_enum convertLevel(LogLevel level);
};

}  // namespace pathviz
