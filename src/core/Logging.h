#ifndef LOGGING_H
#define LOGGING_H

#include <string>
#include <spdlog/spdlog.h>

namespace core
{
    /// Name of the process-wide file logger installed by setupFileLogging().
    constexpr const char *FILE_LOGGER_NAME = "file_logger";

    /**
     * Routes the default spdlog logger to <dir>/<prefix>_YYYYMMDD.log.
     *
     * Creates dir when missing. A previously installed file logger is replaced, so
     * calling this twice in one process does not throw. Returns the log file path.
     * Throws spdlog::spdlog_ex or std::filesystem::filesystem_error on failure.
     */
    std::string setupFileLogging(const std::string &prefix,
                                 spdlog::level::level_enum level,
                                 const std::string &dir = "logs");

} // namespace core

#endif // LOGGING_H
