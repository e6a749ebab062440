#include "Logging.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>

namespace core
{
    std::string setupFileLogging(const std::string &prefix,
                                 spdlog::level::level_enum level,
                                 const std::string &dir)
    {
        std::filesystem::path logs_dir(dir);
        if (!std::filesystem::exists(logs_dir))
        {
            std::filesystem::create_directories(logs_dir);
        }

        auto now = std::chrono::system_clock::now();
        std::time_t tnow = std::chrono::system_clock::to_time_t(now);
        std::tm tmnow;
#ifdef _WIN32
        localtime_s(&tmnow, &tnow);
#else
        localtime_r(&tnow, &tmnow);
#endif

        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y%m%d", &tmnow);
        std::filesystem::path log_file_path = logs_dir / (prefix + "_" + buf + ".log");

        spdlog::drop(FILE_LOGGER_NAME);
        auto file_logger = spdlog::basic_logger_mt(FILE_LOGGER_NAME, log_file_path.string());
        spdlog::set_default_logger(file_logger);
        spdlog::set_level(level);

        spdlog::info("Logging initialized ({})", log_file_path.string());
        return log_file_path.string();
    }

} // namespace core
