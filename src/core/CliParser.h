#pragma once

#include "CacheConfig.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <spdlog/spdlog.h>

class CliParser
{
public:
    struct Result
    {
        bool valid = true;
        bool show_help = false;
        std::string error_message;

        // Default values
        std::string pairs_file = "pairs.json";
        int repeat = 1;
        bool uncached = false;

        spdlog::level::level_enum log_level = spdlog::level::info;

        // Cache configuration
        core::CacheConfig cache_config;
    };

    static Result parse(int argc, char *argv[]);
    static void printHelp(const std::string &exeName);
    static spdlog::level::level_enum parseLogLevel(const std::string &s);

    // Value parsers shared with the server executable; throw std::invalid_argument
    static std::chrono::milliseconds parseIdleSeconds(const std::string &s);
    static size_t parseCount(const std::string &s);
};
