#include "CliParser.h"

#include <cctype>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace
{
    // Whole-string numeric parsing; std::stod alone accepts trailing junk
    double parseDouble(const std::string &s)
    {
        size_t pos = 0;
        double v = 0.0;
        try
        {
            v = std::stod(s, &pos);
        }
        catch (const std::out_of_range &)
        {
            throw std::invalid_argument("out of range: '" + s + "'");
        }
        if (pos != s.size())
            throw std::invalid_argument("trailing characters in '" + s + "'");
        return v;
    }
} // namespace

size_t CliParser::parseCount(const std::string &s)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
        throw std::invalid_argument("expected a non-negative integer, got '" + s + "'");
    size_t pos = 0;
    unsigned long long v = 0;
    try
    {
        v = std::stoull(s, &pos);
    }
    catch (const std::out_of_range &)
    {
        throw std::invalid_argument("out of range: '" + s + "'");
    }
    if (pos != s.size() || v > std::numeric_limits<size_t>::max())
        throw std::invalid_argument("trailing characters in '" + s + "'");
    return static_cast<size_t>(v);
}

std::chrono::milliseconds CliParser::parseIdleSeconds(const std::string &s)
{
    double seconds = parseDouble(s);
    if (!std::isfinite(seconds) || seconds <= 0.0)
        throw std::invalid_argument("idle time must be a positive number of seconds, got '" + s + "'");

    // Compare in double before converting; the cache keeps its clock in nanoseconds
    double max_ms = static_cast<double>(core::maxTimeToIdle().count());
    double ms = seconds * 1000.0;
    if (ms >= max_ms)
        throw std::invalid_argument("idle time too large, got '" + s + "'");

    auto idle = std::chrono::milliseconds(static_cast<int64_t>(ms));
    if (idle.count() == 0)
        idle = std::chrono::milliseconds(1);
    return idle;
}

CliParser::Result CliParser::parse(int argc, char *argv[])
{
    Result r;

    for (int i = 1; i < argc; i++)
    {
        std::string a = argv[i];

        auto needValue = [&](const std::string &name) -> bool
        {
            if (i + 1 >= argc)
            {
                r.valid = false;
                r.error_message = "Missing value for " + name;
                return false;
            }
            return true;
        };

        try
        {
            if (a == "--help" || a == "-h")
            {
                r.show_help = true;
                return r;
            }
            else if (a == "--pairs-file" || a == "-f")
            {
                if (!needValue("--pairs-file"))
                    return r;
                r.pairs_file = argv[++i];
            }
            else if (a == "--idle-seconds" || a == "-i")
            {
                if (!needValue("--idle-seconds"))
                    return r;
                r.cache_config.time_to_idle = parseIdleSeconds(argv[++i]);
            }
            else if (a == "--initial-capacity" || a == "-c")
            {
                if (!needValue("--initial-capacity"))
                    return r;
                r.cache_config.initial_capacity = parseCount(argv[++i]);
            }
            else if (a == "--max-capacity" || a == "-m")
            {
                if (!needValue("--max-capacity"))
                    return r;
                r.cache_config.max_capacity = parseCount(argv[++i]);
                if (r.cache_config.max_capacity == 0)
                {
                    r.valid = false;
                    r.error_message = "--max-capacity must be positive";
                    return r;
                }
            }
            else if (a == "--repeat" || a == "-r")
            {
                if (!needValue("--repeat"))
                    return r;
                size_t repeat = parseCount(argv[++i]);
                if (repeat == 0 || repeat > 1000000)
                {
                    r.valid = false;
                    r.error_message = "--repeat must be between 1 and 1000000";
                    return r;
                }
                r.repeat = static_cast<int>(repeat);
            }
            else if (a == "--uncached" || a == "-u")
            {
                r.uncached = true;
            }
            else if (a == "--log-level" || a == "-l")
            {
                if (!needValue("--log-level"))
                    return r;
                r.log_level = parseLogLevel(argv[++i]);
            }
            else
            {
                r.valid = false;
                r.error_message = "Unknown argument: " + a;
                return r;
            }
        }
        catch (const std::exception &e)
        {
            r.valid = false;
            r.error_message = "Invalid value for " + a + ": " + e.what();
            return r;
        }
    }

    return r;
}

void CliParser::printHelp(const std::string &exeName)
{
    std::cout << "Usage: " << exeName << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --pairs-file, -f FILE        Path to position pairs JSON file (default pairs.json)\n"
              << "  --idle-seconds, -i VALUE     Cache idle time before eviction (default 90)\n"
              << "  --initial-capacity, -c N     Cache pre-sizing hint (default 64)\n"
              << "  --max-capacity, -m N         Maximum cached pairs (default 65536)\n"
              << "  --repeat, -r N               Resolve the batch N times (default 1)\n"
              << "  --uncached, -u               Bypass the cache\n"
              << "  --log-level, -l LEVEL        Logging level (trace/debug/info/warn/error)\n"
              << "  --help, -h                   Show this help message\n"
              << std::endl;
}

spdlog::level::level_enum CliParser::parseLogLevel(const std::string &s)
{
    std::string lvl = s;
    for (char &c : lvl)
        c = char(std::tolower(static_cast<unsigned char>(c)));

    if (lvl == "trace")
        return spdlog::level::trace;
    if (lvl == "debug")
        return spdlog::level::debug;
    if (lvl == "info")
        return spdlog::level::info;
    if (lvl == "warn" || lvl == "warning")
        return spdlog::level::warn;
    if (lvl == "err" || lvl == "error")
        return spdlog::level::err;
    if (lvl == "critical")
        return spdlog::level::critical;
    if (lvl == "off")
        return spdlog::level::off;

    return spdlog::level::info;
}
