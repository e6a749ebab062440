#include "rest/GeodistServer.h"
#include "core/DistanceCache.h"
#include "core/DistanceService.h"
#include "core/CliParser.h"
#include "core/KarneyGeodesicSolver.h"
#include "core/Logging.h"
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>

void printHelp(const char *prog_name)
{
    std::cout << "Usage: " << prog_name << " [OPTIONS]\n"
              << "\nGeodesic distance REST API server\n"
              << "\nOptions:\n"
              << "  --port PORT           Listen port (default: 8080)\n"
              << "  --idle-seconds SECS   Cache idle time before eviction (default: 90)\n"
              << "  --max-capacity N      Maximum cached pairs (default: 65536)\n"
              << "  --help                Show this help message\n"
              << std::endl;
}

int main(int argc, char *argv[])
{
    try
    {
        core::setupFileLogging("geodist-server", spdlog::level::info);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Logging init failed: " << ex.what() << std::endl;
    }

    uint16_t port = 8080;
    core::CacheConfig config;

    // Parse arguments
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            printHelp(argv[0]);
            return 0;
        }
        else if ((arg == "--port" || arg == "--idle-seconds" || arg == "--max-capacity") && i + 1 < argc)
        {
            const std::string value = argv[++i];
            try
            {
                if (arg == "--port")
                {
                    size_t p = CliParser::parseCount(value);
                    if (p == 0 || p > 65535)
                        throw std::invalid_argument("port must be between 1 and 65535");
                    port = static_cast<uint16_t>(p);
                }
                else if (arg == "--idle-seconds")
                {
                    config.time_to_idle = CliParser::parseIdleSeconds(value);
                }
                else
                {
                    config.max_capacity = CliParser::parseCount(value);
                    if (config.max_capacity == 0)
                        throw std::invalid_argument("max capacity must be positive");
                }
            }
            catch (const std::invalid_argument &ex)
            {
                std::cerr << "Invalid value for " << arg << ": " << ex.what() << "\n";
                printHelp(argv[0]);
                return 1;
            }
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            printHelp(argv[0]);
            return 1;
        }
    }

    try
    {
        auto cache = std::make_shared<core::DistanceCache>(config);
        auto service = std::make_shared<core::DistanceService>(cache, std::make_shared<core::KarneyGeodesicSolver>());

        rest::GeodistServer server(port, service);
        server.start();
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Server error: {}", ex.what());
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
