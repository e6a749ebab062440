#include "core/CliParser.h"
#include "core/DistanceCache.h"
#include "core/DistanceService.h"
#include "core/GeodesicError.h"
#include "core/JsonPairParser.h"
#include "core/KarneyGeodesicSolver.h"
#include "core/Logging.h"

#include <iostream>
#include <iomanip>
#include <memory>
#include <optional>
#include <chrono>
#include <vector>
#include <spdlog/spdlog.h>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace
{
    struct PairOutcome
    {
        std::optional<core::DistanceResult> result;
        std::string error;
    };
} // namespace

int main(int argc, char *argv[])
{
    CliParser::Result cli = CliParser::parse(argc, argv);
    if (!cli.valid)
    {
        std::cout << "Error: " << cli.error_message << std::endl;
        return 1;
    }

    if (cli.show_help)
    {
        CliParser::printHelp(argv[0]);
        return 0;
    }

    // Setup logging
    try
    {
        core::setupFileLogging("geodist", cli.log_level);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Logging init failed: " << ex.what() << std::endl;
    }

    spdlog::info("CLI config: pairs={}, repeat={}, uncached={}, idle={}ms, initial_capacity={}, max_capacity={}",
                 cli.pairs_file,
                 cli.repeat,
                 cli.uncached ? "true" : "false",
                 cli.cache_config.time_to_idle.count(),
                 cli.cache_config.initial_capacity,
                 cli.cache_config.max_capacity);

    // One cache for the whole process, shared with the service
    std::shared_ptr<core::DistanceService> service;
    try
    {
        auto cache = std::make_shared<core::DistanceCache>(cli.cache_config);
        service = std::make_shared<core::DistanceService>(cache, std::make_shared<core::KarneyGeodesicSolver>());
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Failed to create distance cache: {}", ex.what());
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }

    // Load data
    std::vector<core::PositionPair> pairs;
    try
    {
        pairs = core::JsonPairParser::parseFile(cli.pairs_file);
    }
    catch (const std::exception &ex)
    {
        spdlog::error("Failed to parse pairs: {}", ex.what());
        std::cout << "Error: " << ex.what() << std::endl;
        return 1;
    }

    std::vector<PairOutcome> outcomes(pairs.size());
    int n_pairs = static_cast<int>(pairs.size());

#ifdef USE_OPENMP
    spdlog::info("Resolving {} pairs x{} using OpenMP with {} threads", n_pairs, cli.repeat, omp_get_max_threads());
#else
    spdlog::info("Resolving {} pairs x{} single-threaded (OpenMP not available)", n_pairs, cli.repeat);
#endif

    auto start_time = std::chrono::steady_clock::now();
    for (int round = 0; round < cli.repeat; ++round)
    {
// Each pair is an independent caller of the shared cache
#ifdef USE_OPENMP
#pragma omp parallel for schedule(dynamic, 16)
#endif
        for (int idx = 0; idx < n_pairs; ++idx)
        {
            const core::PositionPair &pair = pairs[idx];
            PairOutcome &outcome = outcomes[idx];
            try
            {
                outcome.result = cli.uncached ? service->computeDirect(pair.a, pair.b)
                                              : service->resolve(pair.a, pair.b);
                outcome.error.clear();
            }
            catch (const core::GeodesicError &ex)
            {
                outcome.result.reset();
                outcome.error = std::string(core::errorKindName(ex.kind())) + ": " + ex.what();
            }
        }
    }
    double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();

    for (int idx = 0; idx < n_pairs; ++idx)
    {
        const core::PositionPair &pair = pairs[idx];
        const PairOutcome &outcome = outcomes[idx];
        std::cout << pair.a.toString() << " -> " << pair.b.toString() << ": ";
        if (outcome.result)
        {
            std::cout << "distance = " << std::setprecision(10) << outcome.result->distance
                      << " m, forward azimuth = " << std::setprecision(10) << outcome.result->forward_azimuth
                      << ", backward azimuth = " << std::setprecision(10) << outcome.result->backward_azimuth
                      << std::endl;
        }
        else
        {
            std::cout << outcome.error << std::endl;
            spdlog::warn("Pair {} failed: {}", idx, outcome.error);
        }
    }

    core::CacheStats stats = service->cache()->stats();
    std::cout << "Resolved " << n_pairs << " pairs x" << cli.repeat << " in "
              << std::setprecision(4) << elapsed_ms << " ms" << std::endl;
    std::cout << "Cache: hits=" << stats.hits << ", misses=" << stats.misses
              << ", entries=" << stats.entries << ", evictions=" << stats.evictions
              << ", expirations=" << stats.expirations << std::endl;
    spdlog::info("Done in {:.3f} ms, cache hits={}, misses={}, entries={}", elapsed_ms, stats.hits, stats.misses, stats.entries);

    return 0;
}
