#include "DistanceService.h"
#include "Canonicalizer.h"
#include "GeodesicError.h"

#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace core
{
    namespace
    {
        DistanceResult solveCanonical(const IGeodesicSolver &solver, const CanonicalPair &pair)
        {
            try
            {
                return solver.solve(pair.low, pair.high);
            }
            catch (const GeodesicError &ex)
            {
                if (spdlog::should_log(spdlog::level::debug))
                {
                    spdlog::debug("DistanceService: {} for {} -> {}: {}",
                                  errorKindName(ex.kind()), pair.low.toString(), pair.high.toString(), ex.what());
                }
                throw;
            }
        }

        DistanceResult resolveCached(DistanceCache &cache, const IGeodesicSolver &solver,
                                     const Position &a, const Position &b)
        {
            CanonicalPair pair = canonicalize(a, b);
            CacheKey key = pair.key();
            // Formatting positions costs more than a hit; skip it unless tracing
            const bool tracing = spdlog::should_log(spdlog::level::trace);

            if (auto hit = cache.lookup(key))
            {
                if (tracing)
                {
                    spdlog::trace("DistanceService: cache hit {} -> {}", pair.low.toString(), pair.high.toString());
                }
                hit->swapDirectionsIf(pair.flipped);
                return *hit;
            }

            if (tracing)
            {
                spdlog::trace("DistanceService: cache miss {} -> {}", pair.low.toString(), pair.high.toString());
            }

            // No lock is held while the solver runs; concurrent misses may both compute
            DistanceResult result = solveCanonical(solver, pair);
            cache.insert(key, result);

            result.swapDirectionsIf(pair.flipped);
            return result;
        }
    } // namespace

    DistanceService::DistanceService(std::shared_ptr<DistanceCache> cache, std::shared_ptr<const IGeodesicSolver> solver)
        : m_cache(std::move(cache))
        , m_solver(std::move(solver))
    {
        if (!m_cache)
        {
            throw std::invalid_argument("DistanceService: cache is null");
        }
        if (!m_solver)
        {
            throw std::invalid_argument("DistanceService: solver is null");
        }
    }

    DistanceResult DistanceService::resolve(const Position &a, const Position &b) const
    {
        return resolveCached(*m_cache, *m_solver, a, b);
    }

    std::future<DistanceResult> DistanceService::resolveAsync(const Position &a, const Position &b) const
    {
        // The task keeps cache and solver alive on its own
        std::shared_ptr<DistanceCache> cache = m_cache;
        std::shared_ptr<const IGeodesicSolver> solver = m_solver;
        return std::async(std::launch::async, [cache, solver, a, b]()
                          { return resolveCached(*cache, *solver, a, b); });
    }

    DistanceResult DistanceService::computeDirect(const Position &a, const Position &b) const
    {
        CanonicalPair pair = canonicalize(a, b);
        DistanceResult result = solveCanonical(*m_solver, pair);
        result.swapDirectionsIf(pair.flipped);
        return result;
    }

} // namespace core
