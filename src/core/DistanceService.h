#ifndef DISTANCE_SERVICE_H
#define DISTANCE_SERVICE_H

#include "DistanceCache.h"
#include "DistanceResult.h"
#include "IGeodesicSolver.h"
#include "Position.h"

#include <future>
#include <memory>

namespace core
{

    /**
     * @class DistanceService
     * @brief Memoized distance/bearing queries between two positions.
     *
     * The pair is canonicalized, the cache is consulted under a read lock, and on a miss
     * the solver runs with no lock held before the result is written back. Results
     * returned to a caller whose argument order was flipped have their azimuths swapped;
     * the cached entry never is.
     */
    class DistanceService
    {
    public:
        DistanceService(std::shared_ptr<DistanceCache> cache, std::shared_ptr<const IGeodesicSolver> solver);

        /**
         * @brief Cache-backed query. Safe to call concurrently.
         * @throws InvalidInputError, SolverFailureError from the solver; failures are never cached.
         */
        DistanceResult resolve(const Position &a, const Position &b) const;

        /**
         * @brief resolve() on a separate task. Errors surface from future::get().
         */
        std::future<DistanceResult> resolveAsync(const Position &a, const Position &b) const;

        /**
         * @brief Same canonicalization and azimuth handling as resolve(), without touching the cache.
         */
        DistanceResult computeDirect(const Position &a, const Position &b) const;

        template <typename A, typename B>
        DistanceResult resolve(const A &a, const B &b) const
        {
            return resolve(toPosition(a), toPosition(b));
        }

        template <typename A, typename B>
        std::future<DistanceResult> resolveAsync(const A &a, const B &b) const
        {
            return resolveAsync(toPosition(a), toPosition(b));
        }

        template <typename A, typename B>
        DistanceResult computeDirect(const A &a, const B &b) const
        {
            return computeDirect(toPosition(a), toPosition(b));
        }

        const std::shared_ptr<DistanceCache> &cache() const { return m_cache; }

    private:
        std::shared_ptr<DistanceCache> m_cache;
        std::shared_ptr<const IGeodesicSolver> m_solver;
    };

} // namespace core

#endif // DISTANCE_SERVICE_H
