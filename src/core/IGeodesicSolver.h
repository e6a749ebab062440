#ifndef I_GEODESIC_SOLVER_H
#define I_GEODESIC_SOLVER_H

#include "DistanceResult.h"
#include "Position.h"

namespace core
{

    /**
     * @class IGeodesicSolver
     * @brief Inverse geodesic problem: distance and azimuths between two points.
     *
     * Implementations must be pure and safe to call from several threads at once.
     * Callers pass the pair in canonical order (low <= high). Failures are reported
     * as InvalidInputError or SolverFailureError.
     */
    class IGeodesicSolver
    {
    public:
        virtual ~IGeodesicSolver() = default;
        virtual DistanceResult solve(const Position &low, const Position &high) const = 0;
    };

} // namespace core

#endif // I_GEODESIC_SOLVER_H
