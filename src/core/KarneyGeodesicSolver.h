#ifndef KARNEY_GEODESIC_SOLVER_H
#define KARNEY_GEODESIC_SOLVER_H

#include "IGeodesicSolver.h"

namespace core
{

    /**
     * @class KarneyGeodesicSolver
     * @brief Inverse geodesic on the WGS84 ellipsoid, after Karney (2011), via Boost.Geometry.
     *
     * Azimuths follow the GeographicLib convention: forward is the bearing at the
     * first point, backward is the bearing of the geodesic as it arrives at the
     * second point. Both are in degrees, (-180, 180].
     */
    class KarneyGeodesicSolver : public IGeodesicSolver
    {
    public:
        KarneyGeodesicSolver() = default;

        DistanceResult solve(const Position &low, const Position &high) const override;
    };

} // namespace core

#endif // KARNEY_GEODESIC_SOLVER_H
