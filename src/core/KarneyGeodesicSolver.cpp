#include "KarneyGeodesicSolver.h"
#include "GeodesicError.h"

#include <cmath>
#include <boost/geometry/srs/spheroid.hpp>
#include <boost/geometry/formulas/karney_inverse.hpp>
#include <spdlog/spdlog.h>

namespace core
{
    namespace
    {
        using InverseFormula = boost::geometry::formula::karney_inverse<double, true, true, true>;

        const boost::geometry::srs::spheroid<double> &wgs84()
        {
            // default-constructed spheroid carries the WGS84 axes
            static const boost::geometry::srs::spheroid<double> spheroid;
            return spheroid;
        }

        double normalizeAzimuth(double azimuth)
        {
            if (azimuth <= -180.0)
                return azimuth + 360.0;
            if (azimuth > 180.0)
                return azimuth - 360.0;
            return azimuth;
        }
    } // namespace

    DistanceResult KarneyGeodesicSolver::solve(const Position &low, const Position &high) const
    {
        low.validate();
        high.validate();

        // Degenerate self-distance: no defined bearing, report both as 0
        if (low == high)
        {
            return DistanceResult(0.0, 0.0, 0.0);
        }

        InverseFormula::result_type r = InverseFormula::apply(low.getLongitude(), low.getLatitude(),
                                                              high.getLongitude(), high.getLatitude(),
                                                              wgs84());

        if (!std::isfinite(r.distance) || !std::isfinite(r.azimuth) || !std::isfinite(r.reverse_azimuth))
        {
            if (spdlog::should_log(spdlog::level::debug))
            {
                spdlog::debug("KarneyGeodesicSolver: non-finite solution for {} -> {}", low.toString(), high.toString());
            }
            throw SolverFailureError("KarneyGeodesicSolver: inverse problem did not converge for " +
                                     low.toString() + " -> " + high.toString());
        }

        return DistanceResult(r.distance, normalizeAzimuth(r.azimuth), normalizeAzimuth(r.reverse_azimuth));
    }

} // namespace core
