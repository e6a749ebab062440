#ifndef DISTANCE_RESULT_H
#define DISTANCE_RESULT_H

#include <utility>

namespace core
{

    /**
     * @struct DistanceResult
     * @brief Answer to an inverse-geodesic query between two points of a call.
     */
    struct DistanceResult
    {
        double distance = 0.0;         ///< Geodesic distance in meters
        double forward_azimuth = 0.0;  ///< Bearing at the first point towards the second, degrees
        double backward_azimuth = 0.0; ///< Bearing at the second point along the same geodesic, degrees

        DistanceResult() = default;
        DistanceResult(double dist, double fwd, double bwd)
            : distance(dist), forward_azimuth(fwd), backward_azimuth(bwd)
        {
        }

        /// @brief Exchange forward and backward azimuth. Distance is untouched.
        void swapDirections()
        {
            std::swap(forward_azimuth, backward_azimuth);
        }

        void swapDirectionsIf(bool flipped)
        {
            if (flipped)
            {
                swapDirections();
            }
        }

        bool operator==(const DistanceResult &other) const
        {
            return distance == other.distance &&
                   forward_azimuth == other.forward_azimuth &&
                   backward_azimuth == other.backward_azimuth;
        }

        bool operator!=(const DistanceResult &other) const { return !(*this == other); }
    };

} // namespace core

#endif // DISTANCE_RESULT_H
