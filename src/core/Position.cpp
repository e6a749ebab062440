#include "Position.h"
#include "GeodesicError.h"

#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace core
{
    namespace
    {
        constexpr uint64_t SIGN_BIT = 0x8000000000000000ULL;

        // splitmix64 finalizer
        uint64_t mix(uint64_t x)
        {
            x ^= x >> 30;
            x *= 0xbf58476d1ce4e5b9ULL;
            x ^= x >> 27;
            x *= 0x94d049bb133111ebULL;
            x ^= x >> 31;
            return x;
        }
    } // namespace

    uint64_t doubleBits(double value)
    {
        uint64_t bits;
        static_assert(sizeof(bits) == sizeof(value), "double must be 64 bits");
        std::memcpy(&bits, &value, sizeof(bits));
        return bits;
    }

    uint64_t totalOrderKey(double value)
    {
        uint64_t bits = doubleBits(value);
        // Negative values: flip everything so larger magnitudes sort lower.
        // Positive values: set the sign bit so they sort above all negatives.
        return (bits & SIGN_BIT) ? ~bits : (bits | SIGN_BIT);
    }

    Position::Position()
        : latitude(0.0)
        , longitude(0.0)
    {
    }

    Position::Position(double lat, double lon)
        : latitude(lat)
        , longitude(lon)
    {
    }

    void Position::validate() const
    {
        if (!std::isfinite(latitude) || !std::isfinite(longitude))
        {
            throw InvalidInputError("Position: non-finite coordinate " + toString());
        }
        if (latitude < -90.0 || latitude > 90.0)
        {
            throw InvalidInputError("Position: latitude out of range " + toString());
        }
        if (longitude < -180.0 || longitude > 180.0)
        {
            throw InvalidInputError("Position: longitude out of range " + toString());
        }
    }

    std::string Position::toString() const
    {
        std::ostringstream oss;
        oss << std::setprecision(17) << "(" << latitude << ", " << longitude << ")";
        return oss.str();
    }

    bool Position::operator==(const Position &other) const
    {
        return doubleBits(latitude) == doubleBits(other.latitude) &&
               doubleBits(longitude) == doubleBits(other.longitude);
    }

    bool Position::operator<(const Position &other) const
    {
        uint64_t lhs_lat = totalOrderKey(latitude);
        uint64_t rhs_lat = totalOrderKey(other.latitude);
        if (lhs_lat != rhs_lat)
        {
            return lhs_lat < rhs_lat;
        }
        return totalOrderKey(longitude) < totalOrderKey(other.longitude);
    }

    std::size_t PositionHash::operator()(const Position &p) const
    {
        uint64_t h = mix(doubleBits(p.getLatitude()));
        h ^= mix(doubleBits(p.getLongitude()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
        return static_cast<std::size_t>(h);
    }

} // namespace core
