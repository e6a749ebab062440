#ifndef POSITION_H
#define POSITION_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace core
{

    /**
     * @class Position
     * @brief Immutable geographic position in degrees.
     *
     * Equality and hashing work on the raw IEEE-754 bit patterns, so two positions
     * are the same cache key only when both coordinates are bit-identical.
     * Ordering is a total order over (latitude, longitude) used for canonicalizing
     * pairs; it carries no geographic meaning.
     */
    class Position
    {
    public:
        Position();
        Position(double lat, double lon);

        double getLatitude() const { return latitude; }
        double getLongitude() const { return longitude; }

        /// @brief Throws InvalidInputError unless both coordinates are finite and in range.
        void validate() const;

        std::string toString() const;

        bool operator==(const Position &other) const;
        bool operator!=(const Position &other) const { return !(*this == other); }
        bool operator<(const Position &other) const;
        bool operator>(const Position &other) const { return other < *this; }
        bool operator<=(const Position &other) const { return !(other < *this); }

    private:
        double latitude;  ///< Latitude in degrees
        double longitude; ///< Longitude in degrees
    };

    /// @brief Raw bit pattern of a double.
    uint64_t doubleBits(double value);

    /// @brief Key that orders doubles by IEEE-754 totalOrder (-NaN < -inf < ... < -0 < +0 < ... < +inf < NaN).
    uint64_t totalOrderKey(double value);

    struct PositionHash
    {
        std::size_t operator()(const Position &p) const;
    };

    /// @brief Converts anything exposing getLatitude()/getLongitude() to a Position.
    template <typename T>
    Position toPosition(const T &value)
    {
        return Position(value.getLatitude(), value.getLongitude());
    }

    inline Position toPosition(const Position &value)
    {
        return value;
    }

} // namespace core

#endif // POSITION_H
