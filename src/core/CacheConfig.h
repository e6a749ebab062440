#ifndef CACHE_CONFIG_H
#define CACHE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <functional>

namespace core
{
    using CacheClock = std::chrono::steady_clock;
    using TimeSource = std::function<CacheClock::time_point()>;

    /// Largest idle time the cache clock can represent (nanosecond ticks).
    inline std::chrono::milliseconds maxTimeToIdle()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max());
    }

    /**
     * @struct CacheConfig
     * @brief Fixed configuration of a DistanceCache, set once at construction.
     */
    struct CacheConfig
    {
        std::chrono::milliseconds time_to_idle = std::chrono::seconds(90); ///< Idle time before an entry expires
        std::size_t initial_capacity = 64;                                  ///< Pre-sizing hint only
        std::size_t max_capacity = 65536;                                   ///< Upper bound on live entries
        TimeSource time_source = [] { return CacheClock::now(); };         ///< Monotonic clock, replaceable in tests
    };

} // namespace core

#endif // CACHE_CONFIG_H
