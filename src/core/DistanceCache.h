#ifndef DISTANCE_CACHE_H
#define DISTANCE_CACHE_H

#include "CacheConfig.h"
#include "Canonicalizer.h"
#include "DistanceResult.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace core
{
    struct CacheStats
    {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t insertions = 0;
        uint64_t evictions = 0;   ///< removed to respect max_capacity
        uint64_t expirations = 0; ///< removed after idling past time_to_idle
        std::size_t entries = 0;
    };

    /**
     * @class DistanceCache
     * @brief Size- and idle-bounded concurrent map from canonical position pairs to results.
     *
     * Reads take a shared lock and refresh the entry's idle timer atomically; writes take
     * an exclusive lock. The two are independent critical sections, so a caller never holds
     * one while acquiring the other. Entries are always stored in low -> high orientation.
     *
     * Construct one per process and share it; there is no global instance.
     */
    class DistanceCache
    {
    public:
        explicit DistanceCache(CacheConfig config = CacheConfig());

        virtual ~DistanceCache() = default;

        DistanceCache(const DistanceCache &) = delete;
        DistanceCache &operator=(const DistanceCache &) = delete;

        /**
         * @brief Look up a canonical key.
         * @return The stored result, or std::nullopt on a miss or an idle-expired entry.
         */
        std::optional<DistanceResult> lookup(const CacheKey &key) const;

        /**
         * @brief Store a result under a canonical key, overwriting any previous entry.
         *
         * Trims expired entries and evicts the least recently used ones when the cache
         * grows past max_capacity. Allocation failure is logged and the entry dropped;
         * size() never exceeds max_capacity afterwards.
         */
        void insert(const CacheKey &key, const DistanceResult &result);

        /// @brief Whether a live entry exists. Does not refresh the idle timer.
        bool contains(const CacheKey &key) const;

        std::size_t size() const;
        CacheStats stats() const;
        const CacheConfig &config() const { return m_config; }

    protected:
        /// Allocates the eviction scan buffer; may throw std::bad_alloc.
        virtual void reserveEvictionCandidates(std::vector<std::pair<int64_t, CacheKey>> &candidates,
                                               std::size_t count);

    private:
        struct Entry
        {
            Entry(const DistanceResult &r, int64_t now) : result(r), last_access(now) {}

            DistanceResult result;
            mutable std::atomic<int64_t> last_access; ///< ns on the cache clock
        };

        int64_t now() const;
        bool expired(const Entry &entry, int64_t now) const;
        void purgeExpiredLocked(int64_t now);
        void evictLocked(const CacheKey &keep);

        CacheConfig m_config;
        int64_t m_ttl_ns;

        mutable std::shared_mutex m_mutex;
        std::unordered_map<CacheKey, Entry, CacheKeyHash> m_entries;
        int64_t m_last_sweep;

        mutable std::atomic<uint64_t> m_hits{0};
        mutable std::atomic<uint64_t> m_misses{0};
        std::atomic<uint64_t> m_insertions{0};
        std::atomic<uint64_t> m_evictions{0};
        std::atomic<uint64_t> m_expirations{0};
    };

} // namespace core

#endif // DISTANCE_CACHE_H
