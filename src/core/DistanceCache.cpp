#include "DistanceCache.h"

#include <algorithm>
#include <mutex>
#include <new>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace core
{
    DistanceCache::DistanceCache(CacheConfig config)
        : m_config(std::move(config))
        , m_ttl_ns(0)
        , m_last_sweep(0)
    {
        if (m_config.max_capacity == 0)
        {
            throw std::invalid_argument("DistanceCache: max_capacity must be positive");
        }
        if (m_config.time_to_idle.count() <= 0)
        {
            throw std::invalid_argument("DistanceCache: time_to_idle must be positive");
        }
        if (m_config.time_to_idle > maxTimeToIdle())
        {
            throw std::invalid_argument("DistanceCache: time_to_idle exceeds the clock range");
        }
        if (!m_config.time_source)
        {
            throw std::invalid_argument("DistanceCache: time_source is empty");
        }

        m_ttl_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(m_config.time_to_idle).count();
        m_entries.reserve(std::min(m_config.initial_capacity, m_config.max_capacity));
        m_last_sweep = now();

        spdlog::debug("DistanceCache: created (time_to_idle={}ms, initial_capacity={}, max_capacity={})",
                      m_config.time_to_idle.count(), m_config.initial_capacity, m_config.max_capacity);
    }

    int64_t DistanceCache::now() const
    {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
                   m_config.time_source().time_since_epoch())
            .count();
    }

    bool DistanceCache::expired(const Entry &entry, int64_t now) const
    {
        return now - entry.last_access.load(std::memory_order_relaxed) > m_ttl_ns;
    }

    std::optional<DistanceResult> DistanceCache::lookup(const CacheKey &key) const
    {
        int64_t t = now();
        std::shared_lock<std::shared_mutex> lock(m_mutex);

        auto it = m_entries.find(key);
        if (it == m_entries.end() || expired(it->second, t))
        {
            m_misses.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        // Several readers may race here; keep the newest stamp
        int64_t prev = it->second.last_access.load(std::memory_order_relaxed);
        while (prev < t && !it->second.last_access.compare_exchange_weak(prev, t, std::memory_order_relaxed))
        {
        }

        m_hits.fetch_add(1, std::memory_order_relaxed);
        return it->second.result;
    }

    void DistanceCache::insert(const CacheKey &key, const DistanceResult &result)
    {
        int64_t t = now();
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        bool added = false;
        try
        {
            auto it = m_entries.find(key);
            if (it != m_entries.end())
            {
                it->second.result = result;
                it->second.last_access.store(t, std::memory_order_relaxed);
            }
            else
            {
                m_entries.emplace(std::piecewise_construct,
                                  std::forward_as_tuple(key),
                                  std::forward_as_tuple(result, t));
                added = true;
            }
            m_insertions.fetch_add(1, std::memory_order_relaxed);

            if (t - m_last_sweep > m_ttl_ns)
            {
                purgeExpiredLocked(t);
            }

            if (m_entries.size() > m_config.max_capacity)
            {
                purgeExpiredLocked(t);
                evictLocked(key);
            }
        }
        catch (const std::bad_alloc &)
        {
            // The caller already has its result; only the memoization is lost.
            // Undo our own insertion so the capacity bound still holds.
            if (added)
            {
                m_entries.erase(key);
                m_insertions.fetch_sub(1, std::memory_order_relaxed);
            }
            spdlog::warn("DistanceCache: allocation failed, entry {} -> {} not stored",
                         key.low.toString(), key.high.toString());
        }
    }

    void DistanceCache::purgeExpiredLocked(int64_t now)
    {
        std::size_t removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();)
        {
            if (expired(it->second, now))
            {
                it = m_entries.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        m_last_sweep = now;

        if (removed > 0)
        {
            m_expirations.fetch_add(removed, std::memory_order_relaxed);
            spdlog::trace("DistanceCache: expired {} idle entries", removed);
        }
    }

    void DistanceCache::evictLocked(const CacheKey &keep)
    {
        if (m_entries.size() <= m_config.max_capacity)
        {
            return;
        }

        // Evict a batch at once so the full scan amortizes over many inserts
        std::size_t excess = m_entries.size() - m_config.max_capacity;
        std::size_t batch = std::max<std::size_t>(1, m_config.max_capacity / 16);
        std::size_t target = std::min(m_entries.size() - 1, std::max(excess, batch));

        std::vector<std::pair<int64_t, CacheKey>> candidates;
        reserveEvictionCandidates(candidates, m_entries.size());
        for (const auto &kv : m_entries)
        {
            if (!(kv.first == keep))
            {
                candidates.emplace_back(kv.second.last_access.load(std::memory_order_relaxed), kv.first);
            }
        }

        target = std::min(target, candidates.size());
        auto by_age = [](const std::pair<int64_t, CacheKey> &a, const std::pair<int64_t, CacheKey> &b)
        { return a.first < b.first; };
        std::nth_element(candidates.begin(), candidates.begin() + target, candidates.end(), by_age);

        for (std::size_t i = 0; i < target; ++i)
        {
            m_entries.erase(candidates[i].second);
        }
        m_evictions.fetch_add(target, std::memory_order_relaxed);

        spdlog::debug("DistanceCache: evicted {} least recently used entries, {} remain", target, m_entries.size());
    }

    void DistanceCache::reserveEvictionCandidates(std::vector<std::pair<int64_t, CacheKey>> &candidates,
                                                  std::size_t count)
    {
        candidates.reserve(count);
    }

    bool DistanceCache::contains(const CacheKey &key) const
    {
        int64_t t = now();
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        return it != m_entries.end() && !expired(it->second, t);
    }

    std::size_t DistanceCache::size() const
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_entries.size();
    }

    CacheStats DistanceCache::stats() const
    {
        CacheStats s;
        s.hits = m_hits.load(std::memory_order_relaxed);
        s.misses = m_misses.load(std::memory_order_relaxed);
        s.insertions = m_insertions.load(std::memory_order_relaxed);
        s.evictions = m_evictions.load(std::memory_order_relaxed);
        s.expirations = m_expirations.load(std::memory_order_relaxed);
        s.entries = size();
        return s;
    }

} // namespace core
