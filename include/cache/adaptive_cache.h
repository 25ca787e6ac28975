#pragma once

/**
 * @file adaptive_cache.h
 * @brief Frequency-aware response cache with type-dependent TTL
 */

#include "cache/cache_backend.h"
#include "core/config.h"
#include "core/types.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coop_assist {
namespace cache {

/**
 * @brief Snapshot for the statistics endpoint
 */
struct CacheStats {
    size_t tracked_queries = 0;   ///< Keys with access statistics
    uint64_t total_accesses = 0;  ///< Sum of tracked frequencies
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;        ///< hits / (hits + misses)
    size_t entries = 0;           ///< Live local entries
    std::map<std::string, uint64_t> type_distribution;    ///< Accesses per query type
    std::vector<std::pair<std::string, unsigned>> hot_keys;  ///< Most accessed, best first
    bool backend_enabled = false;
    bool backend_available = false;
    uint64_t backend_errors = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Result of one maintenance pass
 */
struct MaintenanceReport {
    size_t evicted = 0;
    size_t ttl_extended = 0;
    size_t stats_dropped = 0;
    size_t preheated = 0;
};

/**
 * @brief Produces the value to cache for a preheat query
 *
 * Returns nullopt when the query has no tiered answer (nothing is cached).
 */
using PreheatProvider = std::function<std::optional<std::string>(const std::string& query, QueryType type)>;

/**
 * @brief Adaptive cache manager
 *
 * TTL for a key is picked from its query type and its access frequency:
 * - frequency > hot threshold:  max(type base, hot TTL)
 * - frequency > warm threshold: type base
 * - otherwise:                  min(type base, rare TTL)
 * Every get() counts as an access, hit or miss. A hit whose frequency now
 * earns a longer TTL has its expiry extended in place.
 *
 * Entries and statistics are split into lock stripes by key hash, so
 * unrelated keys never contend. Maintenance walks the stripes in bounded
 * batches. An optional secondary backend is called with a timeout; after
 * a failure it is skipped for a retry interval and the cache serves
 * local-only.
 */
class AdaptiveCache {
public:
    /**
     * @param backend Secondary storage (nullptr = local only)
     * @param clock Time source (steady clock by default)
     */
    explicit AdaptiveCache(const config::CacheConfig& config,
                           std::shared_ptr<CacheBackend> backend = nullptr,
                           ClockFn clock = steady_now);
    ~AdaptiveCache();

    // Non-copyable
    AdaptiveCache(const AdaptiveCache&) = delete;
    AdaptiveCache& operator=(const AdaptiveCache&) = delete;

    /**
     * @brief Build a cache key: "<type>:<normalized query>[||<context>]"
     *
     * Normalization lower-cases, removes whitespace and punctuation, and
     * drops the stop characters 的了吗呢啊呀吧是 and the word 多少.
     */
    static std::string make_key(const std::string& query, QueryType type,
                                const std::string& context = "");

    /// Normalized query part of a key
    static std::string normalize_query(const std::string& query);

    /// Query type encoded in a key's prefix
    static std::optional<QueryType> type_of(const std::string& key);

    /**
     * @brief Look up a key (counts as an access)
     * @return Value, or nullopt on a miss or expired entry
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * @brief Store a value; its TTL follows the key's current frequency
     */
    void put(const std::string& key, const std::string& value, QueryType type);

    /// TTL the key would get now
    int compute_ttl(std::optional<QueryType> type, unsigned frequency) const;

    /// TTL assigned to a live entry (seconds), nullopt when absent or expired
    std::optional<int> entry_ttl(const std::string& key) const;

    /// Access count of a key
    unsigned frequency(const std::string& key) const;

    /// Drop one entry (local and backend); true if a local entry existed
    bool invalidate(const std::string& key);

    /// Drop every entry of a type, e.g. after the policy data changed
    size_t invalidate_type(QueryType type);

    /// Drop all entries and statistics
    void clear();

    /**
     * @brief One maintenance pass
     *
     * Evicts expired entries, extends TTLs that grew with frequency, drops
     * statistics idle past the retention window, then refreshes preheat
     * queries that have no live entry.
     */
    MaintenanceReport maintain();

    /// Source of preheat values; unset means preheat is skipped
    void set_preheat_provider(PreheatProvider provider);

    /// Run maintain() now and then every configured interval on a background thread
    void start_maintenance();
    void stop_maintenance();

    CacheStats stats() const;

    size_t size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace cache
} // namespace coop_assist
