#include "cache/adaptive_cache.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

using json = nlohmann::json;

namespace coop_assist {
namespace cache {

// =============================================================================
// Statistics
// =============================================================================

json CacheStats::to_json() const {
    json j;
    j["tracked_queries"] = tracked_queries;
    j["total_accesses"] = total_accesses;
    j["hits"] = hits;
    j["misses"] = misses;
    j["hit_rate"] = hit_rate;
    j["entries"] = entries;
    j["type_distribution"] = type_distribution;
    json hot = json::array();
    for (const auto& kv : hot_keys) {
        hot.push_back({{"key", kv.first}, {"frequency", kv.second}});
    }
    j["hot_keys"] = hot;
    j["backend"] = {
        {"enabled", backend_enabled},
        {"available", backend_available},
        {"errors", backend_errors}
    };
    return j;
}

// =============================================================================
// Implementation
// =============================================================================

namespace {

struct CacheEntry {
    std::string value;
    std::optional<QueryType> type;
    TimePoint stored;
    TimePoint expires;
    int ttl_s = 0;
};

struct AccessStats {
    unsigned frequency = 0;
    TimePoint last_access;
    std::optional<QueryType> type;
};

struct Stripe {
    mutable std::mutex mutex;
    std::unordered_map<std::string, CacheEntry> entries;
    std::unordered_map<std::string, AccessStats> stats;
};

const char* type_label(const std::optional<QueryType>& type) {
    return type ? query_type_to_string(*type) : "untyped";
}

} // namespace

class AdaptiveCache::Impl {
public:
    Impl(const config::CacheConfig& config, std::shared_ptr<CacheBackend> backend, ClockFn clock)
        : config_(config),
          backend_(std::move(backend)),
          clock_(clock ? std::move(clock) : ClockFn(steady_now)),
          stripes_(std::max<size_t>(1, config.stripes)) {
    }

    ~Impl() {
        stop_maintenance();
    }

    int compute_ttl(std::optional<QueryType> type, unsigned frequency) const {
        int base = config_.ttl.normal_s;
        if (type) {
            switch (*type) {
                case QueryType::Policy:  base = config_.ttl.policy_s; break;
                case QueryType::Product: base = config_.ttl.product_s; break;
                case QueryType::Chat:    base = config_.ttl.chat_s; break;
            }
        }
        if (frequency > config_.hot_threshold) {
            return std::max(base, config_.ttl.hot_s);
        }
        if (frequency > config_.warm_threshold) {
            return base;
        }
        return std::min(base, config_.ttl.rare_s);
    }

    std::optional<std::string> get(const std::string& key) {
        const std::optional<QueryType> type = AdaptiveCache::type_of(key);
        const TimePoint now = clock_();
        {
            Stripe& stripe = stripe_for(key);
            std::lock_guard<std::mutex> lock(stripe.mutex);
            AccessStats& st = stripe.stats[key];
            st.frequency++;
            st.last_access = now;
            st.type = type;

            auto it = stripe.entries.find(key);
            if (it != stripe.entries.end()) {
                CacheEntry& entry = it->second;
                if (now < entry.expires) {
                    int ttl = compute_ttl(entry.type, st.frequency);
                    if (ttl > entry.ttl_s) {
                        entry.ttl_s = ttl;
                        entry.expires = entry.stored + Seconds(ttl);
                        LOG_CACHE("TTL of '" + key + "' extended to " + std::to_string(ttl) + "s");
                    }
                    hits_++;
                    return entry.value;
                }
                stripe.entries.erase(it);
            }
        }

        auto remote = call_backend<std::optional<std::string>>(
            [key](CacheBackend& b) { return b.get(key); }, "get");
        if (remote && remote->is_ok() && remote->value()) {
            std::string value = *remote->value();
            store(key, value, type, now);
            hits_++;
            LOG_CACHE("Backend hit for '" + key + "'");
            return value;
        }

        misses_++;
        return std::nullopt;
    }

    void put(const std::string& key, const std::string& value, QueryType type) {
        int ttl = store(key, value, type, clock_());
        LOG_CACHE("Stored '" + key + "' ttl=" + std::to_string(ttl) + "s");
        call_backend<void>([key, value, ttl](CacheBackend& b) { return b.set(key, value, ttl); }, "set");
    }

    std::optional<int> entry_ttl(const std::string& key) const {
        const Stripe& stripe = stripe_for(key);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        auto it = stripe.entries.find(key);
        if (it == stripe.entries.end() || !(clock_() < it->second.expires)) {
            return std::nullopt;
        }
        return it->second.ttl_s;
    }

    unsigned frequency(const std::string& key) const {
        const Stripe& stripe = stripe_for(key);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        auto it = stripe.stats.find(key);
        return it == stripe.stats.end() ? 0 : it->second.frequency;
    }

    bool invalidate(const std::string& key) {
        bool existed = false;
        {
            Stripe& stripe = stripe_for(key);
            std::lock_guard<std::mutex> lock(stripe.mutex);
            existed = stripe.entries.erase(key) > 0;
        }
        call_backend<void>([key](CacheBackend& b) { return b.remove(key); }, "remove");
        return existed;
    }

    size_t invalidate_type(QueryType type) {
        std::vector<std::string> removed;
        for (auto& stripe : stripes_) {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            for (auto it = stripe.entries.begin(); it != stripe.entries.end();) {
                if (it->second.type == type) {
                    removed.push_back(it->first);
                    it = stripe.entries.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& key : removed) {
            call_backend<void>([key](CacheBackend& b) { return b.remove(key); }, "remove");
        }
        Logger::info(std::string("[Cache] Invalidated ") + std::to_string(removed.size()) + " " +
                     query_type_to_string(type) + " entries");
        return removed.size();
    }

    void clear() {
        for (auto& stripe : stripes_) {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            stripe.entries.clear();
            stripe.stats.clear();
        }
        hits_ = 0;
        misses_ = 0;
        Logger::info("[Cache] Cleared");
    }

    MaintenanceReport maintain() {
        MaintenanceReport report;
        const TimePoint now = clock_();
        const auto retention = Seconds(config_.stats_retention_s);
        const size_t batch = std::max<size_t>(1, config_.maintenance_batch);

        for (auto& stripe : stripes_) {
            // Snapshot keys, then work through them a batch per lock acquisition
            std::vector<std::string> keys;
            {
                std::lock_guard<std::mutex> lock(stripe.mutex);
                keys.reserve(stripe.entries.size() + stripe.stats.size());
                for (const auto& kv : stripe.entries) keys.push_back(kv.first);
                for (const auto& kv : stripe.stats) {
                    if (!stripe.entries.count(kv.first)) keys.push_back(kv.first);
                }
            }

            for (size_t start = 0; start < keys.size(); start += batch) {
                size_t end = std::min(keys.size(), start + batch);
                std::lock_guard<std::mutex> lock(stripe.mutex);
                for (size_t i = start; i < end; ++i) {
                    const std::string& key = keys[i];
                    auto st = stripe.stats.find(key);
                    unsigned freq = st == stripe.stats.end() ? 0 : st->second.frequency;

                    auto it = stripe.entries.find(key);
                    if (it != stripe.entries.end()) {
                        if (!(now < it->second.expires)) {
                            stripe.entries.erase(it);
                            report.evicted++;
                        } else {
                            int ttl = compute_ttl(it->second.type, freq);
                            if (ttl > it->second.ttl_s) {
                                it->second.ttl_s = ttl;
                                it->second.expires = it->second.stored + Seconds(ttl);
                                report.ttl_extended++;
                            }
                        }
                    }

                    if (st != stripe.stats.end() && now - st->second.last_access > retention &&
                        !stripe.entries.count(key)) {
                        stripe.stats.erase(st);
                        report.stats_dropped++;
                    }
                }
            }
        }

        report.preheated = preheat();

        CacheStats s = stats();
        std::ostringstream oss;
        oss << "[Cache] Maintenance: evicted=" << report.evicted
            << " ttl_extended=" << report.ttl_extended
            << " stats_dropped=" << report.stats_dropped
            << " preheated=" << report.preheated
            << " entries=" << s.entries
            << " hit_rate=" << s.hit_rate;
        Logger::info(oss.str());
        return report;
    }

    void set_preheat_provider(PreheatProvider provider) {
        std::lock_guard<std::mutex> lock(preheat_mutex_);
        preheat_provider_ = std::move(provider);
    }

    void start_maintenance() {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (worker_.joinable()) {
            return;
        }
        stop_requested_ = false;
        worker_ = std::thread(&Impl::maintenance_loop, this);
        Logger::info("[Cache] Maintenance every " + std::to_string(config_.maintenance_interval_s) + "s");
    }

    void stop_maintenance() {
        {
            std::lock_guard<std::mutex> lock(worker_mutex_);
            if (!worker_.joinable()) {
                return;
            }
            stop_requested_ = true;
        }
        worker_cv_.notify_all();
        worker_.join();
    }

    CacheStats stats() const {
        CacheStats s;
        const TimePoint now = clock_();
        std::vector<std::pair<std::string, unsigned>> hot;
        for (const auto& stripe : stripes_) {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            s.tracked_queries += stripe.stats.size();
            for (const auto& kv : stripe.stats) {
                s.total_accesses += kv.second.frequency;
                s.type_distribution[type_label(kv.second.type)] += kv.second.frequency;
                if (kv.second.frequency > config_.warm_threshold) {
                    hot.emplace_back(kv.first, kv.second.frequency);
                }
            }
            for (const auto& kv : stripe.entries) {
                if (now < kv.second.expires) s.entries++;
            }
        }

        std::sort(hot.begin(), hot.end(), [](const std::pair<std::string, unsigned>& a,
                                             const std::pair<std::string, unsigned>& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
        if (hot.size() > constants::cache::HOT_KEYS_REPORTED) {
            hot.resize(constants::cache::HOT_KEYS_REPORTED);
        }
        s.hot_keys = std::move(hot);

        s.hits = hits_;
        s.misses = misses_;
        uint64_t lookups = s.hits + s.misses;
        s.hit_rate = lookups ? static_cast<double>(s.hits) / static_cast<double>(lookups) : 0.0;

        s.backend_enabled = backend_ != nullptr;
        s.backend_available = backend_ != nullptr && !backend_cooling_down(now);
        s.backend_errors = backend_errors_;
        return s;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& stripe : stripes_) {
            std::lock_guard<std::mutex> lock(stripe.mutex);
            total += stripe.entries.size();
        }
        return total;
    }

private:
    Stripe& stripe_for(const std::string& key) {
        return stripes_[std::hash<std::string>{}(key) % stripes_.size()];
    }

    const Stripe& stripe_for(const std::string& key) const {
        return stripes_[std::hash<std::string>{}(key) % stripes_.size()];
    }

    int store(const std::string& key, const std::string& value, std::optional<QueryType> type, TimePoint now) {
        Stripe& stripe = stripe_for(key);
        std::lock_guard<std::mutex> lock(stripe.mutex);
        auto st = stripe.stats.find(key);
        unsigned freq = st == stripe.stats.end() ? 0 : st->second.frequency;
        int ttl = compute_ttl(type, freq);

        CacheEntry& entry = stripe.entries[key];
        entry.value = value;
        entry.type = type;
        entry.stored = now;
        entry.ttl_s = ttl;
        entry.expires = now + Seconds(ttl);
        return ttl;
    }

    size_t preheat() {
        PreheatProvider provider;
        {
            std::lock_guard<std::mutex> lock(preheat_mutex_);
            provider = preheat_provider_;
        }
        if (!provider) {
            return 0;
        }

        size_t count = 0;
        auto run = [&](const std::vector<std::string>& queries, QueryType type) {
            for (const auto& query : queries) {
                std::string key = AdaptiveCache::make_key(query, type);
                if (entry_ttl(key)) {
                    continue;  // Still live
                }
                std::optional<std::string> value = provider(query, type);
                if (value) {
                    store(key, *value, type, clock_());
                    count++;
                }
            }
        };
        run(config_.preheat_policy, QueryType::Policy);
        run(config_.preheat_product, QueryType::Product);
        return count;
    }

    void maintenance_loop() {
        maintain();
        std::unique_lock<std::mutex> lock(worker_mutex_);
        while (!stop_requested_) {
            worker_cv_.wait_for(lock, Seconds(std::max(1, config_.maintenance_interval_s)),
                                [this] { return stop_requested_; });
            if (stop_requested_) {
                break;
            }
            lock.unlock();
            maintain();
            lock.lock();
        }
    }

    bool backend_cooling_down(TimePoint now) const {
        std::lock_guard<std::mutex> lock(backend_mutex_);
        return now < backend_retry_at_;
    }

    /**
     * @brief Run one backend operation with the configured timeout
     * @return nullopt when there is no backend or it is cooling down
     */
    template<typename T>
    std::optional<Result<T>> call_backend(std::function<Result<T>(CacheBackend&)> op, const char* what) {
        if (!backend_ || backend_cooling_down(clock_())) {
            return std::nullopt;
        }

        struct Call {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            std::optional<Result<T>> result;
        };
        auto call = std::make_shared<Call>();
        std::shared_ptr<CacheBackend> backend = backend_;

        // The worker owns everything it touches, so it may outlive this call
        std::thread worker([call, backend, op]() {
            std::optional<Result<T>> r;
            try {
                r.emplace(op(*backend));
            } catch (const std::exception& e) {
                r.emplace(make_error(ErrorType::Unknown, e.what()));
            }
            {
                std::lock_guard<std::mutex> lock(call->mutex);
                call->result = std::move(r);
                call->done = true;
            }
            call->cv.notify_one();
        });

        std::unique_lock<std::mutex> lock(call->mutex);
        bool finished = call->cv.wait_for(lock, Duration(config_.backend.timeout_ms),
                                          [&call] { return call->done; });
        if (!finished) {
            lock.unlock();
            worker.detach();
            backend_failed(std::string("Backend ") + what + " timed out after " +
                           std::to_string(config_.backend.timeout_ms) + "ms");
            return Result<T>(make_timeout_error());
        }
        std::optional<Result<T>> result = std::move(call->result);
        lock.unlock();
        worker.join();

        if (result->is_error()) {
            backend_failed(std::string("Backend ") + what + " failed: " + result->error().message);
        }
        return result;
    }

    void backend_failed(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            backend_retry_at_ = clock_() + Duration(config_.backend.retry_after_ms);
        }
        backend_errors_++;
        Logger::warn("[Cache] " + reason + "; serving local-only for " +
                     std::to_string(config_.backend.retry_after_ms) + "ms");
    }

    config::CacheConfig config_;
    std::shared_ptr<CacheBackend> backend_;
    ClockFn clock_;
    std::vector<Stripe> stripes_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> backend_errors_{0};

    mutable std::mutex backend_mutex_;
    TimePoint backend_retry_at_{};

    std::mutex preheat_mutex_;
    PreheatProvider preheat_provider_;

    std::mutex worker_mutex_;
    std::condition_variable worker_cv_;
    std::thread worker_;
    bool stop_requested_ = false;
};

// =============================================================================
// Public interface
// =============================================================================

AdaptiveCache::AdaptiveCache(const config::CacheConfig& config,
                             std::shared_ptr<CacheBackend> backend,
                             ClockFn clock)
    : pimpl_(std::make_unique<Impl>(config, std::move(backend), std::move(clock))) {
}

AdaptiveCache::~AdaptiveCache() = default;

std::string AdaptiveCache::normalize_query(const std::string& query) {
    static const std::vector<std::string> STOP_WORDS = {
        "多少", "的", "了", "吗", "呢", "啊", "呀", "吧", "是"
    };
    std::string text = utils::strip_punctuation(utils::normalize_utterance(query));
    for (const auto& stop : STOP_WORDS) {
        size_t pos = 0;
        while ((pos = text.find(stop, pos)) != std::string::npos) {
            text.erase(pos, stop.size());
        }
    }
    return text;
}

std::string AdaptiveCache::make_key(const std::string& query, QueryType type, const std::string& context) {
    std::string key = std::string(query_type_to_string(type)) + ":" + normalize_query(query);
    if (!context.empty()) {
        key += "||" + context;
    }
    return key;
}

std::optional<QueryType> AdaptiveCache::type_of(const std::string& key) {
    size_t colon = key.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return query_type_from_string(key.substr(0, colon));
}

std::optional<std::string> AdaptiveCache::get(const std::string& key) {
    return pimpl_->get(key);
}

void AdaptiveCache::put(const std::string& key, const std::string& value, QueryType type) {
    pimpl_->put(key, value, type);
}

int AdaptiveCache::compute_ttl(std::optional<QueryType> type, unsigned frequency) const {
    return pimpl_->compute_ttl(type, frequency);
}

std::optional<int> AdaptiveCache::entry_ttl(const std::string& key) const {
    return pimpl_->entry_ttl(key);
}

unsigned AdaptiveCache::frequency(const std::string& key) const {
    return pimpl_->frequency(key);
}

bool AdaptiveCache::invalidate(const std::string& key) {
    return pimpl_->invalidate(key);
}

size_t AdaptiveCache::invalidate_type(QueryType type) {
    return pimpl_->invalidate_type(type);
}

void AdaptiveCache::clear() {
    pimpl_->clear();
}

MaintenanceReport AdaptiveCache::maintain() {
    return pimpl_->maintain();
}

void AdaptiveCache::set_preheat_provider(PreheatProvider provider) {
    pimpl_->set_preheat_provider(std::move(provider));
}

void AdaptiveCache::start_maintenance() {
    pimpl_->start_maintenance();
}

void AdaptiveCache::stop_maintenance() {
    pimpl_->stop_maintenance();
}

CacheStats AdaptiveCache::stats() const {
    return pimpl_->stats();
}

size_t AdaptiveCache::size() const {
    return pimpl_->size();
}

} // namespace cache
} // namespace coop_assist
