#pragma once

#include "cache/adaptive_cache.h"
#include "core/config.h"
#include "core/types.h"
#include "errors.h"
#include <memory>
#include <string>

namespace coop_assist {

/**
 * @brief Co-op assistant orchestrator
 *
 * Owns the loaded tables and every engine component:
 * - rule table, statistical model, catalog and policy corpus (loaded once)
 * - resolver, policy engine, cache, session manager, LLM client
 * - the Router that ties them together
 *
 * A bad rule table, catalog or policy corpus fails initialize(); a missing
 * statistical model only downgrades classification to rules.
 */
class Assistant {
public:
    explicit Assistant(const Config& config);

    ~Assistant();

    // Non-copyable
    Assistant(const Assistant&) = delete;
    Assistant& operator=(const Assistant&) = delete;

    /**
     * @brief Load tables and build components
     * @return Error describing the first fatal load failure
     */
    VoidResult initialize();

    /// Start background cache maintenance and the session sweeper
    void start();

    /// Stop background work (idempotent)
    void stop();

    /**
     * @brief Answer one message (thread-safe)
     */
    Response handle(const std::string& message, const std::string& user_id);

    cache::CacheStats cache_stats() const;

    bool initialized() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace coop_assist
