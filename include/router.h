#pragma once

#include "cache/adaptive_cache.h"
#include "catalog/popularity.h"
#include "catalog/product_catalog.h"
#include "core/config.h"
#include "core/types.h"
#include "intent/intent_classifier.h"
#include "llm_client.h"
#include "policy/policy_engine.h"
#include "resolver/entity_resolver.h"
#include "session/session_manager.h"
#include <memory>
#include <optional>
#include <string>

namespace coop_assist {

/**
 * @brief Components the Router works with
 *
 * Tables and engines are borrowed and must outlive the Router. The
 * generative model is optional; without it the fallback is a fixed apology.
 */
struct RouterComponents {
    const intent::IntentClassifier* classifier = nullptr;
    const catalog::ProductCatalog* catalog = nullptr;
    const resolver::EntityResolver* resolver = nullptr;
    const policy::PolicyEngine* policy = nullptr;
    cache::AdaptiveCache* cache = nullptr;
    session::SessionManager* sessions = nullptr;
    catalog::PopularityTracker* popularity = nullptr;  ///< Bumped per resolved product
    std::shared_ptr<GenerativeModel> llm;
};

/**
 * @brief Single entry point from the transport layer
 *
 * Per message:
 * 1. selection forms: "policy_category:<id>", "product_selection:<key>",
 *    or, while options are pending, a raw key or an ordinal ("2", "第2个")
 * 2. any other message clears a pending clarification
 * 3. elliptical price follow-ups answered from the last resolved product
 * 4. intent classification and dispatch; product and policy answers go
 *    through the cache, a named category lists its products, and
 *    recommendations are ordered by popularity
 * 5. generative fallback for "unknown" intents and empty policy searches,
 *    called with a timeout after any tiered result has been cached
 */
class Router {
public:
    Router(RouterComponents components, const config::EngineConfig& config);
    ~Router();

    // Non-copyable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    /**
     * @brief Handle one user message
     * @return Reply text plus selectable options (may be empty)
     */
    Response handle(const std::string& raw_message, const std::string& user_id);

    /**
     * @brief Cache payload for a preheat query, without touching sessions
     *
     * Installed as the cache's preheat provider.
     */
    std::optional<std::string> preheat(const std::string& query, QueryType type) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace coop_assist
