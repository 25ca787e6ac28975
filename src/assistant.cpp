#include "assistant.h"
#include "cache/cache_backend.h"
#include "catalog/popularity.h"
#include "catalog/product_catalog.h"
#include "intent/intent_classifier.h"
#include "intent/intent_model.h"
#include "intent/rule_table.h"
#include "llm_client.h"
#include "logger.h"
#include "policy/policy_corpus.h"
#include "policy/policy_engine.h"
#include "resolver/entity_resolver.h"
#include "router.h"
#include "session/session_manager.h"
#include <sstream>
#include <stdexcept>

namespace coop_assist {

class Assistant::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {}

    ~Impl() {
        stop();
    }

    VoidResult initialize() {
        if (router_) {
            return VoidResult();
        }

        // Core tables: any failure here is fatal
        auto rules = intent::IntentRuleTable::load(config_.data.rules_path);
        if (rules.is_error()) {
            return rules.error();
        }

        std::shared_ptr<const intent::IntentModel> model;
        if (config_.data.model_path.empty()) {
            Logger::warn("No statistical model configured");
        } else {
            auto loaded = intent::NaiveBayesIntentModel::load(config_.data.model_path,
                                                              config_.intent.min_feature_coverage);
            if (loaded.is_ok()) {
                model = loaded.value();
            } else {
                Logger::warn("Statistical model unavailable (" +
                             std::string(error_type_name(loaded.error().type)) + "): " +
                             loaded.error().message);
            }
        }

        auto products = catalog::ProductCatalog::load(config_.data.catalog_path);
        if (products.is_error()) {
            return products.error();
        }
        auto corpus = policy::PolicyCorpus::load(config_.data.policy_path, config_.policy.generic_category);
        if (corpus.is_error()) {
            return corpus.error();
        }

        catalog_ = std::make_unique<catalog::ProductCatalog>(std::move(products.value()));
        corpus_ = std::make_unique<policy::PolicyCorpus>(std::move(corpus.value()));

        try {
            classifier_ = std::make_unique<intent::IntentClassifier>(std::move(rules.value()), model,
                                                                     config_.intent);
            resolver_ = std::make_unique<resolver::EntityResolver>(*catalog_, config_.resolver);
            policy_ = std::make_unique<policy::PolicyEngine>(*corpus_, config_.policy);
        } catch (const std::exception& e) {
            return make_invalid_data_error(std::string("Failed to build engines: ") + e.what());
        }

        cache_ = std::make_unique<cache::AdaptiveCache>(config_.cache, cache::make_backend(config_.cache.backend));
        sessions_ = std::make_unique<session::SessionManager>(config_.session);
        popularity_ = std::make_unique<catalog::PopularityTracker>();

        auto llm = std::make_shared<LLMClient>(config_.llm);
        if (!llm->is_ready()) {
            Logger::warn("LLM client not ready; unanswerable messages get a fixed reply");
        }

        RouterComponents components;
        components.classifier = classifier_.get();
        components.catalog = catalog_.get();
        components.resolver = resolver_.get();
        components.policy = policy_.get();
        components.cache = cache_.get();
        components.sessions = sessions_.get();
        components.popularity = popularity_.get();
        components.llm = llm->is_ready() ? std::static_pointer_cast<GenerativeModel>(llm) : nullptr;
        router_ = std::make_unique<Router>(std::move(components), config_);

        Router* router = router_.get();
        cache_->set_preheat_provider([router](const std::string& query, QueryType type) {
            return router->preheat(query, type);
        });

        std::ostringstream oss;
        oss << "Assistant ready: " << catalog_->size() << " products, " << corpus_->size()
            << " policy sentences (v" << corpus_->version() << "), classifier "
            << (classifier_->has_model() ? "rules+statistical" : "rules only");
        Logger::info(oss.str());
        return VoidResult();
    }

    void start() {
        if (cache_) {
            cache_->start_maintenance();
        }
        if (sessions_) {
            sessions_->start_sweeper();
        }
    }

    void stop() {
        if (sessions_) {
            sessions_->stop_sweeper();
        }
        if (cache_) {
            cache_->stop_maintenance();
        }
    }

    Response handle(const std::string& message, const std::string& user_id) {
        if (!router_) {
            throw std::logic_error("Assistant::handle called before initialize()");
        }
        return router_->handle(message, user_id);
    }

    cache::CacheStats cache_stats() const {
        return cache_ ? cache_->stats() : cache::CacheStats{};
    }

    bool initialized() const { return router_ != nullptr; }

private:
    Config config_;

    std::unique_ptr<catalog::ProductCatalog> catalog_;
    std::unique_ptr<policy::PolicyCorpus> corpus_;
    std::unique_ptr<intent::IntentClassifier> classifier_;
    std::unique_ptr<resolver::EntityResolver> resolver_;
    std::unique_ptr<policy::PolicyEngine> policy_;
    std::unique_ptr<cache::AdaptiveCache> cache_;
    std::unique_ptr<session::SessionManager> sessions_;
    std::unique_ptr<catalog::PopularityTracker> popularity_;
    std::unique_ptr<Router> router_;
};

Assistant::Assistant(const Config& config)
    : pimpl_(std::make_unique<Impl>(config)) {
}

Assistant::~Assistant() = default;

VoidResult Assistant::initialize() {
    return pimpl_->initialize();
}

void Assistant::start() {
    pimpl_->start();
}

void Assistant::stop() {
    pimpl_->stop();
}

Response Assistant::handle(const std::string& message, const std::string& user_id) {
    return pimpl_->handle(message, user_id);
}

cache::CacheStats Assistant::cache_stats() const {
    return pimpl_->cache_stats();
}

bool Assistant::initialized() const {
    return pimpl_->initialized();
}

} // namespace coop_assist
