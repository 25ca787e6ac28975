/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "logger.h"
#include "path_utils.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace coop_assist {
namespace config {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    if (!j.contains("logging")) return config;

    const auto& logging = j["logging"];
    config.level = get_or_default(logging, "level", config.level);
    config.file = get_or_default(logging, "file", config.file);
    return config;
}

DataConfig parse_data_config(const json& j) {
    DataConfig config;
    if (!j.contains("data")) return config;

    const auto& data = j["data"];
    config.rules_path = get_or_default(data, "rules_path", config.rules_path);
    config.model_path = get_or_default(data, "model_path", config.model_path);
    config.catalog_path = get_or_default(data, "catalog_path", config.catalog_path);
    config.policy_path = get_or_default(data, "policy_path", config.policy_path);
    return config;
}

IntentConfig parse_intent_config(const json& j) {
    IntentConfig config;
    if (!j.contains("intent")) return config;

    const auto& intent = j["intent"];
    config.statistical_threshold = get_or_default(intent, "statistical_threshold", config.statistical_threshold);
    config.min_feature_coverage = get_or_default(intent, "min_feature_coverage", config.min_feature_coverage);
    return config;
}

ResolverConfig parse_resolver_config(const json& j) {
    ResolverConfig config;
    if (!j.contains("resolver")) return config;

    const auto& resolver = j["resolver"];
    config.threshold = get_or_default(resolver, "threshold", config.threshold);
    config.max_options = get_or_default(resolver, "max_options", config.max_options);
    return config;
}

PolicyConfig parse_policy_config(const json& j) {
    PolicyConfig config;
    if (!j.contains("policy")) return config;

    const auto& policy = j["policy"];
    config.top_k = get_or_default(policy, "top_k", config.top_k);
    config.tfidf_threshold = get_or_default(policy, "tfidf_threshold", config.tfidf_threshold);
    config.fallback_context_max_bytes = get_or_default(policy, "fallback_context_max_bytes",
                                                       config.fallback_context_max_bytes);
    config.generic_category = get_or_default(policy, "generic_category", config.generic_category);
    config.refund_category = get_or_default(policy, "refund_category", config.refund_category);
    return config;
}

CacheConfig parse_cache_config(const json& j) {
    CacheConfig config;
    if (!j.contains("cache")) return config;

    const auto& cache = j["cache"];
    if (cache.contains("ttl")) {
        const auto& ttl = cache["ttl"];
        config.ttl.hot_s = get_or_default(ttl, "hot_s", config.ttl.hot_s);
        config.ttl.normal_s = get_or_default(ttl, "normal_s", config.ttl.normal_s);
        config.ttl.rare_s = get_or_default(ttl, "rare_s", config.ttl.rare_s);
        config.ttl.policy_s = get_or_default(ttl, "policy_s", config.ttl.policy_s);
        config.ttl.product_s = get_or_default(ttl, "product_s", config.ttl.product_s);
        config.ttl.chat_s = get_or_default(ttl, "chat_s", config.ttl.chat_s);
    }
    config.hot_threshold = get_or_default(cache, "hot_threshold", config.hot_threshold);
    config.warm_threshold = get_or_default(cache, "warm_threshold", config.warm_threshold);
    config.stats_retention_s = get_or_default(cache, "stats_retention_s", config.stats_retention_s);
    config.stripes = get_or_default(cache, "stripes", config.stripes);
    config.maintenance_batch = get_or_default(cache, "maintenance_batch", config.maintenance_batch);
    config.maintenance_interval_s = get_or_default(cache, "maintenance_interval_s", config.maintenance_interval_s);
    if (cache.contains("backend")) {
        const auto& backend = cache["backend"];
        config.backend.enabled = get_or_default(backend, "enabled", config.backend.enabled);
        config.backend.url = get_or_default(backend, "url", config.backend.url);
        config.backend.timeout_ms = get_or_default(backend, "timeout_ms", config.backend.timeout_ms);
        config.backend.retry_after_ms = get_or_default(backend, "retry_after_ms", config.backend.retry_after_ms);
    }
    if (cache.contains("preheat")) {
        const auto& preheat = cache["preheat"];
        config.preheat_policy = get_array_or_default<std::string>(preheat, "policy", config.preheat_policy);
        config.preheat_product = get_array_or_default<std::string>(preheat, "product", config.preheat_product);
    }
    return config;
}

SessionConfig parse_session_config(const json& j) {
    SessionConfig config;
    if (!j.contains("session")) return config;

    const auto& session = j["session"];
    config.pending_ttl_s = get_or_default(session, "pending_ttl_s", config.pending_ttl_s);
    config.context_ttl_s = get_or_default(session, "context_ttl_s", config.context_ttl_s);
    config.sweep_interval_s = get_or_default(session, "sweep_interval_s", config.sweep_interval_s);
    config.stripes = get_or_default(session, "stripes", config.stripes);
    return config;
}

LLMConfig parse_llm_config(const json& j) {
    LLMConfig config;
    if (!j.contains("llm")) return config;

    const auto& llm = j["llm"];
    config.endpoint = get_or_default(llm, "endpoint", config.endpoint);
    config.model_name = get_or_default(llm, "model_name", config.model_name);
    config.timeout_ms = get_or_default(llm, "timeout_ms", config.timeout_ms);
    config.max_tokens = get_or_default(llm, "max_tokens", config.max_tokens);
    config.temperature = get_or_default(llm, "temperature", config.temperature);
    config.system_prompt = get_or_default(llm, "system_prompt", config.system_prompt);
    return config;
}

json cache_config_to_json(const CacheConfig& config) {
    return {
        {"ttl", {
            {"hot_s", config.ttl.hot_s},
            {"normal_s", config.ttl.normal_s},
            {"rare_s", config.ttl.rare_s},
            {"policy_s", config.ttl.policy_s},
            {"product_s", config.ttl.product_s},
            {"chat_s", config.ttl.chat_s}
        }},
        {"hot_threshold", config.hot_threshold},
        {"warm_threshold", config.warm_threshold},
        {"stats_retention_s", config.stats_retention_s},
        {"stripes", config.stripes},
        {"maintenance_batch", config.maintenance_batch},
        {"maintenance_interval_s", config.maintenance_interval_s},
        {"backend", {
            {"enabled", config.backend.enabled},
            {"url", config.backend.url},
            {"timeout_ms", config.backend.timeout_ms},
            {"retry_after_ms", config.backend.retry_after_ms}
        }},
        {"preheat", {
            {"policy", config.preheat_policy},
            {"product", config.preheat_product}
        }}
    };
}

json llm_config_to_json(const LLMConfig& config) {
    return {
        {"endpoint", config.endpoint},
        {"model_name", config.model_name},
        {"timeout_ms", config.timeout_ms},
        {"max_tokens", config.max_tokens},
        {"temperature", config.temperature},
        {"system_prompt", config.system_prompt}
    };
}

} // anonymous namespace

// =============================================================================
// EngineConfig Implementation
// =============================================================================

Result<EngineConfig> EngineConfig::load(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return make_io_error("Failed to open config file: " + path);
        }

        json j = json::parse(file);
        EngineConfig config;

        config.logging = parse_logging_config(j);
        config.data = parse_data_config(j);
        config.intent = parse_intent_config(j);
        config.resolver = parse_resolver_config(j);
        config.policy = parse_policy_config(j);
        config.cache = parse_cache_config(j);
        config.session = parse_session_config(j);
        config.llm = parse_llm_config(j);

        // Data tables live next to the config unless given absolutely
        const std::string base_dir = parent_directory(path);
        config.data.rules_path = resolve_path(base_dir, config.data.rules_path);
        config.data.model_path = resolve_path(base_dir, config.data.model_path);
        config.data.catalog_path = resolve_path(base_dir, config.data.catalog_path);
        config.data.policy_path = resolve_path(base_dir, config.data.policy_path);
        config.logging.file = resolve_path(base_dir, config.logging.file);

        std::string validation_error = config.validate();
        if (!validation_error.empty()) {
            return make_invalid_data_error("Config validation failed: " + validation_error);
        }

        return config;

    } catch (const json::exception& e) {
        return make_parse_error(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return make_error(ErrorType::Unknown, std::string("Error loading config: ") + e.what());
    }
}

VoidResult EngineConfig::save(const std::string& path) const {
    try {
        json j;

        j["logging"] = {{"level", logging.level}, {"file", logging.file}};
        j["data"] = {
            {"rules_path", data.rules_path},
            {"model_path", data.model_path},
            {"catalog_path", data.catalog_path},
            {"policy_path", data.policy_path}
        };
        j["intent"] = {
            {"statistical_threshold", intent.statistical_threshold},
            {"min_feature_coverage", intent.min_feature_coverage}
        };
        j["resolver"] = {{"threshold", resolver.threshold}, {"max_options", resolver.max_options}};
        j["policy"] = {
            {"top_k", policy.top_k},
            {"tfidf_threshold", policy.tfidf_threshold},
            {"fallback_context_max_bytes", policy.fallback_context_max_bytes},
            {"generic_category", policy.generic_category},
            {"refund_category", policy.refund_category}
        };
        j["cache"] = cache_config_to_json(cache);
        j["session"] = {
            {"pending_ttl_s", session.pending_ttl_s},
            {"context_ttl_s", session.context_ttl_s},
            {"sweep_interval_s", session.sweep_interval_s},
            {"stripes", session.stripes}
        };
        j["llm"] = llm_config_to_json(llm);

        std::ofstream file(path);
        if (!file.is_open()) {
            return make_io_error("Failed to open file for writing: " + path);
        }

        file << j.dump(2);
        Logger::info("Configuration saved to: " + path);
        return VoidResult();

    } catch (const std::exception& e) {
        return make_error(ErrorType::Unknown, std::string("Error saving config: ") + e.what());
    }
}

EngineConfig EngineConfig::defaults() {
    return EngineConfig{};  // All defaults are set in struct definitions
}

std::string EngineConfig::validate() const {
    std::ostringstream errors;

    if (data.rules_path.empty()) {
        errors << "data.rules_path is required; ";
    }
    if (data.catalog_path.empty()) {
        errors << "data.catalog_path is required; ";
    }
    if (data.policy_path.empty()) {
        errors << "data.policy_path is required; ";
    }

    if (intent.statistical_threshold < 0.0 || intent.statistical_threshold > 1.0) {
        errors << "intent.statistical_threshold must be between 0 and 1; ";
    }
    if (resolver.threshold <= 0.0 || resolver.threshold > 1.0) {
        errors << "resolver.threshold must be in (0, 1]; ";
    }
    if (resolver.max_options < 2) {
        errors << "resolver.max_options must be at least 2; ";
    }
    if (policy.top_k == 0) {
        errors << "policy.top_k must be positive; ";
    }

    if (cache.stripes == 0 || session.stripes == 0) {
        errors << "lock stripe counts must be positive; ";
    }
    if (cache.maintenance_batch == 0) {
        errors << "cache.maintenance_batch must be positive; ";
    }
    if (cache.warm_threshold >= cache.hot_threshold) {
        errors << "cache.warm_threshold must be below cache.hot_threshold; ";
    }
    if (cache.ttl.rare_s <= 0 || cache.ttl.hot_s <= 0 || cache.ttl.policy_s <= 0 ||
        cache.ttl.product_s <= 0 || cache.ttl.chat_s <= 0 || cache.ttl.normal_s <= 0) {
        errors << "cache.ttl values must be positive; ";
    }
    if (cache.backend.enabled && cache.backend.url.empty()) {
        errors << "cache.backend.url is required when the backend is enabled; ";
    }

    if (session.pending_ttl_s <= 0 || session.context_ttl_s <= 0) {
        errors << "session TTLs must be positive; ";
    }
    if (session.sweep_interval_s <= 0) {
        errors << "session.sweep_interval_s must be positive; ";
    }

    if (llm.endpoint.empty()) {
        errors << "llm.endpoint is required; ";
    }
    if (llm.timeout_ms <= 0) {
        errors << "llm.timeout_ms must be positive; ";
    }

    return errors.str();
}

} // namespace config
} // namespace coop_assist
