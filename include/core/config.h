#pragma once

/**
 * @file config.h
 * @brief Unified configuration system
 *
 * One JSON file describes the whole engine. It supports:
 * - JSON file loading
 * - Default values for every missing key
 * - Data paths relative to the config file
 * - Validation
 */

#include "types.h"
#include "constants.h"
#include "errors.h"
#include <string>
#include <vector>

namespace coop_assist {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;  // Empty = console only
};

/**
 * @brief Startup data tables
 */
struct DataConfig {
    std::string rules_path = "data/intent_rules.json";
    std::string model_path = "data/intent_model.json";  // Empty = rule-only
    std::string catalog_path = "data/catalog.json";
    std::string policy_path = "data/policy.json";
};

/**
 * @brief Intent classifier configuration
 */
struct IntentConfig {
    double statistical_threshold = constants::intent::STATISTICAL_THRESHOLD;
    double min_feature_coverage = constants::intent::MIN_FEATURE_COVERAGE;
};

/**
 * @brief Entity resolver configuration
 */
struct ResolverConfig {
    double threshold = constants::resolver::MATCH_THRESHOLD;
    size_t max_options = constants::resolver::MAX_OPTIONS;
};

/**
 * @brief Policy retrieval configuration
 */
struct PolicyConfig {
    size_t top_k = constants::policy::DEFAULT_TOP_K;
    double tfidf_threshold = constants::policy::TFIDF_THRESHOLD;
    size_t fallback_context_max_bytes = constants::policy::FALLBACK_CONTEXT_MAX_BYTES;
    std::string generic_category = "general";
    std::string refund_category = "refund";  // Answers refund requests directly
};

/**
 * @brief TTL table (seconds)
 */
struct TTLConfig {
    int hot_s = constants::cache::HOT_TTL_S;
    int normal_s = constants::cache::NORMAL_TTL_S;
    int rare_s = constants::cache::RARE_TTL_S;
    int policy_s = constants::cache::POLICY_TTL_S;
    int product_s = constants::cache::PRODUCT_TTL_S;
    int chat_s = constants::cache::CHAT_TTL_S;
};

/**
 * @brief Secondary (shared) cache backend
 */
struct BackendConfig {
    bool enabled = false;
    std::string url = "http://127.0.0.1:7379";
    int timeout_ms = constants::cache::BACKEND_TIMEOUT_MS;
    int retry_after_ms = constants::cache::BACKEND_RETRY_AFTER_MS;
};

/**
 * @brief Adaptive cache configuration
 */
struct CacheConfig {
    TTLConfig ttl;
    unsigned hot_threshold = constants::cache::HOT_THRESHOLD;
    unsigned warm_threshold = constants::cache::WARM_THRESHOLD;
    int stats_retention_s = constants::cache::STATS_RETENTION_S;
    size_t stripes = constants::cache::STRIPES;
    size_t maintenance_batch = constants::cache::MAINTENANCE_BATCH;
    int maintenance_interval_s = constants::cache::MAINTENANCE_INTERVAL_S;
    BackendConfig backend;
    std::vector<std::string> preheat_policy = {
        "配送时间", "付款方式", "取货地点", "质量保证",
        "群规", "退款政策", "运费标准", "起送金额",
        "配送范围", "免费配送", "取货时间", "质量问题"
    };
    std::vector<std::string> preheat_product = {
        "鸡", "蔬菜", "水果", "海鲜", "蛋类",
        "时令水果", "新鲜蔬菜", "禽类", "干货"
    };
};

/**
 * @brief Dialogue session configuration
 */
struct SessionConfig {
    int pending_ttl_s = constants::session::PENDING_TTL_S;
    int context_ttl_s = constants::session::CONTEXT_TTL_S;
    int sweep_interval_s = constants::session::SWEEP_INTERVAL_S;
    size_t stripes = constants::session::STRIPES;
};

/**
 * @brief Generative fallback configuration
 */
struct LLMConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "qwen2.5:7b";
    int timeout_ms = constants::llm::DEFAULT_TIMEOUT_MS;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    float temperature = constants::llm::DEFAULT_TEMPERATURE;
    std::string system_prompt = "你是一家社区生鲜团购的小助手。请用简洁、友好的中文回答，"
                                "只根据提供的资料回答政策和商品问题，不确定时请建议联系客服。";
};

// =============================================================================
// Main Configuration
// =============================================================================

/**
 * @brief Complete engine configuration
 */
struct EngineConfig {
    LoggingConfig logging;
    DataConfig data;
    IntentConfig intent;
    ResolverConfig resolver;
    PolicyConfig policy;
    CacheConfig cache;
    SessionConfig session;
    LLMConfig llm;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded config (data paths resolved against the file's directory) or error
     */
    static Result<EngineConfig> load(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    VoidResult save(const std::string& path) const;

    /**
     * @brief Create with default values
     */
    static EngineConfig defaults();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace config

// Convenience alias
using Config = config::EngineConfig;

} // namespace coop_assist
