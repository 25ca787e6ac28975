#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Compiled-in defaults for every tunable. The configuration file overrides
 * them per deployment.
 */

#include <cstddef>

namespace coop_assist {
namespace constants {

// =============================================================================
// Intent Classification
// =============================================================================

namespace intent {
    /// Minimum statistical probability accepted before falling through to "unknown"
    constexpr double STATISTICAL_THRESHOLD = 0.3;

    /// Fraction of query features the model must know before it may answer
    constexpr double MIN_FEATURE_COVERAGE = 0.5;

    /// Confidence reported for rule matches
    constexpr double RULE_CONFIDENCE = 1.0;
}

// =============================================================================
// Entity Resolution
// =============================================================================

namespace resolver {
    /// Candidates scoring below this are dropped (0-1 scale)
    constexpr double MATCH_THRESHOLD = 0.6;

    /// Maximum options offered in one clarification turn
    constexpr size_t MAX_OPTIONS = 5;

    /// Floor score for a containment match; the coverage ratio fills the rest
    constexpr double CONTAINMENT_BASE = 0.6;

    /// Blend weights for non-containment matches
    constexpr double OVERLAP_WEIGHT = 0.4;
    constexpr double EDIT_WEIGHT = 0.6;

    /// Edit-distance similarity only counts when both strings are this short
    constexpr size_t EDIT_MAX_LENGTH = 6;

    /// Alias matches rank just below equally good name matches
    constexpr double ALIAS_FACTOR = 0.9;
}

// =============================================================================
// Policy Retrieval
// =============================================================================

namespace policy {
    /// Default number of sentences returned
    constexpr size_t DEFAULT_TOP_K = 3;

    /// Points for a category-defining keyword
    constexpr int PRIORITY_KEYWORD_POINTS = 3;

    /// Points for an ordinary category keyword
    constexpr int KEYWORD_POINTS = 1;

    /// Minimum cosine similarity for the TF-IDF tier
    constexpr double TFIDF_THRESHOLD = 0.1;

    /// Minimum query length (code points) for the substring tier
    constexpr size_t MIN_SUBSTRING_QUERY_CHARS = 2;

    /// Corpus context handed to the generative model is cut at this many bytes
    constexpr size_t FALLBACK_CONTEXT_MAX_BYTES = 4000;
}

// =============================================================================
// Adaptive Cache
// =============================================================================

namespace cache {
    constexpr int HOUR_S = 3600;
    constexpr int DAY_S = 24 * HOUR_S;

    /// Frequency-tier TTLs
    constexpr int HOT_TTL_S = 7 * DAY_S;
    constexpr int NORMAL_TTL_S = DAY_S;
    constexpr int RARE_TTL_S = 6 * HOUR_S;

    /// Per-type base TTLs (policy changes least often)
    constexpr int POLICY_TTL_S = 48 * HOUR_S;
    constexpr int PRODUCT_TTL_S = 12 * HOUR_S;
    constexpr int CHAT_TTL_S = 8 * HOUR_S;

    /// Access counts that move a key between frequency tiers (strictly greater)
    constexpr unsigned HOT_THRESHOLD = 100;
    constexpr unsigned WARM_THRESHOLD = 10;

    /// Access statistics idle longer than this are forgotten
    constexpr int STATS_RETENTION_S = 7 * DAY_S;

    /// Lock stripes for entries and statistics
    constexpr size_t STRIPES = 16;

    /// Entries handled per lock acquisition during maintenance
    constexpr size_t MAINTENANCE_BATCH = 64;

    /// Maintenance period
    constexpr int MAINTENANCE_INTERVAL_S = 3600;

    /// Hot keys reported by the statistics endpoint
    constexpr size_t HOT_KEYS_REPORTED = 10;

    /// Secondary backend call timeout and cooldown after a failure
    constexpr int BACKEND_TIMEOUT_MS = 200;
    constexpr int BACKEND_RETRY_AFTER_MS = 30000;
}

// =============================================================================
// Dialogue Sessions
// =============================================================================

namespace session {
    /// Pending clarification lifetime without a reply
    constexpr int PENDING_TTL_S = 300;

    /// Last-resolved entity lifetime
    constexpr int CONTEXT_TTL_S = 1800;

    /// Background purge period for users who never write again
    constexpr int SWEEP_INTERVAL_S = 60;

    /// Lock stripes for the per-user store
    constexpr size_t STRIPES = 16;
}

// =============================================================================
// LLM (generative fallback)
// =============================================================================

namespace llm {
    /// Default timeout for LLM requests (ms)
    constexpr int DEFAULT_TIMEOUT_MS = 8000;

    /// Connection timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 1000;

    /// Default max tokens in response
    constexpr int DEFAULT_MAX_TOKENS = 300;

    /// Default temperature
    constexpr float DEFAULT_TEMPERATURE = 0.3f;
}

} // namespace constants
} // namespace coop_assist
