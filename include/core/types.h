#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the co-op assistant engine
 *
 * Types shared by the classifier, resolver, policy engine, cache, session
 * manager and router live here so every component speaks the same vocabulary.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>
#include <optional>

namespace coop_assist {

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

/// Time source; components take one so tests can drive expiry without sleeping
using ClockFn = std::function<TimePoint()>;

/// Default time source (steady clock)
inline TimePoint steady_now() {
    return Clock::now();
}

/// Milliseconds elapsed since a time point
inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Current timestamp in milliseconds (for logging)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        Clock::now().time_since_epoch()).count();
}

// =============================================================================
// Intent Types
// =============================================================================

/// Closed intent taxonomy. Unknown is the explicit "no confident answer" arm.
enum class Intent {
    Greeting,
    IdentityQuery,
    WhatDoYouSell,
    PriceOrBuy,
    Availability,
    Recommendation,
    PolicyInquiry,
    PolicyList,
    RefundRequest,
    Unknown
};

/// Wire label, e.g. Intent::Availability -> "inquiry_availability"
const char* intent_to_string(Intent intent);

/// Parse a wire label; nullopt for labels outside the taxonomy
std::optional<Intent> intent_from_string(const std::string& label);

/// Which classifier tier produced a result
enum class ClassifierTier {
    HighPriorityRule,
    Rule,
    Statistical,
    None
};

const char* tier_to_string(ClassifierTier tier);

/// Output of IntentClassifier::classify
struct IntentResult {
    Intent intent = Intent::Unknown;
    double confidence = 0.0;
    ClassifierTier tier = ClassifierTier::None;
    std::string matched_pattern;  ///< Rule that fired (empty for statistical/none)
};

// =============================================================================
// Response Types
// =============================================================================

/// Payload prefix of a policy-category option
constexpr const char* POLICY_CATEGORY_PREFIX = "policy_category:";

/// Payload prefix of a product option
constexpr const char* PRODUCT_SELECTION_PREFIX = "product_selection:";

/// Selectable option presented to the user
struct ResponseOption {
    std::string display_text;
    std::string payload;
};

/// What the transport layer receives for one message
struct Response {
    std::string text;
    std::vector<ResponseOption> options;

    bool has_options() const { return !options.empty(); }
};

// =============================================================================
// Cache Types
// =============================================================================

/// Declared query type; selects the base TTL
enum class QueryType {
    Policy,
    Product,
    Chat
};

const char* query_type_to_string(QueryType type);
std::optional<QueryType> query_type_from_string(const std::string& name);

} // namespace coop_assist
