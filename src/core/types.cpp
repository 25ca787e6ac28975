/**
 * @file types.cpp
 * @brief Label conversions for the core enums
 */

#include "core/types.h"

#include <utility>

namespace coop_assist {

namespace {

const std::pair<Intent, const char*> INTENT_LABELS[] = {
    {Intent::Greeting, "greeting"},
    {Intent::IdentityQuery, "identity_query"},
    {Intent::WhatDoYouSell, "what_do_you_sell"},
    {Intent::PriceOrBuy, "inquiry_price_or_buy"},
    {Intent::Availability, "inquiry_availability"},
    {Intent::Recommendation, "request_recommendation"},
    {Intent::PolicyInquiry, "inquiry_policy"},
    {Intent::PolicyList, "inquiry_policy_list"},
    {Intent::RefundRequest, "refund_request"},
    {Intent::Unknown, "unknown"},
};

} // namespace

const char* intent_to_string(Intent intent) {
    for (const auto& [value, label] : INTENT_LABELS) {
        if (value == intent) return label;
    }
    return "unknown";
}

std::optional<Intent> intent_from_string(const std::string& label) {
    for (const auto& [value, name] : INTENT_LABELS) {
        if (label == name) return value;
    }
    return std::nullopt;
}

const char* tier_to_string(ClassifierTier tier) {
    switch (tier) {
        case ClassifierTier::HighPriorityRule: return "high_priority_rule";
        case ClassifierTier::Rule:             return "rule";
        case ClassifierTier::Statistical:      return "statistical";
        case ClassifierTier::None:             return "none";
    }
    return "none";
}

const char* query_type_to_string(QueryType type) {
    switch (type) {
        case QueryType::Policy:  return "policy";
        case QueryType::Product: return "product";
        case QueryType::Chat:    return "chat";
    }
    return "chat";
}

std::optional<QueryType> query_type_from_string(const std::string& name) {
    if (name == "policy") return QueryType::Policy;
    if (name == "product") return QueryType::Product;
    if (name == "chat") return QueryType::Chat;
    return std::nullopt;
}

} // namespace coop_assist
