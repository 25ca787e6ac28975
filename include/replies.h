#pragma once

/**
 * @file replies.h
 * @brief User-facing reply text
 *
 * Every path through the Router ends in one of these strings; internal
 * error text is never shown to users.
 */

#include "catalog/product_catalog.h"
#include "policy/policy_corpus.h"
#include "resolver/entity_resolver.h"
#include <string>
#include <vector>

namespace coop_assist {
namespace replies {

std::string empty_message();
std::string greeting();
std::string identity();

/// "$6.99"
std::string format_price(double price);

/// Categories with a few sample products each
std::string catalog_overview(const catalog::ProductCatalog& catalog);

/**
 * @brief Product card
 * @param price_focus Lead with the price (price questions and follow-ups)
 */
std::string product_detail(const catalog::Product& product, bool price_focus);

/// Option label for a product: "土鸡蛋 (30个) $8.99"
std::string product_option_label(const catalog::Product& product);

std::string ambiguous_product(const std::string& cleaned, size_t shown, size_t total);

/**
 * @brief Nothing matched; near misses are offered as options by the caller
 */
std::string product_not_found(const std::string& cleaned, bool has_suggestions,
                              const std::vector<std::string>& categories);

std::string recommendation_intro(const std::string& category);

/// Intro for browsing one category; shown < total when the list was cut
std::string category_products(const std::string& category, size_t shown, size_t total);

std::string policy_answer(const std::vector<std::string>& sentences);

std::string policy_list_intro();

std::string policy_category(const policy::PolicyCategory& category,
                            const std::vector<const policy::PolicySentence*>& sentences);

std::string unknown_policy_category(const std::string& id);

std::string refund_guidance(const std::vector<std::string>& sentences);

std::string selection_expired();

std::string fallback_apology();

} // namespace replies
} // namespace coop_assist
