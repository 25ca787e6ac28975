#pragma once

/**
 * @file entity_resolver.h
 * @brief Fuzzy product matching against the catalog
 */

#include "catalog/product_catalog.h"
#include "core/config.h"
#include "resolver/affix_stripper.h"
#include <string>
#include <vector>

namespace coop_assist {
namespace resolver {

/**
 * @brief One scored catalog match
 */
struct ProductCandidate {
    std::string key;
    std::string name;
    std::string specification;
    std::string category;
    double score = 0.0;  ///< 0-1
};

enum class ResolutionStatus {
    NotFound,   ///< No candidate reached the threshold
    Resolved,   ///< Exactly one candidate
    Ambiguous   ///< Two or more; the caller must ask the user to pick
};

const char* resolution_status_to_string(ResolutionStatus status);

struct ResolveResult {
    ResolutionStatus status = ResolutionStatus::NotFound;
    std::string cleaned;                       ///< Fragment after affix stripping
    std::vector<ProductCandidate> candidates;  ///< Score >= threshold, best first
    std::vector<ProductCandidate> near_misses; ///< Best sub-threshold matches for "did you mean"
};

/**
 * @brief Maps an utterance fragment to ranked catalog candidates
 *
 * Scoring against each product name and alias:
 * - containment either way: 0.6 + 0.4 * (shorter / longer), exact = 1.0
 * - otherwise 0.4 * character overlap (Jaccard) + 0.6 * edit similarity,
 *   the latter only when both strings are at most 6 characters
 * Alias scores are scaled by 0.9; a product keeps its best score.
 *
 * Ordering is deterministic: descending score, then catalog order.
 * Holds a reference to the catalog, which must outlive the resolver.
 */
class EntityResolver {
public:
    EntityResolver(const catalog::ProductCatalog& catalog,
                   const config::ResolverConfig& config = {},
                   AffixStripper stripper = AffixStripper::default_fillers());

    /**
     * @brief Resolve a raw fragment (affixes and punctuation are removed first)
     */
    ResolveResult resolve(const std::string& fragment) const;

    const AffixStripper& stripper() const { return stripper_; }

private:
    struct IndexedProduct {
        const catalog::Product* product;
        std::u32string name;
        std::vector<std::u32string> aliases;
    };

    static double score_text(const std::u32string& query, const std::u32string& target);

    /// Best of the name score and the discounted alias scores
    static double score_entry(const std::u32string& query, const IndexedProduct& entry);

    const catalog::ProductCatalog& catalog_;
    config::ResolverConfig config_;
    AffixStripper stripper_;
    std::vector<IndexedProduct> index_;
};

} // namespace resolver
} // namespace coop_assist
