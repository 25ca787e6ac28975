#pragma once

/**
 * @file policy_engine.h
 * @brief Tiered policy sentence retrieval
 */

#include "core/config.h"
#include "policy/policy_corpus.h"
#include "policy/tfidf_index.h"
#include <string>
#include <vector>

namespace coop_assist {
namespace policy {

enum class RetrievalTier {
    Substring,        ///< Query text found verbatim in a sentence
    CategoryKeyword,  ///< Keyword overlap within the query's category
    TfIdf             ///< Cosine similarity over the whole corpus
};

const char* retrieval_tier_to_string(RetrievalTier tier);

struct PolicyHit {
    size_t sentence_id = 0;
    std::string content;
    std::string category;
    double score = 0.0;
    RetrievalTier tier = RetrievalTier::Substring;
    bool promoted = false;  ///< Moved to the front as the decisive fact
};

struct PolicySearchResult {
    std::vector<PolicyHit> hits;
    std::vector<RetrievalTier> tiers_consulted;
    CategoryGuess query_category;

    bool empty() const { return hits.empty(); }
    bool consulted(RetrievalTier tier) const;
};

/**
 * @brief Policy search engine
 *
 * Tiers run in order while fewer than top_k sentences have been found:
 * 1. substring match of the whole query against each sentence
 * 2. sentences of the query's own category, promoted sentences first,
 *    then by keyword overlap with the query
 * 3. TF-IDF cosine similarity, skipped whenever tier 1 matched anything
 * An empty result tells the caller to fall back to the generative model.
 * Hits are unique by sentence and cut to top_k.
 *
 * Holds a reference to the corpus, which must outlive the engine.
 */
class PolicyEngine {
public:
    explicit PolicyEngine(const PolicyCorpus& corpus, const config::PolicyConfig& config = {});

    /**
     * @param top_k 0 = configured default
     */
    PolicySearchResult search(const std::string& query, size_t top_k = 0) const;

    const PolicyCorpus& corpus() const { return corpus_; }

    /**
     * @brief Whole corpus as plain text for the generative fallback, cut to the configured size
     */
    std::string fallback_context() const;

private:
    void substring_tier(const std::string& compact_query, PolicySearchResult& result) const;
    void category_tier(const std::string& normalized_query, PolicySearchResult& result) const;
    void tfidf_tier(const std::string& normalized_query, PolicySearchResult& result) const;

    bool already_hit(const PolicySearchResult& result, size_t sentence_id) const;

    const PolicyCorpus& corpus_;
    config::PolicyConfig config_;
    TfidfIndex index_;
};

} // namespace policy
} // namespace coop_assist
