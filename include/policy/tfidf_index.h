#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace coop_assist {
namespace policy {

/**
 * @brief TF-IDF vectors over character unigrams and bigrams
 *
 * idf = ln((1 + n) / (1 + df)) + 1, vectors L2-normalized, so the dot
 * product of two vectors is their cosine similarity.
 */
class TfidfIndex {
public:
    using SparseVector = std::unordered_map<std::string, double>;

    TfidfIndex() = default;

    /// Build from documents; document i keeps index i
    explicit TfidfIndex(const std::vector<std::string>& documents);

    /// Vectorize with the fitted vocabulary; unknown grams are ignored
    SparseVector vectorize(const std::string& text) const;

    /**
     * @brief Documents whose cosine similarity exceeds min_score
     *
     * A document must share at least one bigram with the query; unigrams
     * only add weight to a match.
     * @return (document index, score), best first, ties by index
     */
    std::vector<std::pair<size_t, double>> query(const std::string& text, double min_score) const;

    size_t size() const { return vectors_.size(); }
    size_t vocabulary_size() const { return idf_.size(); }

private:
    std::unordered_map<std::string, double> idf_;
    std::vector<SparseVector> vectors_;
};

} // namespace policy
} // namespace coop_assist
