#pragma once

/**
 * @file policy_corpus.h
 * @brief Policy sentences with load-time category assignment
 */

#include "errors.h"
#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace coop_assist {
namespace policy {

/**
 * @brief Topic with its scoring keywords
 *
 * Priority keywords are category-defining and weigh 3 points, ordinary
 * keywords 1. Promote patterns mark the one sentence that answers the
 * category's typical question outright (payment account, pickup address).
 */
struct PolicyCategory {
    std::string id;
    std::string title;
    std::vector<std::string> keywords;
    std::vector<std::string> priority_keywords;
    std::vector<std::string> promote_patterns;
    std::vector<std::wregex> promote_regexes;

    /// Weighted keyword score of normalized text
    int score(const std::string& normalized) const;

    /// True when any promote pattern matches the sentence
    bool promotes(const std::wstring& wide_normalized) const;
};

struct PolicySentence {
    size_t id = 0;            ///< Corpus position; also the tie-break order
    std::string content;      ///< As written
    std::string normalized;   ///< normalize_utterance(content)
    std::string compact;      ///< Normalized, punctuation removed
    std::string section;
    std::string category;     ///< Single best category
    std::unordered_map<std::string, int> category_scores;  ///< Non-zero scores only
    bool priority = false;    ///< Contains a priority keyword of its category
};

/// Best category for a text; generic when nothing scores
struct CategoryGuess {
    std::string category;
    int score = 0;
};

/**
 * @brief Immutable policy corpus
 *
 * Every sentence is assigned to exactly one category: the highest weighted
 * keyword score, ties going to the category declared first, zero falling
 * into the generic category. A sentence that also scores for a second topic
 * is never returned for it by the category tier.
 */
class PolicyCorpus {
public:
    PolicyCorpus() = default;

    /**
     * @throws std::runtime_error on malformed categories or sentences, or
     *         when generic_category is not declared
     */
    static PolicyCorpus from_json(const nlohmann::json& j, const std::string& generic_category);

    static Result<PolicyCorpus> load(const std::string& path, const std::string& generic_category);

    /// Categorize arbitrary text with the same scoring as the corpus
    CategoryGuess categorize(const std::string& text) const;

    const std::vector<PolicyCategory>& categories() const { return categories_; }
    const std::vector<PolicySentence>& sentences() const { return sentences_; }
    const PolicyCategory* category(const std::string& id) const;
    std::vector<const PolicySentence*> sentences_in(const std::string& category_id) const;

    const std::string& generic_category() const { return generic_category_; }
    const std::string& version() const { return version_; }
    const std::string& last_updated() const { return last_updated_; }

    size_t size() const { return sentences_.size(); }

private:
    std::vector<PolicyCategory> categories_;
    std::vector<PolicySentence> sentences_;
    std::string generic_category_;
    std::string version_;
    std::string last_updated_;
};

} // namespace policy
} // namespace coop_assist
