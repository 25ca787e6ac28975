#include "policy/policy_engine.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

namespace coop_assist {
namespace policy {

const char* retrieval_tier_to_string(RetrievalTier tier) {
    switch (tier) {
        case RetrievalTier::Substring:       return "substring";
        case RetrievalTier::CategoryKeyword: return "category_keyword";
        case RetrievalTier::TfIdf:           return "tfidf";
    }
    return "unknown";
}

bool PolicySearchResult::consulted(RetrievalTier tier) const {
    return std::find(tiers_consulted.begin(), tiers_consulted.end(), tier) != tiers_consulted.end();
}

namespace {

std::vector<std::string> corpus_documents(const PolicyCorpus& corpus) {
    std::vector<std::string> docs;
    docs.reserve(corpus.size());
    for (const auto& s : corpus.sentences()) {
        docs.push_back(s.normalized);
    }
    return docs;
}

PolicyHit make_hit(const PolicySentence& s, double score, RetrievalTier tier) {
    PolicyHit hit;
    hit.sentence_id = s.id;
    hit.content = s.content;
    hit.category = s.category;
    hit.score = score;
    hit.tier = tier;
    return hit;
}

} // namespace

PolicyEngine::PolicyEngine(const PolicyCorpus& corpus, const config::PolicyConfig& config)
    : corpus_(corpus), config_(config), index_(corpus_documents(corpus)) {
    LOG_POLICY("TF-IDF index: " + std::to_string(index_.size()) + " sentences, " +
               std::to_string(index_.vocabulary_size()) + " terms");
}

bool PolicyEngine::already_hit(const PolicySearchResult& result, size_t sentence_id) const {
    for (const auto& h : result.hits) {
        if (h.sentence_id == sentence_id) {
            return true;
        }
    }
    return false;
}

PolicySearchResult PolicyEngine::search(const std::string& query, size_t top_k) const {
    if (top_k == 0) {
        top_k = config_.top_k;
    }
    PolicySearchResult result;
    const std::string normalized = utils::normalize_utterance(query);
    const std::string compact = utils::strip_punctuation(normalized);
    result.query_category = corpus_.categorize(normalized);
    if (compact.empty()) {
        return result;
    }

    substring_tier(compact, result);
    const bool substring_matched = !result.hits.empty();

    if (result.hits.size() < top_k) {
        category_tier(normalized, result);
    }
    if (result.hits.size() < top_k && !substring_matched) {
        tfidf_tier(normalized, result);
    }

    if (result.hits.size() > top_k) {
        result.hits.resize(top_k);
    }

    std::ostringstream oss;
    oss << "'" << query << "' category=" << result.query_category.category
        << "(" << result.query_category.score << ") hits=" << result.hits.size() << " tiers=";
    for (size_t i = 0; i < result.tiers_consulted.size(); ++i) {
        oss << (i ? "," : "") << retrieval_tier_to_string(result.tiers_consulted[i]);
    }
    LOG_POLICY(oss.str());
    return result;
}

void PolicyEngine::substring_tier(const std::string& compact_query, PolicySearchResult& result) const {
    result.tiers_consulted.push_back(RetrievalTier::Substring);
    if (utils::utf8_length(compact_query) < constants::policy::MIN_SUBSTRING_QUERY_CHARS) {
        return;
    }

    // Exact sentence matches first, then containment, each in corpus order
    for (const auto& s : corpus_.sentences()) {
        if (s.compact == compact_query) {
            result.hits.push_back(make_hit(s, 1.0, RetrievalTier::Substring));
        }
    }
    for (const auto& s : corpus_.sentences()) {
        if (s.compact != compact_query && utils::contains(s.compact, compact_query) &&
            !already_hit(result, s.id)) {
            double coverage = static_cast<double>(compact_query.size()) / static_cast<double>(s.compact.size());
            result.hits.push_back(make_hit(s, 0.5 + 0.5 * coverage, RetrievalTier::Substring));
        }
    }
}

void PolicyEngine::category_tier(const std::string& normalized_query, PolicySearchResult& result) const {
    const CategoryGuess& guess = result.query_category;
    if (guess.score == 0) {
        return;  // No category guess to restrict to
    }
    const PolicyCategory* category = corpus_.category(guess.category);
    if (!category) {
        return;
    }
    result.tiers_consulted.push_back(RetrievalTier::CategoryKeyword);

    struct Ranked {
        const PolicySentence* sentence;
        int overlap;
        bool promoted;
    };
    std::vector<Ranked> ranked;
    for (const PolicySentence* s : corpus_.sentences_in(category->id)) {
        if (already_hit(result, s->id)) {
            continue;
        }
        int overlap = 0;
        for (const auto& kw : category->priority_keywords) {
            if (utils::contains(normalized_query, kw) && utils::contains(s->normalized, kw)) {
                overlap += constants::policy::PRIORITY_KEYWORD_POINTS;
            }
        }
        for (const auto& kw : category->keywords) {
            bool is_priority = std::find(category->priority_keywords.begin(),
                                         category->priority_keywords.end(), kw) !=
                               category->priority_keywords.end();
            if (!is_priority && utils::contains(normalized_query, kw) && utils::contains(s->normalized, kw)) {
                overlap += constants::policy::KEYWORD_POINTS;
            }
        }
        bool promoted = category->promotes(utils::to_wide(s->normalized));
        ranked.push_back(Ranked{s, overlap, promoted});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.promoted != b.promoted) return a.promoted;
        if (a.overlap != b.overlap) return a.overlap > b.overlap;
        return a.sentence->priority && !b.sentence->priority;
    });

    for (const auto& r : ranked) {
        PolicyHit hit = make_hit(*r.sentence, static_cast<double>(r.overlap), RetrievalTier::CategoryKeyword);
        hit.promoted = r.promoted;
        result.hits.push_back(std::move(hit));
    }
}

void PolicyEngine::tfidf_tier(const std::string& normalized_query, PolicySearchResult& result) const {
    result.tiers_consulted.push_back(RetrievalTier::TfIdf);
    for (const auto& match : index_.query(normalized_query, config_.tfidf_threshold)) {
        const PolicySentence& s = corpus_.sentences()[match.first];
        if (!already_hit(result, s.id)) {
            result.hits.push_back(make_hit(s, match.second, RetrievalTier::TfIdf));
        }
    }
}

std::string PolicyEngine::fallback_context() const {
    std::string context;
    for (const auto& s : corpus_.sentences()) {
        if (context.size() + s.content.size() + 1 > config_.fallback_context_max_bytes) {
            break;
        }
        context += s.content;
        context += '\n';
    }
    return context;
}

} // namespace policy
} // namespace coop_assist
