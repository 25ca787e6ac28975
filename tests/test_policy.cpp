/**
 * Policy corpus and tiered search tests against the shipped corpus.
 * Asserts:
 * - Every sentence lands in exactly one category (ties to the first declared).
 * - Category-tier answers put the promoted sentence first.
 * - TF-IDF never runs once the substring tier has matched, and needs a
 *   shared bigram to count a sentence.
 * - Hits are unique and cut to top_k; malformed corpora are rejected.
 *
 * Run from build dir: ./test_policy
 */

#include "logger.h"
#include "policy/policy_corpus.h"
#include "policy/policy_engine.h"
#include "policy/tfidf_index.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

using namespace coop_assist;
using namespace coop_assist::policy;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool corpus_rejects(const std::string& text, const std::string& generic = "general") {
    try {
        PolicyCorpus::from_json(json::parse(text), generic);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

static bool unique_hits(const PolicySearchResult& result) {
    std::set<size_t> ids;
    for (const auto& h : result.hits) {
        if (!ids.insert(h.sentence_id).second) return false;
    }
    return true;
}

int main() {
    Logger::initialize(LogLevel::WARN);

    auto loaded = PolicyCorpus::load(std::string(COOP_ASSIST_DATA_DIR) + "/policy.json", "general");
    ASSERT(loaded.is_ok());
    if (!loaded.is_ok()) {
        std::cerr << loaded.error().message << "\n";
        return 1;
    }
    const PolicyCorpus& corpus = loaded.value();

    // --- corpus ---
    ASSERT(corpus.size() == 17);
    ASSERT(corpus.categories().size() == 5);
    ASSERT(corpus.version() == "3.2");
    ASSERT(corpus.category("payment") != nullptr);
    ASSERT(corpus.category("shipping") == nullptr);

    const auto& sentences = corpus.sentences();
    ASSERT(sentences[0].category == "delivery");
    ASSERT(sentences[7].category == "payment");
    ASSERT(sentences[7].priority);
    // Delivery-area sentence mentions the pickup point and belongs to pickup only
    ASSERT(sentences[2].category == "pickup");
    ASSERT(sentences[2].category_scores.count("delivery") == 1);
    // Pickup deadline sentence scores highest for refund
    ASSERT(sentences[12].category == "refund");
    ASSERT(sentences[14].category == "general");

    size_t assigned = 0;
    for (const auto& c : corpus.categories()) {
        assigned += corpus.sentences_in(c.id).size();
    }
    ASSERT(assigned == corpus.size());
    ASSERT(corpus.sentences_in("payment").size() == 3);

    CategoryGuess guess = corpus.categorize("怎么付款");
    ASSERT(guess.category == "payment");
    ASSERT(guess.score == 3);
    guess = corpus.categorize("今天天气");
    ASSERT(guess.category == "general");
    ASSERT(guess.score == 0);

    // --- TF-IDF index ---
    TfidfIndex index({"苹果好吃", "香蕉好吃", "苹果很贵"});
    ASSERT(index.size() == 3);
    ASSERT(index.vocabulary_size() > 0);
    auto matches = index.query("苹果", 0.0);
    ASSERT(matches.size() == 2);
    for (const auto& m : matches) {
        ASSERT(m.first != 1);
        ASSERT(m.second > 0.0 && m.second <= 1.0 + 1e-9);
    }
    // Sharing only the character 好 is not a match
    ASSERT(!index.vectorize("好人").empty());
    ASSERT(index.query("好人", 0.0).empty());
    ASSERT(index.query("好吃", 0.0).size() == 2);
    ASSERT(index.vectorize("榴莲").empty());
    ASSERT(index.query("榴莲", 0.0).empty());

    // --- search ---
    PolicyEngine engine(corpus);

    // Category tier: promoted account sentence first
    PolicySearchResult r = engine.search("怎么付款");
    ASSERT(r.query_category.category == "payment");
    ASSERT(r.hits.size() == 3);
    if (r.hits.size() == 3) {
        ASSERT(r.hits[0].content == sentences[7].content);
        ASSERT(r.hits[0].promoted);
        ASSERT(r.hits[0].tier == RetrievalTier::CategoryKeyword);
        ASSERT(r.hits[1].content == sentences[8].content);
        ASSERT(r.hits[2].content == sentences[9].content);
    }
    ASSERT(r.consulted(RetrievalTier::Substring));
    ASSERT(r.consulted(RetrievalTier::CategoryKeyword));
    ASSERT(!r.consulted(RetrievalTier::TfIdf));

    // No category keyword: only TF-IDF finds it
    r = engine.search("可以发广告吗");
    ASSERT(!r.empty());
    ASSERT(r.hits[0].content == sentences[14].content);
    ASSERT(r.hits[0].tier == RetrievalTier::TfIdf);
    ASSERT(!r.consulted(RetrievalTier::CategoryKeyword));
    ASSERT(r.consulted(RetrievalTier::TfIdf));

    // Substring match: TF-IDF is never consulted
    r = engine.search("周五统一配送");
    ASSERT(!r.empty());
    ASSERT(r.hits[0].content == sentences[0].content);
    ASSERT(r.hits[0].tier == RetrievalTier::Substring);
    ASSERT(!r.consulted(RetrievalTier::TfIdf));
    ASSERT(unique_hits(r));
    ASSERT(r.hits.size() <= 3);

    // Exact sentence text scores as an exact match
    r = engine.search("自取订单请出示订单截图。");
    ASSERT(!r.empty());
    ASSERT(r.hits[0].sentence_id == 13);
    ASSERT(r.hits[0].score == 1.0);

    // Substring hits in corpus order fill top_k before the category tier
    r = engine.search("退款");
    ASSERT(r.hits.size() == 3);
    if (r.hits.size() == 3) {
        ASSERT(r.hits[0].sentence_id == 4);
        ASSERT(r.hits[1].sentence_id == 5);
        ASSERT(r.hits[2].sentence_id == 12);
    }
    ASSERT(!r.consulted(RetrievalTier::CategoryKeyword));

    // Larger top_k lets the category tier supplement, still without TF-IDF
    r = engine.search("退款", 5);
    ASSERT(r.hits.size() == 4);
    ASSERT(r.consulted(RetrievalTier::CategoryKeyword));
    ASSERT(!r.consulted(RetrievalTier::TfIdf));
    ASSERT(unique_hits(r));

    r = engine.search("怎么付款", 1);
    ASSERT(r.hits.size() == 1);

    // Nothing anywhere: empty result, caller falls back
    r = engine.search("股票行情");
    ASSERT(r.empty());
    ASSERT(r.consulted(RetrievalTier::TfIdf));

    // Off-topic questions sharing only common characters find nothing
    r = engine.search("你们几点关门");
    ASSERT(r.empty());
    ASSERT(r.consulted(RetrievalTier::TfIdf));
    r = engine.search("西瓜甜不甜");
    ASSERT(r.empty());

    r = engine.search("");
    ASSERT(r.empty());
    ASSERT(r.tiers_consulted.empty());

    // Fallback context is cut at whole sentences
    std::string context = engine.fallback_context();
    ASSERT(!context.empty());
    ASSERT(context.find(sentences[0].content) == 0);
    config::PolicyConfig small;
    small.fallback_context_max_bytes = 100;
    PolicyEngine small_engine(corpus, small);
    ASSERT(small_engine.fallback_context().size() <= 100);

    // --- malformed corpora ---
    ASSERT(corpus_rejects(R"({"sections": [{"sentences": ["a"]}]})"));
    ASSERT(corpus_rejects(R"({"categories": [{"id": "general"}]})"));
    ASSERT(corpus_rejects(R"({"categories": [{"id": "general"}], "sections": []})"));
    ASSERT(corpus_rejects(R"({"categories": [{"id": "a"}], "sections": [{"sentences": ["x"]}]})"));
    ASSERT(corpus_rejects(R"({"categories": [{"id": "general"}, {"id": "general"}],
                               "sections": [{"sentences": ["x"]}]})"));
    ASSERT(corpus_rejects(R"({"categories": [{"id": "general", "promote_patterns": ["(bad"]}],
                               "sections": [{"sentences": ["x"]}]})"));
    ASSERT(!corpus_rejects(R"({"categories": [{"id": "general"}], "sections": [{"sentences": ["x"]}]})"));

    auto missing = PolicyCorpus::load(std::string(COOP_ASSIST_DATA_DIR) + "/no_such_policy.json", "general");
    ASSERT(missing.is_error());

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All policy tests passed.\n";
    return 0;
}
