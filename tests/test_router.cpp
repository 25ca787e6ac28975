/**
 * Router tests over the shipped tables, with a scripted generative model.
 * Asserts:
 * - Clear product questions answer directly; ambiguous ones offer options
 *   and a numbered reply picks one.
 * - Any non-selection message drops a pending clarification.
 * - A named category lists its products; recommendations and category
 *   lists put the most requested products first.
 * - Refund requests get refund guidance, not a plain policy answer.
 * - Policy answers lead with the promoted sentence.
 * - The generative fallback is called only when no tier answered, and its
 *   failure never reaches the user as an error.
 *
 * Run from build dir: ./test_router
 */

#include "cache/adaptive_cache.h"
#include "catalog/popularity.h"
#include "catalog/product_catalog.h"
#include "intent/intent_classifier.h"
#include "intent/intent_model.h"
#include "intent/rule_table.h"
#include "llm_client.h"
#include "logger.h"
#include "policy/policy_corpus.h"
#include "policy/policy_engine.h"
#include "replies.h"
#include "resolver/entity_resolver.h"
#include "router.h"
#include "session/session_manager.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace coop_assist;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool has(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

static bool starts(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

/// Generative model that replays a fixed answer or error
class ScriptedModel : public GenerativeModel {
public:
    explicit ScriptedModel(Result<std::string> reply) : reply_(std::move(reply)) {}

    Result<std::string> generate(const std::string& prompt, const std::string& context,
                                 int timeout_ms) override {
        calls++;
        last_prompt = prompt;
        last_context = context;
        last_timeout_ms = timeout_ms;
        return reply_;
    }

    int calls = 0;
    std::string last_prompt;
    std::string last_context;
    int last_timeout_ms = -1;

private:
    Result<std::string> reply_;
};

/// One router with its own cache and sessions over shared tables
struct Harness {
    Harness(const RouterComponents& tables, const Config& config, std::shared_ptr<GenerativeModel> llm)
        : cache(config.cache), sessions(config.session) {
        RouterComponents c = tables;
        c.cache = &cache;
        c.sessions = &sessions;
        c.popularity = &popularity;
        c.llm = std::move(llm);
        router = std::make_unique<Router>(c, config);
    }

    cache::AdaptiveCache cache;
    session::SessionManager sessions;
    catalog::PopularityTracker popularity;
    std::unique_ptr<Router> router;
};

int main() {
    Logger::initialize(LogLevel::WARN);

    const std::string dir = COOP_ASSIST_DATA_DIR;
    auto rules = intent::IntentRuleTable::load(dir + "/intent_rules.json");
    auto model = intent::NaiveBayesIntentModel::load(dir + "/intent_model.json", 0.5);
    auto products = catalog::ProductCatalog::load(dir + "/catalog.json");
    auto corpus = policy::PolicyCorpus::load(dir + "/policy.json", "general");
    ASSERT(rules.is_ok() && model.is_ok() && products.is_ok() && corpus.is_ok());
    if (!rules.is_ok() || !model.is_ok() || !products.is_ok() || !corpus.is_ok()) {
        return 1;
    }

    Config config = Config::defaults();
    intent::IntentClassifier classifier(rules.value(), model.value(), config.intent);
    resolver::EntityResolver resolver(products.value(), config.resolver);
    policy::PolicyEngine engine(corpus.value(), config.policy);
    const auto& sentences = corpus.value().sentences();
    const catalog::ProductCatalog& table = products.value();

    RouterComponents tables;
    tables.classifier = &classifier;
    tables.catalog = &table;
    tables.resolver = &resolver;
    tables.policy = &engine;

    // --- products ---
    {
        Harness h(tables, config, nullptr);
        Router& router = *h.router;

        // Clear single product
        Response r = router.handle("草莓卖不?", "alice");
        ASSERT(!r.has_options());
        ASSERT(starts(r.text, "有的！" + table.find("strawberry")->display_name()));
        ASSERT(has(r.text, "$6.99"));
        ASSERT(h.cache.entry_ttl(cache::AdaptiveCache::make_key("草莓卖不?", QueryType::Product)).has_value());

        // Elliptical price follow-up uses the last product
        r = router.handle("它多少钱", "alice");
        ASSERT(has(r.text, "售价 $6.99"));
        ASSERT(!r.has_options());
        r = router.handle("多少钱?", "alice");
        ASSERT(has(r.text, "售价 $6.99"));

        // Without context the bare price question goes through the product flow
        r = router.handle("多少钱", "bob");
        ASSERT(starts(r.text, "抱歉，暂时没有找到"));
        ASSERT(!r.has_options());

        // Ambiguous: two egg options, picked by number
        r = router.handle("鸡蛋有吗", "alice");
        ASSERT(r.options.size() == 2);
        if (r.options.size() == 2) {
            ASSERT(r.options[0].payload == "product_selection:free_range_egg");
            ASSERT(r.options[1].payload == "product_selection:organic_egg");
        }
        ASSERT(h.sessions.state("alice") == session::SessionState::AwaitingSelection);
        ASSERT(h.sessions.state("bob") == session::SessionState::Idle);

        r = router.handle("2", "alice");
        ASSERT(has(r.text, table.find("organic_egg")->name));
        ASSERT(has(r.text, "$6.49"));
        ASSERT(h.sessions.state("alice") == session::SessionState::Idle);

        // Same question again is answered from the cache with the same options
        r = router.handle("鸡蛋有吗？", "alice");
        ASSERT(r.options.size() == 2);
        r = router.handle("第一个", "alice");
        ASSERT(has(r.text, "$9.99"));

        // A raw key also selects
        router.handle("鸡蛋有吗", "alice");
        r = router.handle("ORGANIC_EGG", "alice");
        ASSERT(has(r.text, "$6.49"));

        // Moving on drops the pending options
        router.handle("鸡蛋有吗", "alice");
        r = router.handle("怎么付款", "alice");
        ASSERT(starts(r.text, sentences[7].content));
        ASSERT(h.sessions.state("alice") == session::SessionState::Idle);
        r = router.handle("2", "alice");
        ASSERT(!has(r.text, "$6.49"));

        // An ordinal beyond the offered options is not a selection
        router.handle("鸡蛋有吗", "carol");
        r = router.handle("9", "carol");
        ASSERT(h.sessions.state("carol") == session::SessionState::Idle);
        ASSERT(!has(r.text, "$"));

        // Typo: near misses offered as options
        r = router.handle("草梅有吗", "alice");
        ASSERT(starts(r.text, "抱歉，暂时没有找到「草梅」"));
        ASSERT(!r.options.empty());
        ASSERT(!r.options.empty() && r.options[0].payload == "product_selection:strawberry");
        r = router.handle("1", "alice");
        ASSERT(has(r.text, "$6.99"));

        // Unknown product, no suggestions
        r = router.handle("榴莲有吗", "alice");
        ASSERT(!r.has_options());
        ASSERT(has(r.text, "水果"));

        // Explicit payloads work without a pending entry
        r = router.handle("product_selection:mango", "dave");
        ASSERT(has(r.text, "$15.99"));
        r = router.handle("product_selection:durian", "dave");
        ASSERT(r.text == replies::selection_expired());

        r = router.handle("你们卖什么", "dave");
        ASSERT(has(r.text, "水果"));
        ASSERT(has(r.text, "蛋类"));

        r = router.handle("推荐点什么", "dave");
        ASSERT(r.options.size() == 4);
        ASSERT(!r.options.empty() && r.options[0].payload == "product_selection:strawberry");
        r = router.handle("第二个", "dave");
        ASSERT(has(r.text, "$15.99"));

        r = router.handle("你好", "dave");
        ASSERT(r.text == replies::greeting());
        r = router.handle("   ", "dave");
        ASSERT(r.text == replies::empty_message());
    }

    // --- categories and popularity ---
    {
        Harness h(tables, config, nullptr);
        Router& router = *h.router;

        // A category question lists that category's products
        Response r = router.handle("有什么蔬菜", "erin");
        ASSERT(starts(r.text, "蔬菜类共有3样商品"));
        ASSERT(!has(r.text, "先列出"));
        ASSERT(r.options.size() == 3);
        ASSERT(!r.options.empty() && r.options[0].payload == "product_selection:bok_choy");
        ASSERT(h.sessions.state("erin") == session::SessionState::AwaitingSelection);
        r = router.handle("2", "erin");
        ASSERT(has(r.text, table.find("napa_cabbage")->name));
        ASSERT(h.popularity.count("napa_cabbage") == 1);

        // Availability of a category browses instead of offering near misses
        r = router.handle("蔬菜有吗", "erin");
        ASSERT(r.options.size() == 3);
        ASSERT(!r.options.empty() && r.options[0].payload == "product_selection:napa_cabbage");
        ASSERT(!has(r.text, "抱歉"));

        // A bare category name is not sent to the fallback
        r = router.handle("海鲜", "erin");
        ASSERT(starts(r.text, "海鲜类共有2样商品"));
        ASSERT(r.options.size() == 2);
        ASSERT(r.text != replies::fallback_apology());

        router.handle("芒果多少钱", "erin");
        router.handle("芒果多少钱", "frank");
        router.handle("香梨有吗", "erin");
        ASSERT(h.popularity.count("mango") == 2);
        ASSERT(h.popularity.count("pear") == 1);

        // Long categories are cut to the most requested
        r = router.handle("水果有吗", "erin");
        ASSERT(starts(r.text, "水果类共有6样商品"));
        ASSERT(has(r.text, "先列出最受欢迎的5样"));
        ASSERT(r.options.size() == 5);
        if (r.options.size() == 5) {
            ASSERT(r.options[0].payload == "product_selection:mango");
            ASSERT(r.options[1].payload == "product_selection:pear");
            ASSERT(r.options[2].payload == "product_selection:strawberry");
            ASSERT(r.options[4].payload == "product_selection:fuji_apple");
        }

        r = router.handle("推荐点水果", "erin");
        ASSERT(r.text == replies::recommendation_intro("水果"));
        ASSERT(!r.options.empty() && r.options[0].payload == "product_selection:mango");

        // Featured recommendations follow popularity, ties in catalog order
        r = router.handle("推荐点什么", "erin");
        ASSERT(r.options.size() == 4);
        if (r.options.size() == 4) {
            ASSERT(r.options[0].payload == "product_selection:mango");
            ASSERT(r.options[1].payload == "product_selection:strawberry");
            ASSERT(r.options[2].payload == "product_selection:free_range_egg");
        }
        // Offering options is not a request
        ASSERT(h.popularity.count("old_hen") == 0);
    }

    // --- policy ---
    {
        Harness h(tables, config, nullptr);
        Router& router = *h.router;

        Response r = router.handle("怎么付款", "alice");
        ASSERT(starts(r.text, sentences[7].content));
        ASSERT(has(r.text, sentences[8].content));
        ASSERT(h.cache.entry_ttl(cache::AdaptiveCache::make_key("怎么付款", QueryType::Policy)).has_value());
        ASSERT(router.handle("怎么付款？", "bob").text == r.text);

        // Refund requests get guidance from the refund category
        r = router.handle("我要退货", "alice");
        ASSERT(starts(r.text, "很抱歉给您带来不便！"));
        ASSERT(has(r.text, sentences[4].content));
        ASSERT(has(r.text, sentences[6].content));
        ASSERT(!has(r.text, sentences[7].content));

        // Category list and selection
        r = router.handle("有什么政策", "alice");
        ASSERT(r.options.size() == 5);
        ASSERT(!r.options.empty() && r.options[0].payload == "policy_category:delivery");
        ASSERT(h.sessions.state("alice") == session::SessionState::AwaitingSelection);
        r = router.handle("payment", "alice");
        ASSERT(starts(r.text, "【付款方式】"));
        ASSERT(has(r.text, sentences[9].content));

        r = router.handle("有什么政策", "alice");
        r = router.handle("3", "alice");
        ASSERT(starts(r.text, "【付款方式】"));

        r = router.handle("policy_category:pickup", "bob");
        ASSERT(starts(r.text, "【取货地点与时间】"));
        ASSERT(has(r.text, sentences[13].content));

        r = router.handle("policy_category:shipping", "bob");
        ASSERT(r.text == replies::unknown_policy_category("shipping"));
        ASSERT(r.options.size() == 5);

        // Unknown intent without a model: related policy text, else an apology
        r = router.handle("可以发广告吗", "bob");
        ASSERT(starts(r.text, sentences[14].content));
        r = router.handle("股票行情", "bob");
        ASSERT(r.text == replies::fallback_apology());
        r = router.handle("西瓜甜不甜", "bob");
        ASSERT(r.text == replies::fallback_apology());
        r = router.handle("你们几点关门", "bob");
        ASSERT(r.text == replies::fallback_apology());

        // Preheat answers without touching sessions
        ASSERT(router.preheat("付款方式", QueryType::Policy).has_value());
        ASSERT(!router.preheat("股票行情", QueryType::Policy).has_value());
        auto keys = router.preheat("鸡蛋", QueryType::Product);
        ASSERT(keys.has_value());
        ASSERT(keys && has(*keys, "free_range_egg"));
        ASSERT(!router.preheat("你好", QueryType::Chat).has_value());
    }

    // --- generative fallback ---
    {
        auto model_ok = std::make_shared<ScriptedModel>(Result<std::string>(std::string("股市的问题请关注新闻哦。")));
        Harness h(tables, config, model_ok);
        Router& router = *h.router;

        Response r = router.handle("股票行情", "alice");
        ASSERT(r.text == "股市的问题请关注新闻哦。");
        ASSERT(model_ok->calls == 1);
        ASSERT(model_ok->last_prompt == "股票行情");
        ASSERT(model_ok->last_timeout_ms == config.llm.timeout_ms);
        ASSERT(h.cache.entry_ttl(cache::AdaptiveCache::make_key("股票行情", QueryType::Chat)).has_value());

        // Second time from the cache
        r = router.handle("股票行情", "bob");
        ASSERT(r.text == "股市的问题请关注新闻哦。");
        ASSERT(model_ok->calls == 1);

        // Related policy text goes to the model as hints
        router.handle("可以发广告吗", "alice");
        ASSERT(model_ok->calls == 2);
        ASSERT(has(model_ok->last_context, sentences[14].content));

        // Tiered answers never reach the model
        router.handle("草莓卖不?", "alice");
        router.handle("怎么付款", "alice");
        router.handle("我要退货", "alice");
        ASSERT(model_ok->calls == 2);

        // Off-topic questions reach the model without unrelated policy text
        r = router.handle("西瓜甜不甜", "carol");
        ASSERT(r.text == "股市的问题请关注新闻哦。");
        ASSERT(model_ok->calls == 3);
        ASSERT(model_ok->last_context.empty());
        r = router.handle("你们几点关门", "carol");
        ASSERT(r.text == "股市的问题请关注新闻哦。");
        ASSERT(model_ok->calls == 4);
        ASSERT(model_ok->last_context == engine.fallback_context());
    }
    {
        auto model_down = std::make_shared<ScriptedModel>(Result<std::string>(make_unavailable_error("connection refused")));
        Harness h(tables, config, model_down);
        Response r = h.router->handle("股票行情", "alice");
        ASSERT(r.text == replies::fallback_apology());
        ASSERT(model_down->calls == 1);
        ASSERT(!h.cache.entry_ttl(cache::AdaptiveCache::make_key("股票行情", QueryType::Chat)).has_value());

        r = h.router->handle("可以发广告吗", "alice");
        ASSERT(starts(r.text, sentences[14].content));
    }
    {
        auto model_slow = std::make_shared<ScriptedModel>(Result<std::string>(make_timeout_error()));
        Harness h(tables, config, model_slow);
        Response r = h.router->handle("股票行情", "alice");
        ASSERT(r.text == replies::fallback_apology());
        ASSERT(!has(r.text, "timed out"));
    }

    // --- construction ---
    bool rejected = false;
    try {
        Router incomplete(RouterComponents(), config);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    ASSERT(rejected);

    Logger::shutdown();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All router tests passed.\n";
    return 0;
}
