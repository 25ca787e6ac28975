#include "router.h"
#include "logger.h"
#include "replies.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace coop_assist {

namespace {

const std::vector<std::string> PRICE_WORDS = {
    "多少钱", "什么价", "价格是", "几多钱", "价格", "售价", "怎么卖", "价钱"
};

const std::vector<std::string> FOLLOWUP_PRONOUNS = {
    "它", "这个", "那个", "刚才", "刚刚", "这种", "那种"
};

const std::vector<std::string> FILLER_CHARS = {"的", "呢", "啊", "吗", "呀", "吧"};

Response text_response(const std::string& text) {
    Response r;
    r.text = text;
    return r;
}

std::string compact_text(const std::string& message) {
    std::string text = utils::strip_punctuation(utils::normalize_utterance(message));
    for (const auto& filler : FILLER_CHARS) {
        size_t pos = 0;
        while ((pos = text.find(filler, pos)) != std::string::npos) {
            text.erase(pos, filler.size());
        }
    }
    return text;
}

bool contains_any(const std::string& text, const std::vector<std::string>& words) {
    for (const auto& w : words) {
        if (utils::contains(text, w)) return true;
    }
    return false;
}

/// 1-based option number from "2", "第2个", "第二个", "2号"
std::optional<size_t> parse_ordinal(const std::string& message) {
    std::string text = utils::strip_punctuation(utils::normalize_utterance(message));
    for (const std::string prefix : {"第", "选"}) {
        if (utils::starts_with(text, prefix)) text.erase(0, prefix.size());
    }
    for (const std::string suffix : {"个", "号", "项"}) {
        if (utils::ends_with(text, suffix)) text.erase(text.size() - suffix.size());
    }
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.size() <= 2 && text.find_first_not_of("0123456789") == std::string::npos) {
        return static_cast<size_t>(std::stoi(text));
    }
    static const std::vector<std::string> NUMERALS = {
        "一", "二", "三", "四", "五", "六", "七", "八", "九", "十"
    };
    for (size_t i = 0; i < NUMERALS.size(); ++i) {
        if (text == NUMERALS[i]) return i + 1;
    }
    return std::nullopt;
}

std::string encode_list(const std::vector<std::string>& items) {
    return json(items).dump();
}

std::optional<std::vector<std::string>> decode_list(const std::string& payload) {
    try {
        json j = json::parse(payload);
        if (!j.is_array()) {
            return std::nullopt;
        }
        return j.get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        Logger::warn(std::string("[Router] Discarding unreadable cache payload: ") + e.what());
        return std::nullopt;
    }
}

} // namespace

class Router::Impl {
public:
    Impl(RouterComponents components, const config::EngineConfig& config)
        : c_(std::move(components)), config_(config) {
        if (!c_.classifier || !c_.catalog || !c_.resolver || !c_.policy || !c_.cache || !c_.sessions ||
            !c_.popularity) {
            throw std::invalid_argument(
                "Router requires classifier, catalog, resolver, policy, cache, sessions and popularity");
        }
        if (!c_.llm) {
            Logger::warn("[Router] No generative model; unanswerable messages get a fixed reply");
        }
        if (!c_.classifier->has_model()) {
            Logger::warn("[Router] Intent classifier is running rule-only");
        }
    }

    Response handle(const std::string& raw_message, const std::string& user_id) {
        const auto start = Clock::now();
        const std::string message = utils::trim_copy(raw_message);
        if (message.empty()) {
            return text_response(replies::empty_message());
        }
        LOG_ROUTER(user_id + ": " + message);

        // Explicit payloads are stateless
        if (utils::starts_with(message, POLICY_CATEGORY_PREFIX)) {
            c_.sessions->clear_pending(user_id);
            return policy_category_reply(message.substr(std::string(POLICY_CATEGORY_PREFIX).size()));
        }
        if (utils::starts_with(message, PRODUCT_SELECTION_PREFIX)) {
            c_.sessions->clear_pending(user_id);
            return product_selection_reply(user_id, message.substr(std::string(PRODUCT_SELECTION_PREFIX).size()));
        }

        if (auto pending = c_.sessions->get_pending(user_id)) {
            std::optional<std::string> chosen = match_selection(*pending, message);
            c_.sessions->clear_pending(user_id);
            if (chosen) {
                LOG_ROUTER(user_id + " selected " + *chosen);
                return handle_payload(user_id, *chosen);
            }
            LOG_ROUTER(user_id + " moved on; pending clarification dropped");
        }

        if (auto followup = price_followup(user_id, message)) {
            return *followup;
        }

        IntentResult intent = c_.classifier->classify(message);
        Response response = dispatch(intent, message, user_id);

        std::ostringstream oss;
        oss << "intent=" << intent_to_string(intent.intent) << " tier=" << tier_to_string(intent.tier)
            << " options=" << response.options.size() << " (" << ms_since(start) << "ms)";
        LOG_ROUTER(oss.str());
        return response;
    }

    std::optional<std::string> preheat(const std::string& query, QueryType type) const {
        switch (type) {
            case QueryType::Policy: {
                policy::PolicySearchResult result = c_.policy->search(query);
                if (result.empty()) return std::nullopt;
                return encode_list(hit_texts(result));
            }
            case QueryType::Product: {
                resolver::ResolveResult result = c_.resolver->resolve(query);
                if (result.candidates.empty()) return std::nullopt;
                return encode_list(candidate_keys(result.candidates));
            }
            case QueryType::Chat:
                return std::nullopt;
        }
        return std::nullopt;
    }

private:
    // =========================================================================
    // Dispatch
    // =========================================================================

    Response dispatch(const IntentResult& intent, const std::string& message, const std::string& user_id) {
        switch (intent.intent) {
            case Intent::Greeting:
                return text_response(replies::greeting());
            case Intent::IdentityQuery:
                return text_response(replies::identity());
            case Intent::WhatDoYouSell:
                return what_do_you_sell(message, user_id);
            case Intent::PriceOrBuy:
                return product_flow(message, user_id, true);
            case Intent::Availability:
                return product_flow(message, user_id, false);
            case Intent::Recommendation:
                return recommendation(message, user_id);
            case Intent::PolicyInquiry:
                return policy_flow(message);
            case Intent::PolicyList:
                return policy_list(user_id);
            case Intent::RefundRequest:
                return refund(message);
            case Intent::Unknown:
                return unknown(message, user_id);
        }
        return unknown(message, user_id);
    }

    Response handle_payload(const std::string& user_id, const std::string& payload) {
        if (utils::starts_with(payload, POLICY_CATEGORY_PREFIX)) {
            return policy_category_reply(payload.substr(std::string(POLICY_CATEGORY_PREFIX).size()));
        }
        if (utils::starts_with(payload, PRODUCT_SELECTION_PREFIX)) {
            return product_selection_reply(user_id, payload.substr(std::string(PRODUCT_SELECTION_PREFIX).size()));
        }
        return product_selection_reply(user_id, payload);
    }

    std::optional<std::string> match_selection(const session::PendingClarification& pending,
                                               const std::string& message) const {
        if (const ResponseOption* option = pending.find_payload(message)) {
            return option->payload;
        }
        // A bare key or category id stands for its payload
        std::string prefixed = pending.kind == session::PendingKind::Product
            ? PRODUCT_SELECTION_PREFIX + utils::to_lower_ascii(message)
            : POLICY_CATEGORY_PREFIX + message;
        if (const ResponseOption* option = pending.find_payload(prefixed)) {
            return option->payload;
        }
        std::optional<size_t> ordinal = parse_ordinal(message);
        if (ordinal && *ordinal >= 1 && *ordinal <= pending.options.size()) {
            return pending.options[*ordinal - 1].payload;
        }
        return std::nullopt;
    }

    // =========================================================================
    // Products
    // =========================================================================

    Response product_flow(const std::string& message, const std::string& user_id, bool price_focus) {
        const std::string key = cache::AdaptiveCache::make_key(message, QueryType::Product);
        std::vector<const catalog::Product*> products;
        std::vector<resolver::ProductCandidate> near_misses;
        std::string cleaned;

        if (auto cached = c_.cache->get(key)) {
            if (auto keys = decode_list(*cached)) {
                for (const auto& k : *keys) {
                    if (const catalog::Product* p = c_.catalog->find(k)) products.push_back(p);
                }
                cleaned = c_.resolver->stripper().strip(message);
            }
        }

        if (products.empty()) {
            resolver::ResolveResult result = c_.resolver->resolve(message);
            cleaned = result.cleaned;
            near_misses = result.near_misses;
            for (const auto& candidate : result.candidates) {
                if (const catalog::Product* p = c_.catalog->find(candidate.key)) products.push_back(p);
            }
            if (!products.empty()) {
                c_.cache->put(key, encode_list(candidate_keys(result.candidates)), QueryType::Product);
            }
        }

        if (products.empty()) {
            // "水果有吗" names a category, not a product
            if (auto category = c_.catalog->category_in(cleaned.empty() ? message : cleaned)) {
                return category_browse(*category, user_id, message);
            }
            Response r;
            r.text = replies::product_not_found(cleaned.empty() ? message : cleaned,
                                                !near_misses.empty(), c_.catalog->categories());
            for (const auto& miss : near_misses) {
                if (const catalog::Product* p = c_.catalog->find(miss.key)) {
                    r.options.push_back(product_option(*p));
                }
            }
            if (r.has_options()) {
                c_.sessions->set_pending(user_id, session::PendingKind::Product, r.options, message);
            }
            return r;
        }

        if (products.size() == 1) {
            remember(user_id, *products.front(), price_focus ? Intent::PriceOrBuy : Intent::Availability, message);
            return text_response(replies::product_detail(*products.front(), price_focus));
        }

        Response r;
        size_t shown = std::min(products.size(), config_.resolver.max_options);
        for (size_t i = 0; i < shown; ++i) {
            r.options.push_back(product_option(*products[i]));
        }
        r.text = replies::ambiguous_product(cleaned, shown, products.size());
        c_.sessions->set_pending(user_id, session::PendingKind::Product, r.options, message);
        return r;
    }

    Response product_selection_reply(const std::string& user_id, const std::string& key) {
        const catalog::Product* product = c_.catalog->find(key);
        if (!product) {
            LOG_ROUTER("Selection of unknown product '" + key + "'");
            return text_response(replies::selection_expired());
        }
        remember(user_id, *product, Intent::Availability, "");
        return text_response(replies::product_detail(*product, false));
    }

    std::optional<Response> price_followup(const std::string& user_id, const std::string& message) {
        const std::string compact = compact_text(message);
        bool bare_price = std::find(PRICE_WORDS.begin(), PRICE_WORDS.end(), compact) != PRICE_WORDS.end();
        bool pronoun_price = contains_any(compact, FOLLOWUP_PRONOUNS) && contains_any(compact, PRICE_WORDS);
        if (!bare_price && !pronoun_price) {
            return std::nullopt;
        }
        // "这个草莓多少钱" names its product; only pronoun-only questions are elliptical
        if (!bare_price && !c_.resolver->resolve(message).candidates.empty()) {
            return std::nullopt;
        }

        std::optional<session::LastContext> context = c_.sessions->get_last_context(user_id);
        if (!context) {
            return std::nullopt;
        }
        const catalog::Product* product = c_.catalog->find(context->product_key);
        if (!product) {
            return std::nullopt;
        }
        LOG_ROUTER("Price follow-up resolved to last product " + product->key);
        remember(user_id, *product, Intent::PriceOrBuy, message);
        return text_response(replies::product_detail(*product, true));
    }

    Response what_do_you_sell(const std::string& message, const std::string& user_id) {
        if (auto category = c_.catalog->category_in(message)) {
            return category_browse(*category, user_id, message);
        }
        return text_response(replies::catalog_overview(*c_.catalog));
    }

    Response category_browse(const std::string& category, const std::string& user_id,
                             const std::string& message) {
        std::vector<const catalog::Product*> products = c_.popularity->rank(c_.catalog->in_category(category));
        LOG_ROUTER("Browsing category " + category + " (" + std::to_string(products.size()) + " products)");

        Response r;
        size_t shown = std::min(products.size(), config_.resolver.max_options);
        for (size_t i = 0; i < shown; ++i) {
            r.options.push_back(product_option(*products[i]));
        }
        r.text = replies::category_products(category, shown, products.size());
        if (r.has_options()) {
            c_.sessions->set_pending(user_id, session::PendingKind::Product, r.options, message);
        }
        return r;
    }

    /// Featured products (or one named category) ordered by how often they were asked about
    Response recommendation(const std::string& message, const std::string& user_id) {
        const std::string category = c_.catalog->category_in(message).value_or("");

        std::vector<const catalog::Product*> picks =
            category.empty() ? c_.catalog->featured() : c_.catalog->in_category(category);
        if (picks.empty()) {
            for (const auto& p : c_.catalog->products()) picks.push_back(&p);
        }
        if (picks.empty()) {
            return text_response(replies::catalog_overview(*c_.catalog));
        }
        picks = c_.popularity->rank(std::move(picks));

        Response r;
        r.text = replies::recommendation_intro(category);
        for (size_t i = 0; i < picks.size() && i < config_.resolver.max_options; ++i) {
            r.options.push_back(product_option(*picks[i]));
        }
        c_.sessions->set_pending(user_id, session::PendingKind::Product, r.options, message);
        return r;
    }

    ResponseOption product_option(const catalog::Product& product) const {
        ResponseOption option;
        option.display_text = replies::product_option_label(product);
        option.payload = PRODUCT_SELECTION_PREFIX + product.key;
        return option;
    }

    void remember(const std::string& user_id, const catalog::Product& product, Intent intent,
                  const std::string& query) {
        session::LastContext context;
        context.product_key = product.key;
        context.product_name = product.name;
        context.intent = intent;
        context.query = query;
        c_.sessions->set_last_context(user_id, std::move(context));
        c_.popularity->record(product.key);
    }

    static std::vector<std::string> candidate_keys(const std::vector<resolver::ProductCandidate>& candidates) {
        std::vector<std::string> keys;
        keys.reserve(candidates.size());
        for (const auto& c : candidates) keys.push_back(c.key);
        return keys;
    }

    // =========================================================================
    // Policy
    // =========================================================================

    Response policy_flow(const std::string& message) {
        const std::string key = cache::AdaptiveCache::make_key(message, QueryType::Policy);
        if (auto cached = c_.cache->get(key)) {
            if (auto sentences = decode_list(*cached)) {
                if (!sentences->empty()) return text_response(replies::policy_answer(*sentences));
            }
        }

        policy::PolicySearchResult result = c_.policy->search(message);
        if (!result.empty()) {
            std::vector<std::string> sentences = hit_texts(result);
            c_.cache->put(key, encode_list(sentences), QueryType::Policy);
            return text_response(replies::policy_answer(sentences));
        }

        LOG_ROUTER("Policy search exhausted all tiers; using generative fallback");
        return fallback(message, c_.policy->fallback_context());
    }

    Response policy_list(const std::string& user_id) {
        Response r;
        r.text = replies::policy_list_intro();
        r.options = policy_category_options();
        c_.sessions->set_pending(user_id, session::PendingKind::PolicyCategory, r.options, "");
        return r;
    }

    Response policy_category_reply(const std::string& id) {
        const policy::PolicyCorpus& corpus = c_.policy->corpus();
        const policy::PolicyCategory* category = corpus.category(utils::trim_copy(id));
        if (!category) {
            Response r;
            r.text = replies::unknown_policy_category(id);
            r.options = policy_category_options();
            return r;
        }
        return text_response(replies::policy_category(*category, corpus.sentences_in(category->id)));
    }

    std::vector<ResponseOption> policy_category_options() const {
        std::vector<ResponseOption> options;
        for (const auto& category : c_.policy->corpus().categories()) {
            ResponseOption option;
            option.display_text = category.title;
            option.payload = POLICY_CATEGORY_PREFIX + category.id;
            options.push_back(std::move(option));
        }
        return options;
    }

    Response refund(const std::string& message) {
        std::vector<std::string> sentences;
        for (const auto* s : c_.policy->corpus().sentences_in(config_.policy.refund_category)) {
            sentences.push_back(s->content);
        }
        if (sentences.empty()) {
            sentences = hit_texts(c_.policy->search(message));
        }
        if (sentences.empty()) {
            return fallback(message, c_.policy->fallback_context());
        }
        return text_response(replies::refund_guidance(sentences));
    }

    static std::vector<std::string> hit_texts(const policy::PolicySearchResult& result) {
        std::vector<std::string> texts;
        texts.reserve(result.hits.size());
        for (const auto& hit : result.hits) texts.push_back(hit.content);
        return texts;
    }

    // =========================================================================
    // Fallback
    // =========================================================================

    Response unknown(const std::string& message, const std::string& user_id) {
        // A bare category name ("海鲜") browses that category
        const std::string compact = compact_text(message);
        for (const auto& category : c_.catalog->categories()) {
            if (compact == utils::normalize_utterance(category)) {
                return category_browse(category, user_id, message);
            }
        }

        std::string hints;
        std::string degraded;
        policy::PolicySearchResult related = c_.policy->search(message);
        if (!related.empty()) {
            degraded = replies::policy_answer(hit_texts(related));
            hints = "可能相关的规定:\n" + degraded;
        }
        return fallback(message, hints, degraded);
    }

    /**
     * @param degraded Reply when the model is missing or fails (empty = apology)
     */
    Response fallback(const std::string& message, const std::string& context,
                      const std::string& degraded = "") {
        const std::string key = cache::AdaptiveCache::make_key(message, QueryType::Chat);
        if (auto cached = c_.cache->get(key)) {
            return text_response(*cached);
        }
        const std::string unavailable = degraded.empty() ? replies::fallback_apology() : degraded;
        if (!c_.llm) {
            return text_response(unavailable);
        }

        Result<std::string> answer = c_.llm->generate(message, context, config_.llm.timeout_ms);
        if (answer.is_error()) {
            Logger::warn(std::string("[Router] Generative fallback failed (") +
                         error_type_name(answer.error().type) + "): " + answer.error().message);
            return text_response(unavailable);
        }
        c_.cache->put(key, answer.value(), QueryType::Chat);
        return text_response(answer.value());
    }

    RouterComponents c_;
    config::EngineConfig config_;
};

Router::Router(RouterComponents components, const config::EngineConfig& config)
    : pimpl_(std::make_unique<Impl>(std::move(components), config)) {
}

Router::~Router() = default;

Response Router::handle(const std::string& raw_message, const std::string& user_id) {
    return pimpl_->handle(raw_message, user_id);
}

std::optional<std::string> Router::preheat(const std::string& query, QueryType type) const {
    return pimpl_->preheat(query, type);
}

} // namespace coop_assist
