#include "intent/intent_classifier.h"
#include "logger.h"
#include "utils.h"
#include <sstream>
#include <stdexcept>

namespace coop_assist {
namespace intent {

IntentClassifier::IntentClassifier(IntentRuleTable rules,
                                   std::shared_ptr<const IntentModel> model,
                                   const config::IntentConfig& config)
    : rules_(std::move(rules)), model_(std::move(model)), config_(config) {
    if (rules_.empty()) {
        throw std::invalid_argument("IntentClassifier requires a non-empty rule table");
    }
    if (!model_) {
        Logger::warn("[Intent] No statistical model; classifying with rules only");
    }
}

IntentResult IntentClassifier::classify(const std::string& utterance) const {
    IntentResult result;
    const std::string normalized = utils::normalize_utterance(utterance);
    if (normalized.empty()) {
        return result;
    }
    const std::wstring wide = utils::to_wide(normalized);

    // Tier 1: high-priority rules, strictly in table order
    for (const auto& rule : rules_.high_priority()) {
        if (rule.matches(normalized, wide)) {
            result.intent = rule.intent;
            result.confidence = constants::intent::RULE_CONFIDENCE;
            result.tier = ClassifierTier::HighPriorityRule;
            result.matched_pattern = rule.pattern;
            LOG_INTENT("'" + normalized + "' -> " + intent_to_string(rule.intent) +
                       " (high priority: " + rule.pattern + ")");
            return result;
        }
    }

    // Tier 2: first intent group with any matching pattern
    for (const auto& group : rules_.groups()) {
        for (const auto& rule : group.rules) {
            if (rule.matches(normalized, wide)) {
                result.intent = group.intent;
                result.confidence = constants::intent::RULE_CONFIDENCE;
                result.tier = ClassifierTier::Rule;
                result.matched_pattern = rule.pattern;
                LOG_INTENT("'" + normalized + "' -> " + intent_to_string(group.intent) +
                           " (rule: " + rule.pattern + ")");
                return result;
            }
        }
    }

    // Tier 3: statistical fallback
    if (model_) {
        auto prediction = model_->predict(normalized);
        if (prediction && prediction->intent != Intent::Unknown &&
            prediction->probability >= config_.statistical_threshold) {
            result.intent = prediction->intent;
            result.confidence = prediction->probability;
            result.tier = ClassifierTier::Statistical;
            std::ostringstream oss;
            oss << "'" << normalized << "' -> " << intent_to_string(prediction->intent)
                << " (statistical p=" << prediction->probability << ")";
            LOG_INTENT(oss.str());
            return result;
        }
    }

    LOG_INTENT("'" + normalized + "' -> unknown");
    return result;
}

} // namespace intent
} // namespace coop_assist
