#pragma once

#include "core/config.h"
#include "core/types.h"
#include "intent/intent_model.h"
#include "intent/rule_table.h"
#include <memory>
#include <string>

namespace coop_assist {
namespace intent {

/**
 * @brief Multi-tier intent classifier
 *
 * Tiers, first confident result wins:
 * 1. high-priority rules (confidence 1.0)
 * 2. general rule table (confidence 1.0)
 * 3. statistical model, if loaded and above the threshold
 * 4. Intent::Unknown
 *
 * Pure function over immutable tables; safe to call from any thread.
 */
class IntentClassifier {
public:
    /**
     * @param rules Rule table (must be non-empty)
     * @param model Statistical tier; nullptr means rule-only operation
     */
    IntentClassifier(IntentRuleTable rules,
                     std::shared_ptr<const IntentModel> model,
                     const config::IntentConfig& config = {});

    /**
     * @brief Classify a raw utterance (normalized internally)
     */
    IntentResult classify(const std::string& utterance) const;

    bool has_model() const { return model_ != nullptr; }

    const IntentRuleTable& rules() const { return rules_; }

private:
    IntentRuleTable rules_;
    std::shared_ptr<const IntentModel> model_;
    config::IntentConfig config_;
};

} // namespace intent
} // namespace coop_assist
