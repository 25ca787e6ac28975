#include "intent/rule_table.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace coop_assist {
namespace intent {

bool IntentRule::matches(const std::string& normalized, const std::wstring& wide) const {
    switch (kind) {
        case MatchKind::Exact:
            return normalized == pattern;
        case MatchKind::Contains:
            return utils::contains(normalized, pattern);
        case MatchKind::Regex:
            return std::regex_search(wide, regex);
    }
    return false;
}

IntentRule IntentRuleTable::parse_rule(Intent intent, const std::string& kind, const std::string& pattern) {
    if (pattern.empty()) {
        throw std::runtime_error(std::string("Empty pattern for intent ") + intent_to_string(intent));
    }

    IntentRule rule;
    rule.intent = intent;
    // Literal patterns are normalized the same way utterances are
    if (kind == "exact") {
        rule.kind = MatchKind::Exact;
        rule.pattern = utils::normalize_utterance(pattern);
    } else if (kind == "contains") {
        rule.kind = MatchKind::Contains;
        rule.pattern = utils::normalize_utterance(pattern);
    } else if (kind == "regex") {
        rule.kind = MatchKind::Regex;
        rule.pattern = pattern;
        try {
            rule.regex = std::wregex(utils::to_wide(pattern), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::runtime_error("Invalid regex '" + pattern + "': " + e.what());
        }
    } else {
        throw std::runtime_error("Unknown match kind '" + kind + "' for pattern '" + pattern + "'");
    }
    return rule;
}

IntentRuleTable IntentRuleTable::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Rule table must be a JSON object");
    }

    auto parse_intent = [](const json& entry) {
        if (!entry.contains("intent") || !entry["intent"].is_string()) {
            throw std::runtime_error("Rule entry without an intent label");
        }
        std::string label = entry["intent"].get<std::string>();
        auto intent = intent_from_string(label);
        if (!intent || *intent == Intent::Unknown) {
            throw std::runtime_error("Rule entry with unsupported intent '" + label + "'");
        }
        return *intent;
    };

    IntentRuleTable table;

    if (j.contains("high_priority")) {
        if (!j["high_priority"].is_array()) {
            throw std::runtime_error("'high_priority' must be an array");
        }
        for (const auto& entry : j["high_priority"]) {
            Intent intent = parse_intent(entry);
            if (!entry.contains("pattern") || !entry["pattern"].is_string()) {
                throw std::runtime_error("High-priority rule without a pattern");
            }
            table.high_priority_.push_back(parse_rule(
                intent, entry.value("match", "regex"), entry["pattern"].get<std::string>()));
        }
    }

    if (j.contains("rules")) {
        if (!j["rules"].is_array()) {
            throw std::runtime_error("'rules' must be an array");
        }
        for (const auto& entry : j["rules"]) {
            IntentRuleGroup group;
            group.intent = parse_intent(entry);
            for (const auto& existing : table.groups_) {
                if (existing.intent == group.intent) {
                    throw std::runtime_error(std::string("Intent listed twice in general rules: ") +
                                             intent_to_string(group.intent));
                }
            }
            if (!entry.contains("patterns") || !entry["patterns"].is_array() || entry["patterns"].empty()) {
                throw std::runtime_error(std::string("No patterns for intent ") + intent_to_string(group.intent));
            }
            std::string kind = entry.value("match", "regex");
            for (const auto& pattern : entry["patterns"]) {
                if (!pattern.is_string()) {
                    throw std::runtime_error(std::string("Non-string pattern for intent ") +
                                             intent_to_string(group.intent));
                }
                group.rules.push_back(parse_rule(group.intent, kind, pattern.get<std::string>()));
            }
            table.groups_.push_back(std::move(group));
        }
    }

    if (table.empty()) {
        throw std::runtime_error("Rule table contains no patterns");
    }
    return table;
}

Result<IntentRuleTable> IntentRuleTable::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open rule table: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse " + path + ": " + e.what());
    }

    try {
        IntentRuleTable table = from_json(j);
        Logger::info("[Intent] Loaded " + std::to_string(table.size()) + " rule patterns from " + path);
        return table;
    } catch (const std::exception& e) {
        return make_invalid_data_error("Malformed rule table " + path + ": " + e.what());
    }
}

size_t IntentRuleTable::size() const {
    size_t total = high_priority_.size();
    for (const auto& group : groups_) {
        total += group.rules.size();
    }
    return total;
}

} // namespace intent
} // namespace coop_assist
