#pragma once

/**
 * @file rule_table.h
 * @brief Ordered intent rule table (high-priority tier + general tier)
 */

#include "core/types.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <vector>

namespace coop_assist {
namespace intent {

/// How a rule pattern is compared against the normalized utterance
enum class MatchKind {
    Exact,     ///< Whole utterance equals the pattern
    Contains,  ///< Pattern occurs anywhere in the utterance
    Regex      ///< ECMAScript regex searched over code points
};

/**
 * @brief One pattern bound to one intent
 */
struct IntentRule {
    Intent intent = Intent::Unknown;
    MatchKind kind = MatchKind::Regex;
    std::string pattern;
    std::wregex regex;  ///< Compiled form for MatchKind::Regex

    /// @param normalized utils::normalize_utterance output
    /// @param wide Same text as wide string (avoids re-decoding per rule)
    bool matches(const std::string& normalized, const std::wstring& wide) const;
};

/**
 * @brief All patterns of one intent, in priority order
 */
struct IntentRuleGroup {
    Intent intent = Intent::Unknown;
    std::vector<IntentRule> rules;
};

/**
 * @brief Immutable rule table loaded once at startup
 *
 * Order is part of the contract: the high-priority list is scanned first,
 * rule by rule, and the first hit wins. The general table is then scanned
 * group by group and the first group with any matching pattern wins. Narrow
 * patterns must therefore be listed before broad ones that share vocabulary
 * (refund-request phrasings before any policy keyword).
 */
class IntentRuleTable {
public:
    IntentRuleTable() = default;

    /**
     * @brief Build from parsed JSON
     * @throws std::runtime_error on unknown intents, missing fields or bad regexes
     */
    static IntentRuleTable from_json(const nlohmann::json& j);

    /**
     * @brief Read and build from a file; any defect is reported as InvalidData/ParseError
     */
    static Result<IntentRuleTable> load(const std::string& path);

    const std::vector<IntentRule>& high_priority() const { return high_priority_; }
    const std::vector<IntentRuleGroup>& groups() const { return groups_; }

    /// Total number of patterns across both tiers
    size_t size() const;

    bool empty() const { return size() == 0; }

private:
    static IntentRule parse_rule(Intent intent, const std::string& kind, const std::string& pattern);

    std::vector<IntentRule> high_priority_;
    std::vector<IntentRuleGroup> groups_;
};

} // namespace intent
} // namespace coop_assist
