#pragma once

#include <string>
#include <vector>

namespace coop_assist {
namespace resolver {

/**
 * @brief Removes filler prefixes and suffixes around a product mention
 *
 * "请问有没有草莓" -> "草莓", "草莓卖不?" -> "草莓".
 *
 * Ordering invariant: within each list an affix may not be a proper
 * prefix (for the prefix list) or suffix (for the suffix list) of an affix
 * listed after it. Otherwise the shorter one would fire first and leave a
 * dangling fragment ("有没有" must be stripped as one unit, never as "有").
 * The constructor rejects lists that break it.
 */
class AffixStripper {
public:
    /**
     * @throws std::invalid_argument when an ordering invariant is violated
     *         or an affix is empty
     */
    AffixStripper(std::vector<std::string> prefixes, std::vector<std::string> suffixes);

    /// Filler list for Chinese shopping questions
    static AffixStripper default_fillers();

    /**
     * @brief Normalize, drop punctuation, then strip affixes
     *
     * After every removal the lists are rescanned from the top. A removal
     * that would leave nothing is not applied.
     */
    std::string strip(const std::string& fragment) const;

    const std::vector<std::string>& prefixes() const { return prefixes_; }
    const std::vector<std::string>& suffixes() const { return suffixes_; }

private:
    std::vector<std::string> prefixes_;
    std::vector<std::string> suffixes_;
};

} // namespace resolver
} // namespace coop_assist
