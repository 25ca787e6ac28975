#include "resolver/affix_stripper.h"
#include "utils.h"
#include <stdexcept>

namespace coop_assist {
namespace resolver {

namespace {

void check_order(const std::vector<std::string>& affixes, bool suffix) {
    for (size_t i = 0; i < affixes.size(); ++i) {
        if (affixes[i].empty()) {
            throw std::invalid_argument("Empty affix in filler list");
        }
        for (size_t j = i + 1; j < affixes.size(); ++j) {
            const std::string& earlier = affixes[i];
            const std::string& later = affixes[j];
            if (earlier.size() >= later.size()) {
                continue;
            }
            bool shadows = suffix ? utils::ends_with(later, earlier) : utils::starts_with(later, earlier);
            if (shadows) {
                throw std::invalid_argument("Affix '" + earlier + "' is listed before the longer '" +
                                            later + "' it would shadow");
            }
        }
    }
}

} // namespace

AffixStripper::AffixStripper(std::vector<std::string> prefixes, std::vector<std::string> suffixes)
    : prefixes_(std::move(prefixes)), suffixes_(std::move(suffixes)) {
    check_order(prefixes_, false);
    check_order(suffixes_, true);
}

AffixStripper AffixStripper::default_fillers() {
    return AffixStripper(
        {"卖不卖", "有没有", "有不有", "卖不", "有不", "我要", "我想", "你们", "请问"},
        {"一斤多少钱", "卖不卖", "有没有", "有不有", "一斤多少", "多少钱", "怎么卖", "还有吗",
         "卖不", "有不", "卖吗", "有吗", "价格", "售价", "有", "吗", "呢", "啊", "呀"});
}

std::string AffixStripper::strip(const std::string& fragment) const {
    std::string text = utils::strip_punctuation(utils::normalize_utterance(fragment));

    bool changed = true;
    while (changed && !text.empty()) {
        changed = false;
        for (const auto& p : prefixes_) {
            if (text.size() > p.size() && utils::starts_with(text, p)) {
                text.erase(0, p.size());
                changed = true;
                break;
            }
        }
        if (changed) {
            continue;
        }
        for (const auto& s : suffixes_) {
            if (text.size() > s.size() && utils::ends_with(text, s)) {
                text.erase(text.size() - s.size());
                changed = true;
                break;
            }
        }
    }
    return text;
}

} // namespace resolver
} // namespace coop_assist
