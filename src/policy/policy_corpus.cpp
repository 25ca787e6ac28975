#include "policy/policy_corpus.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace coop_assist {
namespace policy {

namespace {

std::vector<std::string> string_list(const json& obj, const char* field, const std::string& owner) {
    std::vector<std::string> out;
    if (!obj.contains(field)) {
        return out;
    }
    if (!obj[field].is_array()) {
        throw std::runtime_error(std::string("'") + field + "' of '" + owner + "' must be an array");
    }
    for (const auto& v : obj[field]) {
        if (!v.is_string()) {
            throw std::runtime_error(std::string("Non-string entry in '") + field + "' of '" + owner + "'");
        }
        std::string s = v.get<std::string>();
        if (!s.empty()) {
            out.push_back(s);
        }
    }
    return out;
}

} // namespace

int PolicyCategory::score(const std::string& normalized) const {
    int total = 0;
    for (const auto& kw : priority_keywords) {
        if (utils::contains(normalized, kw)) {
            total += constants::policy::PRIORITY_KEYWORD_POINTS;
        }
    }
    for (const auto& kw : keywords) {
        if (std::find(priority_keywords.begin(), priority_keywords.end(), kw) != priority_keywords.end()) {
            continue;
        }
        if (utils::contains(normalized, kw)) {
            total += constants::policy::KEYWORD_POINTS;
        }
    }
    return total;
}

bool PolicyCategory::promotes(const std::wstring& wide_normalized) const {
    for (const auto& re : promote_regexes) {
        if (std::regex_search(wide_normalized, re)) {
            return true;
        }
    }
    return false;
}

PolicyCorpus PolicyCorpus::from_json(const json& j, const std::string& generic_category) {
    if (!j.is_object()) {
        throw std::runtime_error("Policy corpus must be a JSON object");
    }
    if (!j.contains("categories") || !j["categories"].is_array() || j["categories"].empty()) {
        throw std::runtime_error("Policy corpus has no 'categories'");
    }
    if (!j.contains("sections") || !j["sections"].is_array()) {
        throw std::runtime_error("Policy corpus has no 'sections'");
    }

    PolicyCorpus corpus;
    corpus.generic_category_ = generic_category;
    corpus.version_ = j.value("version", "");
    corpus.last_updated_ = j.value("last_updated", "");

    for (const auto& c : j["categories"]) {
        PolicyCategory cat;
        cat.id = c.value("id", "");
        if (cat.id.empty()) {
            throw std::runtime_error("Policy category without an id");
        }
        if (corpus.category(cat.id)) {
            throw std::runtime_error("Duplicate policy category '" + cat.id + "'");
        }
        cat.title = c.value("title", cat.id);
        // Keywords are matched against normalized (lower-case) text
        for (const auto& kw : string_list(c, "keywords", cat.id)) {
            cat.keywords.push_back(utils::normalize_utterance(kw));
        }
        for (const auto& kw : string_list(c, "priority_keywords", cat.id)) {
            cat.priority_keywords.push_back(utils::normalize_utterance(kw));
        }
        cat.promote_patterns = string_list(c, "promote_patterns", cat.id);
        for (const auto& pattern : cat.promote_patterns) {
            try {
                cat.promote_regexes.emplace_back(utils::to_wide(pattern), std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                throw std::runtime_error("Invalid promote pattern '" + pattern + "': " + e.what());
            }
        }
        corpus.categories_.push_back(std::move(cat));
    }
    if (!corpus.category(generic_category)) {
        throw std::runtime_error("Generic category '" + generic_category + "' is not declared");
    }

    for (const auto& section : j["sections"]) {
        std::string title = section.value("title", "");
        for (const auto& text : string_list(section, "sentences", title.empty() ? "section" : title)) {
            PolicySentence s;
            s.id = corpus.sentences_.size();
            s.content = utils::trim_copy(text);
            s.normalized = utils::normalize_utterance(s.content);
            s.compact = utils::strip_punctuation(s.normalized);
            s.section = title;
            if (s.compact.empty()) {
                continue;
            }

            CategoryGuess best{generic_category, 0};
            for (const auto& cat : corpus.categories_) {
                int score = cat.score(s.normalized);
                if (score > 0) {
                    s.category_scores[cat.id] = score;
                }
                // Strictly greater: ties stay with the earlier category
                if (score > best.score) {
                    best = CategoryGuess{cat.id, score};
                }
            }
            s.category = best.category;
            const PolicyCategory* owner = corpus.category(s.category);
            for (const auto& kw : owner->priority_keywords) {
                if (utils::contains(s.normalized, kw)) {
                    s.priority = true;
                    break;
                }
            }
            corpus.sentences_.push_back(std::move(s));
        }
    }
    if (corpus.sentences_.empty()) {
        throw std::runtime_error("Policy corpus contains no sentences");
    }
    return corpus;
}

Result<PolicyCorpus> PolicyCorpus::load(const std::string& path, const std::string& generic_category) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open policy corpus: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse " + path + ": " + e.what());
    }

    try {
        PolicyCorpus corpus = from_json(j, generic_category);
        Logger::info("[Policy] Loaded " + std::to_string(corpus.size()) + " sentences in " +
                     std::to_string(corpus.categories().size()) + " categories from " + path +
                     (corpus.version().empty() ? "" : " (version " + corpus.version() + ")"));
        return corpus;
    } catch (const std::exception& e) {
        return make_invalid_data_error("Malformed policy corpus " + path + ": " + e.what());
    }
}

CategoryGuess PolicyCorpus::categorize(const std::string& text) const {
    const std::string normalized = utils::normalize_utterance(text);
    CategoryGuess best{generic_category_, 0};
    for (const auto& cat : categories_) {
        int score = cat.score(normalized);
        if (score > best.score) {
            best = CategoryGuess{cat.id, score};
        }
    }
    return best;
}

const PolicyCategory* PolicyCorpus::category(const std::string& id) const {
    for (const auto& cat : categories_) {
        if (cat.id == id) {
            return &cat;
        }
    }
    return nullptr;
}

std::vector<const PolicySentence*> PolicyCorpus::sentences_in(const std::string& category_id) const {
    std::vector<const PolicySentence*> out;
    for (const auto& s : sentences_) {
        if (s.category == category_id) {
            out.push_back(&s);
        }
    }
    return out;
}

} // namespace policy
} // namespace coop_assist
