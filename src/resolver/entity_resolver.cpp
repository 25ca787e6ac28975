#include "resolver/entity_resolver.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <set>
#include <sstream>

namespace coop_assist {
namespace resolver {

namespace {

constexpr double NEAR_MISS_FLOOR = 0.3;
constexpr size_t NEAR_MISS_COUNT = 3;

std::u32string clean_name(const std::string& text) {
    return utils::utf8_decode(utils::strip_punctuation(utils::normalize_utterance(text)));
}

ProductCandidate make_candidate(const catalog::Product& p, double score) {
    ProductCandidate c;
    c.key = p.key;
    c.name = p.name;
    c.specification = p.specification;
    c.category = p.category;
    c.score = score;
    return c;
}

} // namespace

const char* resolution_status_to_string(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::NotFound:  return "not_found";
        case ResolutionStatus::Resolved:  return "resolved";
        case ResolutionStatus::Ambiguous: return "ambiguous";
    }
    return "unknown";
}

EntityResolver::EntityResolver(const catalog::ProductCatalog& catalog,
                               const config::ResolverConfig& config,
                               AffixStripper stripper)
    : catalog_(catalog), config_(config), stripper_(std::move(stripper)) {
    index_.reserve(catalog_.size());
    for (const auto& p : catalog_.products()) {
        IndexedProduct ip;
        ip.product = &p;
        ip.name = clean_name(p.name);
        for (const auto& kw : p.keywords) {
            std::u32string alias = clean_name(kw);
            if (!alias.empty() && alias != ip.name) {
                ip.aliases.push_back(std::move(alias));
            }
        }
        index_.push_back(std::move(ip));
    }
}

double EntityResolver::score_text(const std::u32string& query, const std::u32string& target) {
    if (query.empty() || target.empty()) {
        return 0.0;
    }
    if (query == target) {
        return 1.0;
    }

    const std::u32string& shorter = query.size() <= target.size() ? query : target;
    const std::u32string& longer = query.size() <= target.size() ? target : query;
    if (longer.find(shorter) != std::u32string::npos) {
        double coverage = static_cast<double>(shorter.size()) / static_cast<double>(longer.size());
        return constants::resolver::CONTAINMENT_BASE +
               (1.0 - constants::resolver::CONTAINMENT_BASE) * coverage;
    }

    std::set<char32_t> a(query.begin(), query.end());
    std::set<char32_t> b(target.begin(), target.end());
    size_t common = 0;
    for (char32_t c : a) {
        if (b.count(c)) ++common;
    }
    double overlap = static_cast<double>(common) / static_cast<double>(a.size() + b.size() - common);

    double edit = 0.0;
    if (longer.size() <= constants::resolver::EDIT_MAX_LENGTH) {
        size_t distance = utils::levenshtein(query, target);
        edit = 1.0 - static_cast<double>(distance) / static_cast<double>(longer.size());
    }
    return constants::resolver::OVERLAP_WEIGHT * overlap + constants::resolver::EDIT_WEIGHT * edit;
}

double EntityResolver::score_entry(const std::u32string& query, const IndexedProduct& entry) {
    double best = score_text(query, entry.name);
    for (const auto& alias : entry.aliases) {
        best = std::max(best, constants::resolver::ALIAS_FACTOR * score_text(query, alias));
    }
    return best;
}

ResolveResult EntityResolver::resolve(const std::string& fragment) const {
    ResolveResult result;
    result.cleaned = stripper_.strip(fragment);
    const std::u32string query = utils::utf8_decode(result.cleaned);
    if (query.empty()) {
        LOG_RESOLVER("Empty fragment after stripping: '" + fragment + "'");
        return result;
    }

    std::vector<ProductCandidate> scored;
    scored.reserve(index_.size());
    for (const auto& ip : index_) {
        scored.push_back(make_candidate(*ip.product, score_entry(query, ip)));
    }

    // Stable: equal scores keep catalog order
    std::stable_sort(scored.begin(), scored.end(),
                     [](const ProductCandidate& x, const ProductCandidate& y) { return x.score > y.score; });

    for (auto& c : scored) {
        if (c.score >= config_.threshold) {
            result.candidates.push_back(std::move(c));
        } else if (c.score >= NEAR_MISS_FLOOR && result.near_misses.size() < NEAR_MISS_COUNT) {
            result.near_misses.push_back(std::move(c));
        }
    }

    if (result.candidates.empty()) {
        result.status = ResolutionStatus::NotFound;
    } else if (result.candidates.size() == 1) {
        result.status = ResolutionStatus::Resolved;
    } else {
        result.status = ResolutionStatus::Ambiguous;
    }

    std::ostringstream oss;
    oss << "'" << fragment << "' -> '" << result.cleaned << "': "
        << resolution_status_to_string(result.status) << " (" << result.candidates.size() << " candidates";
    if (!result.candidates.empty()) {
        oss << ", best " << result.candidates.front().key << "=" << result.candidates.front().score;
    }
    oss << ")";
    LOG_RESOLVER(oss.str());
    return result;
}

} // namespace resolver
} // namespace coop_assist
