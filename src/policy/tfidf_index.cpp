#include "policy/tfidf_index.h"
#include "utils.h"
#include <algorithm>
#include <cmath>

namespace coop_assist {
namespace policy {

namespace {

void l2_normalize(TfidfIndex::SparseVector& v) {
    double norm = 0.0;
    for (const auto& kv : v) {
        norm += kv.second * kv.second;
    }
    if (norm <= 0.0) {
        return;
    }
    norm = std::sqrt(norm);
    for (auto& kv : v) {
        kv.second /= norm;
    }
}

std::unordered_map<std::string, double> term_counts(const std::string& text) {
    std::unordered_map<std::string, double> tf;
    for (const auto& gram : utils::char_ngrams(text)) {
        tf[gram] += 1.0;
    }
    return tf;
}

} // namespace

TfidfIndex::TfidfIndex(const std::vector<std::string>& documents) {
    std::vector<std::unordered_map<std::string, double>> counts;
    counts.reserve(documents.size());
    std::unordered_map<std::string, size_t> df;
    for (const auto& doc : documents) {
        counts.push_back(term_counts(doc));
        for (const auto& kv : counts.back()) {
            df[kv.first]++;
        }
    }

    const double n = static_cast<double>(documents.size());
    for (const auto& kv : df) {
        idf_[kv.first] = std::log((1.0 + n) / (1.0 + static_cast<double>(kv.second))) + 1.0;
    }

    vectors_.reserve(counts.size());
    for (auto& tf : counts) {
        SparseVector v;
        for (const auto& kv : tf) {
            v[kv.first] = kv.second * idf_[kv.first];
        }
        l2_normalize(v);
        vectors_.push_back(std::move(v));
    }
}

TfidfIndex::SparseVector TfidfIndex::vectorize(const std::string& text) const {
    SparseVector v;
    for (const auto& kv : term_counts(text)) {
        auto it = idf_.find(kv.first);
        if (it != idf_.end()) {
            v[kv.first] = kv.second * it->second;
        }
    }
    l2_normalize(v);
    return v;
}

std::vector<std::pair<size_t, double>> TfidfIndex::query(const std::string& text, double min_score) const {
    std::vector<std::pair<size_t, double>> hits;
    SparseVector q = vectorize(text);
    if (q.empty()) {
        return hits;
    }

    for (size_t i = 0; i < vectors_.size(); ++i) {
        const SparseVector& doc = vectors_[i];
        double dot = 0.0;
        bool shares_bigram = false;
        for (const auto& kv : q) {
            auto it = doc.find(kv.first);
            if (it != doc.end()) {
                dot += kv.second * it->second;
                shares_bigram = shares_bigram || utils::utf8_length(kv.first) > 1;
            }
        }
        // Common single characters alone never make a match
        if (shares_bigram && dot > min_score) {
            hits.emplace_back(i, dot);
        }
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const std::pair<size_t, double>& a, const std::pair<size_t, double>& b) {
                         return a.second > b.second;
                     });
    return hits;
}

} // namespace policy
} // namespace coop_assist
