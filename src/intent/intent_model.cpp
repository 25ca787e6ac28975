#include "intent/intent_model.h"
#include "logger.h"
#include "utils.h"
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace coop_assist {
namespace intent {

NaiveBayesIntentModel::NaiveBayesIntentModel(const json& artifact, double min_feature_coverage)
    : min_feature_coverage_(min_feature_coverage) {
    if (!artifact.is_object() || !artifact.contains("classes") || !artifact["classes"].is_object()) {
        throw std::runtime_error("Model artifact has no 'classes' object");
    }
    version_ = artifact.value("version", "unversioned");
    double alpha = artifact.value("alpha", 1.0);
    if (alpha <= 0.0) {
        throw std::runtime_error("Model alpha must be positive");
    }

    // First pass: vocabulary and totals
    struct RawClass {
        Intent intent;
        double doc_count;
        double total_count = 0.0;
        const json* counts;
    };
    std::vector<RawClass> raw;
    double total_docs = 0.0;

    for (auto it = artifact["classes"].begin(); it != artifact["classes"].end(); ++it) {
        auto intent = intent_from_string(it.key());
        if (!intent) {
            throw std::runtime_error("Model class with unsupported label '" + it.key() + "'");
        }
        const json& cls = it.value();
        if (!cls.contains("feature_counts") || !cls["feature_counts"].is_object()) {
            throw std::runtime_error("Model class '" + it.key() + "' has no feature_counts");
        }
        RawClass rc{*intent, cls.value("doc_count", 1.0), 0.0, &cls["feature_counts"]};
        if (rc.doc_count <= 0.0) {
            throw std::runtime_error("Model class '" + it.key() + "' has a non-positive doc_count");
        }
        for (auto f = cls["feature_counts"].begin(); f != cls["feature_counts"].end(); ++f) {
            double n = f.value().get<double>();
            if (n < 0.0) {
                throw std::runtime_error("Negative count for feature '" + f.key() + "'");
            }
            rc.total_count += n;
            vocabulary_.insert(f.key());
        }
        total_docs += rc.doc_count;
        raw.push_back(rc);
    }

    if (raw.empty()) {
        throw std::runtime_error("Model artifact has no classes");
    }
    vocabulary_size_ = vocabulary_.size();

    // Second pass: smoothed log parameters
    const double v = static_cast<double>(vocabulary_size_);
    for (const auto& rc : raw) {
        ClassModel cm;
        cm.intent = rc.intent;
        cm.log_prior = std::log(rc.doc_count / total_docs);
        const double denom = rc.total_count + alpha * v;
        cm.log_unseen = std::log(alpha / denom);
        for (auto f = rc.counts->begin(); f != rc.counts->end(); ++f) {
            cm.log_likelihood[f.key()] = std::log((f.value().get<double>() + alpha) / denom);
        }
        classes_.push_back(std::move(cm));
    }
}

Result<std::shared_ptr<IntentModel>> NaiveBayesIntentModel::load(const std::string& path,
                                                                double min_feature_coverage) {
    if (path.empty()) {
        return make_unavailable_error("No model artifact configured");
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open model artifact: " + path);
    }

    json artifact;
    try {
        file >> artifact;
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse model artifact " + path + ": " + e.what());
    }

    try {
        auto model = std::make_shared<NaiveBayesIntentModel>(artifact, min_feature_coverage);
        Logger::info("[Intent] Loaded model " + model->version() + " (" +
                     std::to_string(model->vocabulary_size()) + " features) from " + path);
        return std::shared_ptr<IntentModel>(model);
    } catch (const std::exception& e) {
        return make_invalid_data_error("Invalid model artifact " + path + ": " + e.what());
    }
}

std::optional<IntentPrediction> NaiveBayesIntentModel::predict(const std::string& normalized_text) const {
    std::vector<std::string> grams = utils::char_ngrams(normalized_text);
    if (grams.empty()) {
        return std::nullopt;
    }

    std::vector<const std::string*> known;
    for (const auto& g : grams) {
        if (vocabulary_.count(g)) {
            known.push_back(&g);
        }
    }
    double coverage = static_cast<double>(known.size()) / static_cast<double>(grams.size());
    if (known.empty() || coverage < min_feature_coverage_) {
        return std::nullopt;
    }

    std::vector<double> scores;
    scores.reserve(classes_.size());
    for (const auto& cm : classes_) {
        double score = cm.log_prior;
        for (const std::string* g : known) {
            auto it = cm.log_likelihood.find(*g);
            score += (it != cm.log_likelihood.end()) ? it->second : cm.log_unseen;
        }
        scores.push_back(score);
    }

    // Softmax over log scores
    size_t best = 0;
    for (size_t i = 1; i < scores.size(); ++i) {
        if (scores[i] > scores[best]) best = i;
    }
    double norm = 0.0;
    for (double s : scores) {
        norm += std::exp(s - scores[best]);
    }

    IntentPrediction prediction;
    prediction.intent = classes_[best].intent;
    prediction.probability = 1.0 / norm;
    return prediction;
}

} // namespace intent
} // namespace coop_assist
