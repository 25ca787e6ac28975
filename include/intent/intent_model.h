#pragma once

/**
 * @file intent_model.h
 * @brief Statistical intent model (pre-trained artifact, loaded read-only)
 */

#include "core/types.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace coop_assist {
namespace intent {

/**
 * @brief Best label and its probability
 */
struct IntentPrediction {
    Intent intent = Intent::Unknown;
    double probability = 0.0;
};

/**
 * @brief Interface for the statistical tier
 *
 * Implementations are immutable after construction and safe for concurrent
 * predict() calls.
 */
class IntentModel {
public:
    virtual ~IntentModel() = default;

    /**
     * @brief Score all intents for a normalized utterance
     * @return Highest-probability intent, or nullopt when the model abstains
     */
    virtual std::optional<IntentPrediction> predict(const std::string& normalized_text) const = 0;

    /// Artifact version string (for logs)
    virtual std::string version() const = 0;
};

/**
 * @brief Multinomial naive Bayes over character unigrams and bigrams
 *
 * Artifact layout:
 * @code
 * { "version": "...", "alpha": 0.1,
 *   "classes": { "<intent label>": { "doc_count": N,
 *                                     "feature_counts": { "<gram>": n, ... } } } }
 * @endcode
 */
class NaiveBayesIntentModel : public IntentModel {
public:
    /**
     * @brief Build from a parsed artifact
     * @param min_feature_coverage Abstain when fewer than this fraction of the
     *        query's n-grams are in the vocabulary
     * @throws std::runtime_error on a structurally invalid artifact
     */
    NaiveBayesIntentModel(const nlohmann::json& artifact, double min_feature_coverage);

    /**
     * @brief Load an artifact file
     * @return Model, or an error the caller logs before continuing rule-only
     */
    static Result<std::shared_ptr<IntentModel>> load(const std::string& path,
                                                     double min_feature_coverage);

    std::optional<IntentPrediction> predict(const std::string& normalized_text) const override;
    std::string version() const override { return version_; }

    size_t vocabulary_size() const { return vocabulary_size_; }

private:
    struct ClassModel {
        Intent intent;
        double log_prior = 0.0;
        double log_unseen = 0.0;  ///< Smoothed likelihood of a vocabulary gram absent from this class
        std::unordered_map<std::string, double> log_likelihood;
    };

    std::string version_;
    double min_feature_coverage_;
    size_t vocabulary_size_ = 0;
    std::unordered_set<std::string> vocabulary_;
    std::vector<ClassModel> classes_;
};

} // namespace intent
} // namespace coop_assist
