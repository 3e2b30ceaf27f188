#pragma once

#include "model/classifier.hpp"
#include "model/count_vectorizer.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace attrtools {

// ─── TrainedModel ──────────────────────────────────────────────
// A fitted vectorizer + classifier pair. The label space is the
// classifier's classes(). Immutable after construction and safe to
// share between concurrent readers. It does not carry its own
// DatabaseVersion; the caller keeps the two together.

class TrainedModel {
public:
    /// Throws std::invalid_argument if `classifier` is null.
    TrainedModel(CountVectorizer vectorizer,
                 std::unique_ptr<ProbabilisticClassifier> classifier);

    TrainedModel(TrainedModel&&) = default;
    TrainedModel& operator=(TrainedModel&&) = default;

    /// Per-label probabilities for a feature string, ordered as labels().
    std::vector<double> scores(const std::string& feature_string) const;

    /// Most probable label for a feature string.
    std::string predictLabel(const std::string& feature_string) const;

    const std::vector<std::string>& labels() const { return classifier_->classes(); }

    const CountVectorizer& vectorizer() const { return vectorizer_; }
    const ProbabilisticClassifier& classifier() const { return *classifier_; }

    nlohmann::json toJson() const;
    static TrainedModel fromJson(const nlohmann::json& j);

private:
    CountVectorizer vectorizer_;
    std::unique_ptr<ProbabilisticClassifier> classifier_;
};

} // namespace attrtools
