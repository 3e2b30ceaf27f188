#pragma once

#include "model/count_vectorizer.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace attrtools {

// ─── Probabilistic Classifier ──────────────────────────────────
// Abstract base class for classifiers over binary token features.
// Any implementation must produce per-label probabilities in [0, 1]
// aligned with classes().

class ProbabilisticClassifier {
public:
    virtual ~ProbabilisticClassifier() = default;

    /// Fit on rows of `n_features` columns. Throws std::invalid_argument
    /// on inconsistent input.
    virtual void fit(const std::vector<SparseFeatures>& rows,
                     const std::vector<std::string>& labels,
                     size_t n_features) = 0;

    /// Probability of every class for one row, ordered as classes().
    virtual std::vector<double> predictProba(const SparseFeatures& row) const = 0;

    /// Most probable class. Ties resolve to the lexically smallest label.
    virtual std::string predict(const SparseFeatures& row) const;

    /// Sorted label space seen during fit().
    virtual const std::vector<std::string>& classes() const = 0;

    virtual bool fitted() const = 0;

    /// Type tag used in serialized state.
    virtual std::string name() const = 0;

    /// Fitted state, including a "type" member equal to name().
    virtual nlohmann::json toJson() const = 0;
};

/// Rebuild a classifier from toJson() output. Throws InputFormatError
/// for an unknown "type".
std::unique_ptr<ProbabilisticClassifier> classifierFromJson(const nlohmann::json& j);

} // namespace attrtools
