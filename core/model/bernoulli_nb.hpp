#pragma once

#include "model/classifier.hpp"

#include <string>
#include <vector>

namespace attrtools {

// ─── Bernoulli Naive Bayes ─────────────────────────────────────
// P(x_f = 1 | c) = (N_cf + alpha) / (N_c + 2 alpha), class priors from
// label frequencies. Absent features contribute log(1 - p), so the
// joint log-likelihood of a row is
//   log P(c) + sum_f log(1 - p_cf) + sum_{f in row} [log p_cf - log(1 - p_cf)]
// and only the active columns need to be visited.

class BernoulliNaiveBayes : public ProbabilisticClassifier {
public:
    explicit BernoulliNaiveBayes(double alpha = 1.0);

    void fit(const std::vector<SparseFeatures>& rows,
             const std::vector<std::string>& labels,
             size_t n_features) override;

    std::vector<double> predictProba(const SparseFeatures& row) const override;

    const std::vector<std::string>& classes() const override { return classes_; }
    bool fitted() const override { return !classes_.empty(); }
    std::string name() const override { return "bernoulli_nb"; }

    nlohmann::json toJson() const override;
    static std::unique_ptr<BernoulliNaiveBayes> fromJson(const nlohmann::json& j);

    /// Unnormalized joint log-likelihood per class.
    std::vector<double> jointLogLikelihood(const SparseFeatures& row) const;

    double alpha() const { return alpha_; }
    size_t featureCount() const { return n_features_; }

private:
    double alpha_;
    size_t n_features_ = 0;
    std::vector<std::string> classes_;
    std::vector<double> class_count_;
    std::vector<std::vector<double>> feature_count_;   // [class][feature]

    // Derived from the counts by computeLogProbabilities()
    std::vector<double> class_log_prior_;
    std::vector<double> neg_log_sum_;                   // sum_f log(1 - p_cf)
    std::vector<std::vector<double>> log_odds_;        // log p_cf - log(1 - p_cf)

    void computeLogProbabilities();
};

} // namespace attrtools
