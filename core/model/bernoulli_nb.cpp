#include "model/bernoulli_nb.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace attrtools {

BernoulliNaiveBayes::BernoulliNaiveBayes(double alpha) : alpha_(alpha) {
    if (!(alpha_ > 0.0)) {
        throw std::invalid_argument("Smoothing alpha must be positive");
    }
}

void BernoulliNaiveBayes::fit(const std::vector<SparseFeatures>& rows,
                              const std::vector<std::string>& labels,
                              size_t n_features) {
    if (rows.empty()) {
        throw std::invalid_argument("Cannot fit on an empty dataset");
    }
    if (rows.size() != labels.size()) {
        throw std::invalid_argument("Row count " + std::to_string(rows.size()) +
                                    " does not match label count " +
                                    std::to_string(labels.size()));
    }

    std::map<std::string, size_t> class_index;
    for (const auto& l : labels) class_index[l] = 0;

    classes_.clear();
    for (auto& [label, idx] : class_index) {
        idx = classes_.size();
        classes_.push_back(label);
    }

    n_features_ = n_features;
    class_count_.assign(classes_.size(), 0.0);
    feature_count_.assign(classes_.size(), std::vector<double>(n_features_, 0.0));

    for (size_t i = 0; i < rows.size(); i++) {
        size_t c = class_index[labels[i]];
        class_count_[c] += 1.0;
        for (uint32_t f : rows[i]) {
            if (f >= n_features_) {
                throw std::invalid_argument("Feature index " + std::to_string(f) +
                                            " out of range");
            }
            feature_count_[c][f] += 1.0;
        }
    }

    computeLogProbabilities();
}

void BernoulliNaiveBayes::computeLogProbabilities() {
    size_t n_classes = classes_.size();
    double total = 0.0;
    for (double n : class_count_) total += n;

    class_log_prior_.assign(n_classes, 0.0);
    neg_log_sum_.assign(n_classes, 0.0);
    log_odds_.assign(n_classes, std::vector<double>(n_features_, 0.0));

    for (size_t c = 0; c < n_classes; c++) {
        class_log_prior_[c] = std::log(class_count_[c] / total);
        double denom = class_count_[c] + 2.0 * alpha_;
        for (size_t f = 0; f < n_features_; f++) {
            double p = (feature_count_[c][f] + alpha_) / denom;
            double log_p = std::log(p);
            double log_not_p = std::log1p(-p);
            neg_log_sum_[c] += log_not_p;
            log_odds_[c][f] = log_p - log_not_p;
        }
    }
}

std::vector<double> BernoulliNaiveBayes::jointLogLikelihood(const SparseFeatures& row) const {
    if (!fitted()) {
        throw std::logic_error("BernoulliNaiveBayes is not fitted");
    }
    std::vector<double> jll(classes_.size());
    for (size_t c = 0; c < classes_.size(); c++) {
        double s = class_log_prior_[c] + neg_log_sum_[c];
        for (uint32_t f : row) {
            if (f >= n_features_) {
                throw std::out_of_range("Feature index " + std::to_string(f) +
                                        " out of range");
            }
            s += log_odds_[c][f];
        }
        jll[c] = s;
    }
    return jll;
}

std::vector<double> BernoulliNaiveBayes::predictProba(const SparseFeatures& row) const {
    std::vector<double> jll = jointLogLikelihood(row);

    // Normalize in log space: p_c = exp(jll_c - logsumexp(jll))
    double max_jll = *std::max_element(jll.begin(), jll.end());
    double sum = 0.0;
    for (double v : jll) sum += std::exp(v - max_jll);
    double log_norm = max_jll + std::log(sum);

    for (double& v : jll) {
        v = std::exp(v - log_norm);
        v = std::min(1.0, std::max(0.0, v));
    }
    return jll;
}

nlohmann::json BernoulliNaiveBayes::toJson() const {
    return {
        {"type", name()},
        {"alpha", alpha_},
        {"n_features", n_features_},
        {"classes", classes_},
        {"class_count", class_count_},
        {"feature_count", feature_count_},
    };
}

std::unique_ptr<BernoulliNaiveBayes> BernoulliNaiveBayes::fromJson(const nlohmann::json& j) {
    auto nb = std::make_unique<BernoulliNaiveBayes>(j.at("alpha").get<double>());
    nb->n_features_ = j.at("n_features").get<size_t>();
    nb->classes_ = j.at("classes").get<std::vector<std::string>>();
    nb->class_count_ = j.at("class_count").get<std::vector<double>>();
    nb->feature_count_ = j.at("feature_count").get<std::vector<std::vector<double>>>();

    size_t n_classes = nb->classes_.size();
    bool consistent = nb->class_count_.size() == n_classes &&
                      nb->feature_count_.size() == n_classes;
    for (const auto& counts : nb->feature_count_) {
        consistent = consistent && counts.size() == nb->n_features_;
    }
    if (!consistent) {
        throw InputFormatError("Inconsistent Naive Bayes state");
    }
    if (n_classes > 0) nb->computeLogProbabilities();
    return nb;
}

} // namespace attrtools
