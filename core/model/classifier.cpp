#include "model/classifier.hpp"
#include "model/bernoulli_nb.hpp"
#include "common/errors.hpp"

namespace attrtools {

std::string ProbabilisticClassifier::predict(const SparseFeatures& row) const {
    auto proba = predictProba(row);
    const auto& labels = classes();
    if (proba.empty() || proba.size() != labels.size()) {
        throw std::logic_error("Classifier returned no probabilities");
    }
    size_t best = 0;
    for (size_t i = 1; i < proba.size(); i++) {
        if (proba[i] > proba[best]) best = i;
    }
    return labels[best];
}

std::unique_ptr<ProbabilisticClassifier> classifierFromJson(const nlohmann::json& j) {
    std::string type = j.at("type").get<std::string>();
    if (type == "bernoulli_nb") return BernoulliNaiveBayes::fromJson(j);
    throw InputFormatError("Unknown classifier type: " + type);
}

} // namespace attrtools
