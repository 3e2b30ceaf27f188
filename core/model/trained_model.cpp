#include "model/trained_model.hpp"

#include <stdexcept>

namespace attrtools {

TrainedModel::TrainedModel(CountVectorizer vectorizer,
                           std::unique_ptr<ProbabilisticClassifier> classifier)
    : vectorizer_(std::move(vectorizer)), classifier_(std::move(classifier)) {
    if (!classifier_) {
        throw std::invalid_argument("TrainedModel requires a classifier");
    }
}

std::vector<double> TrainedModel::scores(const std::string& feature_string) const {
    return classifier_->predictProba(vectorizer_.transform(feature_string));
}

std::string TrainedModel::predictLabel(const std::string& feature_string) const {
    return classifier_->predict(vectorizer_.transform(feature_string));
}

nlohmann::json TrainedModel::toJson() const {
    return {
        {"vectorizer", vectorizer_.toJson()},
        {"classifier", classifier_->toJson()},
    };
}

TrainedModel TrainedModel::fromJson(const nlohmann::json& j) {
    return TrainedModel(CountVectorizer::fromJson(j.at("vectorizer")),
                        classifierFromJson(j.at("classifier")));
}

} // namespace attrtools
