#include "prediction/predictor.hpp"
#include "common/errors.hpp"
#include "stix/stix_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <numeric>
#include <stdexcept>

namespace attrtools {

namespace {

/// Collapse whitespace runs to single spaces and trim both ends.
std::string normalizeWhitespace(const std::string& s) {
    std::string out;
    bool pending_space = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += static_cast<char>(c);
    }
    return out;
}

std::string describe(const nlohmann::json& incident) {
    return incident.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

LabelScores rankLabels(const std::vector<std::string>& labels,
                       const std::vector<double>& probas, size_t top_n) {
    if (labels.size() != probas.size()) {
        throw std::logic_error("Model returned " + std::to_string(probas.size()) +
                               " probabilities for " + std::to_string(labels.size()) +
                               " labels");
    }

    std::vector<size_t> order(labels.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (probas[a] != probas[b]) return probas[a] > probas[b];
        return labels[a] < labels[b];
    });

    LabelScores out;
    size_t n = std::min(top_n, order.size());
    for (size_t i = 0; i < n; i++) {
        out.labels.push_back(labels[order[i]]);
        out.probas.push_back(probas[order[i]]);
    }
    return out;
}

Predictor::Predictor(std::shared_ptr<const TrainedModel> model,
                     DatabaseVersion database_version,
                     size_t top_n)
    : model_(std::move(model)),
      database_version_(database_version),
      db_version_str_(database_version.toString()),
      top_n_(top_n) {}

PredictionResult Predictor::fail(PredictionError error, const std::string& incident,
                                 const std::string& reason) const {
    spdlog::warn("The score can not be predicted for {:.200}: {} ({})",
                 incident, reason, toString(error));
    return PredictionResult(error, db_version_str_);
}

PredictionResult Predictor::score(const std::string& feature_string) const {
    try {
        auto probas = model_->scores(feature_string);
        return PredictionResult(rankLabels(model_->labels(), probas, top_n_), db_version_str_);
    } catch (const std::exception& e) {
        spdlog::error("Scoring failed: {}", e.what());
        return fail(PredictionError::Internal, feature_string, e.what());
    }
}

PredictionResult Predictor::predictIncident(const nlohmann::json& incident) const {
    if (!model_) {
        return PredictionResult(PredictionError::ModelUnavailable, db_version_str_);
    }

    std::string features;
    try {
        features = incidentToFeatureString(incident);
    } catch (const InputFormatError& e) {
        return fail(PredictionError::InputFormat, describe(incident), e.what());
    } catch (const std::exception& e) {
        return fail(PredictionError::Internal, describe(incident), e.what());
    }

    if (features.empty()) {
        return fail(PredictionError::InputFormat, describe(incident), "no recognized STIX objects");
    }
    return score(features);
}

PredictionResult Predictor::predictResult(const std::string& incident) const {
    if (!model_) {
        return PredictionResult(PredictionError::ModelUnavailable, db_version_str_);
    }

    auto first = std::find_if(incident.begin(), incident.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    if (first == incident.end()) {
        return fail(PredictionError::InputFormat, incident, "empty incident");
    }

    // Any JSON document is an incident; predictIncident rejects the
    // ones that are not objects.
    nlohmann::json parsed = nlohmann::json::parse(incident, nullptr, false);
    if (!parsed.is_discarded()) {
        return predictIncident(parsed);
    }
    if (*first == '{' || *first == '[') {
        return fail(PredictionError::InputFormat, incident, "incident is not valid JSON");
    }

    return score(normalizeWhitespace(incident));
}

nlohmann::json Predictor::predict(const std::string& incident) const {
    return predictResult(incident).toJson();
}

} // namespace attrtools
