#pragma once

#include "model/trained_model.hpp"
#include "prediction/prediction_result.hpp"
#include "version/database_version.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace attrtools {

inline constexpr size_t kDefaultTopN = 3;

// ─── Predictor ─────────────────────────────────────────────────
// Scores incidents against a trained model and returns the top
// labels. Never throws from the predict* calls: failures become
// PredictionError values, checked in this order:
//   no model                                  -> ModelUnavailable (-2)
//   empty / unparsable / non-object incident  -> InputFormat (-1)
//   anything else while scoring               -> Internal (-3)
//
// The version is echoed back as given; it is not checked against the
// model's provenance.

class Predictor {
public:
    Predictor(std::shared_ptr<const TrainedModel> model,
              DatabaseVersion database_version = {},
              size_t top_n = kDefaultTopN);

    /// `incident` is either a JSON document or an already serialized
    /// feature string. Input that parses as JSON, or starts like a JSON
    /// object or array, is treated as a document; only objects are valid.
    PredictionResult predictResult(const std::string& incident) const;

    /// Structured incident.
    PredictionResult predictIncident(const nlohmann::json& incident) const;

    /// predictResult() in wire form.
    nlohmann::json predict(const std::string& incident) const;

    bool hasModel() const { return model_ != nullptr; }
    const DatabaseVersion& databaseVersion() const { return database_version_; }
    size_t topN() const { return top_n_; }

private:
    std::shared_ptr<const TrainedModel> model_;
    DatabaseVersion database_version_;
    std::string db_version_str_;
    size_t top_n_;

    PredictionResult fail(PredictionError error, const std::string& incident,
                          const std::string& reason) const;

    /// Score a feature string. Only the error paths of the model can throw.
    PredictionResult score(const std::string& feature_string) const;
};

/// Rank labels by descending probability, ties by label, and keep the
/// first `top_n`.
LabelScores rankLabels(const std::vector<std::string>& labels,
                       const std::vector<double>& probas, size_t top_n);

} // namespace attrtools
