#pragma once

#include "common/errors.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace attrtools {

/// Top-ranked labels and their probabilities, best first.
struct LabelScores {
    std::vector<std::string> labels;
    std::vector<double> probas;
};

// ─── PredictionResult ──────────────────────────────────────────
// Either ranked labels or an error kind, always paired with the
// database version the Predictor was constructed with. toJson()
// keeps the wire shape:
//   {"label": {"labels": [...], "probas": [...]}, "db_version": "(a, b, c)"}
//   {"label": -1 | -2 | -3, "db_version": "(a, b, c)"}

class PredictionResult {
public:
    PredictionResult(LabelScores scores, std::string db_version)
        : value_(std::move(scores)), db_version_(std::move(db_version)) {}
    PredictionResult(PredictionError error, std::string db_version)
        : value_(error), db_version_(std::move(db_version)) {}

    bool ok() const { return std::holds_alternative<LabelScores>(value_); }

    /// Precondition: ok().
    const LabelScores& scores() const { return std::get<LabelScores>(value_); }

    /// Precondition: !ok().
    PredictionError error() const { return std::get<PredictionError>(value_); }

    const std::string& dbVersion() const { return db_version_; }

    nlohmann::json toJson() const;

private:
    std::variant<LabelScores, PredictionError> value_;
    std::string db_version_;
};

} // namespace attrtools
