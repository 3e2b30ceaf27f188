#pragma once

#include "generator/incident_generator.hpp"
#include "model/trained_model.hpp"
#include "stix/stix_parser.hpp"
#include "training/metrics.hpp"
#include "version/database_version.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace attrtools {

/// Retraining parameters.
struct TrainingConfig {
    int samples_per_label = 100;         // generated incidents per intrusion set
    double test_size = 0.2;              // validation fraction
    uint32_t random_seed = 27;           // split and generator seed
    double nb_alpha = 1.0;               // Naive Bayes smoothing
    Averaging averaging = Averaging::Weighted;
    GeneratorConfig generator;
};

/// Labeled feature strings, one row per generated incident.
struct IncidentDataset {
    std::vector<std::string> incidents;
    std::vector<std::string> labels;

    size_t size() const { return incidents.size(); }
};

/// Output of a successful retrain().
struct TrainingResult {
    std::shared_ptr<const TrainedModel> model;
    double f1_score = 0.0;
    DatabaseVersion database_version;
};

// ─── Trainer ───────────────────────────────────────────────────
// Fits a vectorizer + Bernoulli Naive Bayes pipeline on incidents
// generated from an intrusion-set corpus, scores it on a stratified
// validation partition and binds the result to the next version.
//
// The corpus is validated at construction (TrainingDataError). Any
// failure while splitting, fitting or scoring surfaces as
// TrainingInternalError; no partial model is ever returned.

class Trainer {
public:
    Trainer(nlohmann::json intrusion_sets,
            const std::string& database_version = kDefaultDatabaseVersion,
            TrainingConfig config = {});

    /// Generate data, fit, evaluate. The returned version is the current
    /// one with `part` incremented.
    TrainingResult retrain(VersionPart part = VersionPart::Patch) const;

    /// Generated incidents for every intrusion set, in corpus order.
    IncidentDataset createIncidentData() const;

    const DatabaseVersion& databaseVersion() const { return database_version_; }
    const LabeledIntrusionSets& intrusionSets() const { return intrusion_sets_; }
    const TrainingConfig& config() const { return config_; }

private:
    LabeledIntrusionSets intrusion_sets_;
    DatabaseVersion database_version_;
    TrainingConfig config_;

    static LabeledIntrusionSets validateCorpus(const nlohmann::json& corpus);
};

/// Fit the vectorizer and classifier on labeled feature strings.
TrainedModel fitPipeline(const std::vector<std::string>& incidents,
                         const std::vector<std::string>& labels,
                         double nb_alpha = 1.0);

} // namespace attrtools
