#pragma once

#include "prediction/predictor.hpp"
#include "training/trainer.hpp"

#include <string>

namespace attrtools {

// ─── AttributionConfig ─────────────────────────────────────────
// Everything tunable, loaded from YAML:
//
//   logging:
//     level: info
//   training:
//     samples_per_label: 100
//     test_size: 0.2
//     random_seed: 27
//     nb_alpha: 1.0
//     averaging: weighted        # or macro
//     version_part: patch        # major | minor | patch
//   generator:
//     size_min: 10
//     size_max: 50
//   prediction:
//     top_n: 3
//
// Missing keys keep their defaults.

struct AttributionConfig {
    std::string log_level = "info";
    TrainingConfig training;
    VersionPart version_part = VersionPart::Patch;
    size_t top_n = kDefaultTopN;
};

/// Parse YAML text. Throws InputFormatError on malformed YAML or
/// out-of-range values.
AttributionConfig parseConfig(const std::string& yaml_text);

/// Load a YAML file. Throws InputFormatError if it cannot be read.
AttributionConfig loadConfig(const std::string& path);

} // namespace attrtools
