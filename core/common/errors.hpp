#pragma once

#include <stdexcept>
#include <string>

namespace attrtools {

// ─── Error Taxonomy ────────────────────────────────────────────
// Prediction-side errors are converted into negative result codes
// by the Predictor. Training-side errors propagate to the caller.

class AttributionError : public std::runtime_error {
public:
    explicit AttributionError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Incident (or version string, or config value) has the wrong structure.
class InputFormatError : public AttributionError {
public:
    using AttributionError::AttributionError;
};

class ModelUnavailableError : public AttributionError {
public:
    using AttributionError::AttributionError;
};

class InternalPredictionError : public AttributionError {
public:
    using AttributionError::AttributionError;
};

/// Empty or malformed intrusion-set corpus.
class TrainingDataError : public AttributionError {
public:
    using AttributionError::AttributionError;
};

/// Split, fit or evaluation failed. No model is returned.
class TrainingInternalError : public AttributionError {
public:
    using AttributionError::AttributionError;
};

/// Wire-level codes carried in the "label" field of a failed prediction.
enum class PredictionError : int {
    InputFormat      = -1,
    ModelUnavailable = -2,
    Internal         = -3,
};

inline int resultCode(PredictionError e) { return static_cast<int>(e); }

inline std::string toString(PredictionError e) {
    switch (e) {
        case PredictionError::InputFormat:      return "input_format";
        case PredictionError::ModelUnavailable: return "model_unavailable";
        case PredictionError::Internal:         return "internal";
    }
    return "unknown";
}

} // namespace attrtools
