#pragma once

#include "model/trained_model.hpp"
#include "version/database_version.hpp"

#include <memory>
#include <optional>
#include <string>

namespace attrtools {

inline constexpr const char* kModelFileName = "model.json";
inline constexpr const char* kMetaDataFileName = "meta_data.json";

/// A model artifact and the version it was saved with.
struct LoadedModel {
    std::shared_ptr<const TrainedModel> model;
    DatabaseVersion database_version;
    std::string time_metadata_created;   // empty when metadata was missing
};

// ─── Model Store ───────────────────────────────────────────────
// Directory-backed loader/saver for a model and its metadata:
//   <directory>/model.json      TrainedModel::toJson()
//   <directory>/meta_data.json  {"db_version": "(a, b, c)",
//                                "time_metadata_created": "..."}
// Callers load once and hand the result to a Predictor.

class ModelStore {
public:
    explicit ModelStore(std::string directory,
                        std::string model_file = kModelFileName,
                        std::string meta_file = kMetaDataFileName);

    /// Write both files, creating the directory if needed.
    /// Throws std::runtime_error on I/O failure.
    void save(const TrainedModel& model, const DatabaseVersion& version) const;

    /// std::nullopt if the model file is missing or unreadable. Broken
    /// metadata falls back to the default version. Failures are logged.
    std::optional<LoadedModel> load() const;

    std::string modelPath() const;
    std::string metaDataPath() const;

private:
    std::string directory_;
    std::string model_file_;
    std::string meta_file_;
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utcTimestamp();

} // namespace attrtools
