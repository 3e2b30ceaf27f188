#include "registry/model_store.hpp"
#include "common/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace attrtools {

namespace fs = std::filesystem;

std::string utcTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

ModelStore::ModelStore(std::string directory, std::string model_file, std::string meta_file)
    : directory_(std::move(directory)),
      model_file_(std::move(model_file)),
      meta_file_(std::move(meta_file)) {}

std::string ModelStore::modelPath() const {
    return (fs::path(directory_) / model_file_).string();
}

std::string ModelStore::metaDataPath() const {
    return (fs::path(directory_) / meta_file_).string();
}

void ModelStore::save(const TrainedModel& model, const DatabaseVersion& version) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create model directory " + directory_ + ": " + ec.message());
    }

    std::ofstream model_out(modelPath());
    if (!model_out) {
        throw std::runtime_error("Cannot open " + modelPath() + " for writing");
    }
    model_out << model.toJson().dump();
    if (!model_out) {
        throw std::runtime_error("Failed writing " + modelPath());
    }

    nlohmann::json meta = {
        {"db_version", version.toString()},
        {"time_metadata_created", utcTimestamp()},
    };
    std::ofstream meta_out(metaDataPath());
    if (!meta_out) {
        throw std::runtime_error("Cannot open " + metaDataPath() + " for writing");
    }
    meta_out << meta.dump(4);
    if (!meta_out) {
        throw std::runtime_error("Failed writing " + metaDataPath());
    }

    spdlog::info("Model {} saved to {}", version.toString(), directory_);
}

std::optional<LoadedModel> ModelStore::load() const {
    LoadedModel loaded;

    try {
        std::ifstream meta_in(metaDataPath());
        if (!meta_in) {
            throw std::runtime_error("cannot open " + metaDataPath());
        }
        nlohmann::json meta = nlohmann::json::parse(meta_in);
        loaded.database_version = DatabaseVersion::parse(meta.at("db_version").get<std::string>());
        loaded.time_metadata_created = meta.value("time_metadata_created", "");
        spdlog::info("The model version is {}, the meta data creation time is {}",
                     loaded.database_version.toString(), loaded.time_metadata_created);
    } catch (const std::exception& e) {
        spdlog::warn("The meta data file can not be loaded, using version {}: {}",
                     kDefaultDatabaseVersion, e.what());
        loaded.database_version = DatabaseVersion{};
        loaded.time_metadata_created.clear();
    }

    try {
        std::ifstream model_in(modelPath());
        if (!model_in) {
            throw std::runtime_error("cannot open " + modelPath());
        }
        nlohmann::json j = nlohmann::json::parse(model_in);
        loaded.model = std::make_shared<const TrainedModel>(TrainedModel::fromJson(j));
        spdlog::info("The model was loaded from {}", modelPath());
    } catch (const std::exception& e) {
        spdlog::warn("The model file can not be loaded: {}", e.what());
        return std::nullopt;
    }

    return loaded;
}

} // namespace attrtools
