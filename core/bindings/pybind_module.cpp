// PyBind11 bindings for the attrtools C++ core.
// Exposes the feature serializer, Trainer and Predictor to Python.
// JSON crosses the boundary as strings.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "prediction/predictor.hpp"
#include "registry/model_store.hpp"
#include "stix/stix_parser.hpp"
#include "training/trainer.hpp"
#include "version/database_version.hpp"

#include <nlohmann/json.hpp>

namespace py = pybind11;

PYBIND11_MODULE(attrtools_bindings, m) {
    m.doc() = "attrtools C++ Core Bindings";

    // ── Errors ──
    auto base = py::register_exception<attrtools::AttributionError>(m, "AttributionError");
    py::register_exception<attrtools::InputFormatError>(m, "InputFormatError", base.ptr());
    py::register_exception<attrtools::TrainingDataError>(m, "TrainingDataError", base.ptr());
    py::register_exception<attrtools::TrainingInternalError>(m, "TrainingInternalError", base.ptr());
    py::register_exception<attrtools::ModelUnavailableError>(m, "ModelUnavailableError", base.ptr());

    py::enum_<attrtools::VersionPart>(m, "VersionPart")
        .value("MAJOR", attrtools::VersionPart::Major)
        .value("MINOR", attrtools::VersionPart::Minor)
        .value("PATCH", attrtools::VersionPart::Patch);

    // ── DatabaseVersion ──
    py::class_<attrtools::DatabaseVersion>(m, "DatabaseVersion")
        .def(py::init<>())
        .def(py::init<uint32_t, uint32_t, uint32_t>())
        .def_static("parse", &attrtools::DatabaseVersion::parse)
        .def_readwrite("major", &attrtools::DatabaseVersion::major)
        .def_readwrite("minor", &attrtools::DatabaseVersion::minor)
        .def_readwrite("patch", &attrtools::DatabaseVersion::patch)
        .def("incremented", &attrtools::DatabaseVersion::incremented,
             py::arg("part") = attrtools::VersionPart::Patch)
        .def("__str__", &attrtools::DatabaseVersion::toString)
        .def("__eq__", &attrtools::DatabaseVersion::operator==)
        .def("__lt__", &attrtools::DatabaseVersion::operator<);

    // ── TrainedModel ── (opaque to Python)
    py::class_<attrtools::TrainedModel, std::shared_ptr<attrtools::TrainedModel>>(m, "TrainedModel")
        .def("labels", &attrtools::TrainedModel::labels);

    // ── TrainingConfig ──
    py::class_<attrtools::TrainingConfig>(m, "TrainingConfig")
        .def(py::init<>())
        .def_readwrite("samples_per_label", &attrtools::TrainingConfig::samples_per_label)
        .def_readwrite("test_size", &attrtools::TrainingConfig::test_size)
        .def_readwrite("random_seed", &attrtools::TrainingConfig::random_seed)
        .def_readwrite("nb_alpha", &attrtools::TrainingConfig::nb_alpha);

    // ── Trainer ──
    py::class_<attrtools::Trainer>(m, "Trainer")
        .def(py::init([](const std::string& intrusion_sets_json,
                         const std::string& database_version,
                         const attrtools::TrainingConfig& config) {
                 return attrtools::Trainer(
                     attrtools::parseJsonAs<attrtools::TrainingDataError>(intrusion_sets_json, "Intrusion-set corpus"),
                     database_version, config);
             }),
             py::arg("intrusion_sets_json"),
             py::arg("database_version") = attrtools::kDefaultDatabaseVersion,
             py::arg("config") = attrtools::TrainingConfig{})
        .def("retrain", [](const attrtools::Trainer& self, attrtools::VersionPart part) {
                 attrtools::TrainingResult r = self.retrain(part);
                 auto model = std::const_pointer_cast<attrtools::TrainedModel>(r.model);
                 return py::make_tuple(model, r.f1_score, r.database_version.toString());
             },
             py::arg("part") = attrtools::VersionPart::Patch);

    // ── Predictor ──
    py::class_<attrtools::Predictor>(m, "Predictor")
        .def(py::init([](std::shared_ptr<attrtools::TrainedModel> model,
                         const std::string& database_version) {
                 return attrtools::Predictor(std::move(model),
                                             attrtools::DatabaseVersion::parse(database_version));
             }),
             py::arg("model").none(true),
             py::arg("database_version") = attrtools::kDefaultDatabaseVersion)
        .def("predict", [](const attrtools::Predictor& self, const std::string& incident) {
                 return self.predict(incident).dump();
             },
             py::arg("incident"));

    m.def("incident_to_feature_string", [](const std::string& incident_json) {
        return attrtools::incidentToFeatureString(
            attrtools::parseJsonAs<attrtools::InputFormatError>(incident_json, "Incident"));
    }, py::arg("incident_json"));

    m.def("save_model", [](const std::string& directory,
                           std::shared_ptr<attrtools::TrainedModel> model,
                           const std::string& database_version) {
        if (!model) throw attrtools::ModelUnavailableError("No model to save");
        attrtools::ModelStore(directory).save(*model,
                                              attrtools::DatabaseVersion::parse(database_version));
    }, py::arg("directory"), py::arg("model").none(false), py::arg("database_version"));

    m.def("load_model", [](const std::string& directory) -> py::object {
        auto loaded = attrtools::ModelStore(directory).load();
        if (!loaded) return py::none();
        auto model = std::const_pointer_cast<attrtools::TrainedModel>(loaded->model);
        return py::make_tuple(model, loaded->database_version.toString());
    }, py::arg("directory"));

    m.def("configure_logging", &attrtools::configureLogging, py::arg("level") = "info");
}
