#include "config/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <yaml-cpp/yaml.h>

namespace attrtools {

namespace {

template <typename T>
void readScalar(const YAML::Node& section, const char* key, T& out) {
    if (!section || !section[key]) return;
    try {
        out = section[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw InputFormatError(std::string("Config key '") + key + "': " + e.what());
    }
}

void validate(const AttributionConfig& c) {
    parseLogLevel(c.log_level);
    const auto& t = c.training;
    if (t.samples_per_label < 1) {
        throw InputFormatError("training.samples_per_label must be positive");
    }
    if (!(t.test_size > 0.0 && t.test_size < 1.0)) {
        throw InputFormatError("training.test_size must be in (0, 1)");
    }
    if (!(t.nb_alpha > 0.0)) {
        throw InputFormatError("training.nb_alpha must be positive");
    }
    if (t.generator.size_min < 1 || t.generator.size_max <= t.generator.size_min) {
        throw InputFormatError("generator.size_min/size_max must satisfy 1 <= min < max");
    }
    if (c.top_n < 1) {
        throw InputFormatError("prediction.top_n must be positive");
    }
}

AttributionConfig fromNode(const YAML::Node& root) {
    AttributionConfig config;
    if (root.IsNull()) return config;
    if (!root.IsMap()) {
        throw InputFormatError("Config root must be a mapping");
    }

    readScalar(root["logging"], "level", config.log_level);

    const YAML::Node training = root["training"];
    readScalar(training, "samples_per_label", config.training.samples_per_label);
    readScalar(training, "test_size", config.training.test_size);
    readScalar(training, "random_seed", config.training.random_seed);
    readScalar(training, "nb_alpha", config.training.nb_alpha);

    std::string averaging;
    readScalar(training, "averaging", averaging);
    if (!averaging.empty()) config.training.averaging = parseAveraging(averaging);

    std::string version_part;
    readScalar(training, "version_part", version_part);
    if (!version_part.empty()) config.version_part = parseVersionPart(version_part);

    const YAML::Node generator = root["generator"];
    readScalar(generator, "size_min", config.training.generator.size_min);
    readScalar(generator, "size_max", config.training.generator.size_max);

    readScalar(root["prediction"], "top_n", config.top_n);

    validate(config);
    return config;
}

} // namespace

AttributionConfig parseConfig(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw InputFormatError(std::string("Malformed config: ") + e.what());
    }
    return fromNode(root);
}

AttributionConfig loadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw InputFormatError("Cannot load config " + path + ": " + e.what());
    }
    return fromNode(root);
}

} // namespace attrtools
