#include "stix/stix_parser.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace attrtools {

namespace {

/// String member, "" if absent. Throws if present with another type.
std::string stringField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw InputFormatError(std::string("Field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

std::string stripWhitespace(std::string s) {
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    }), s.end());
    return s;
}

const nlohmann::json& requireObject(const nlohmann::json& value, const char* what) {
    if (!value.is_object()) {
        throw InputFormatError(std::string(what) + " is not a JSON object");
    }
    return value;
}

std::string requireId(const nlohmann::json& object) {
    auto it = object.find("id");
    if (it == object.end() || !it->is_string()) {
        throw InputFormatError("STIX object has no string 'id'");
    }
    return it->get<std::string>();
}

} // namespace

std::string semanticIdFromAttackPattern(const nlohmann::json& object) {
    std::string mitre_id = stringField(object, "x_mitre_id");
    mitre_id = mitre_id.substr(0, mitre_id.find('.'));
    return "attack-pattern-" + stripWhitespace(mitre_id);
}

std::string semanticIdFromMalware(const nlohmann::json& object) {
    return "malware-" + stripWhitespace(stringField(object, "name"));
}

std::string semanticIdFromTool(const nlohmann::json& object) {
    return "tool-" + stripWhitespace(stringField(object, "name"));
}

std::string semanticIdFromId(const nlohmann::json& object) {
    return stringField(object, "id");
}

std::string semanticId(EntityKind kind, const nlohmann::json& object) {
    switch (kind) {
        case EntityKind::AttackPattern: return semanticIdFromAttackPattern(object);
        case EntityKind::Malware:       return semanticIdFromMalware(object);
        case EntityKind::Tool:          return semanticIdFromTool(object);
        case EntityKind::Identity:
        case EntityKind::Location:
        case EntityKind::Vulnerability:
        case EntityKind::Indicator:     return semanticIdFromId(object);
    }
    return "";
}

std::string incidentToFeatureString(const nlohmann::json& incident) {
    requireObject(incident, "Incident");

    auto objects = incident.find("objects");
    if (objects == incident.end()) return "";
    if (!objects->is_array()) {
        throw InputFormatError("Incident 'objects' is not an array");
    }

    std::string features;
    for (const auto& object : *objects) {
        requireObject(object, "Incident object");
        auto kind = kindFromId(requireId(object));
        if (!kind) continue;

        if (!features.empty()) features += ' ';
        features += semanticId(*kind, object);
    }
    return features;
}

std::optional<IntrusionSet> buildIntrusionSet(const nlohmann::json& objects) {
    if (!objects.is_array()) {
        throw InputFormatError("Bundle 'objects' is not an array");
    }

    const nlohmann::json* intrusion_set = nullptr;
    for (const auto& object : objects) {
        requireObject(object, "Bundle object");
        if (stringField(object, "type") == "intrusion-set") {
            intrusion_set = &object;
            break;
        }
    }
    if (!intrusion_set) return std::nullopt;

    const std::string is_id = requireId(*intrusion_set);
    IntrusionSet result(is_id);

    // STIX id -> (kind, semantic id) of every recognized object
    std::unordered_map<std::string, std::pair<EntityKind, std::string>> related;
    for (const auto& object : objects) {
        auto kind = kindFromType(stringField(object, "type"));
        if (!kind) continue;
        related[requireId(object)] = {*kind, semanticId(*kind, object)};
    }

    auto link = [&](const nlohmann::json& rel, const std::string& other_ref, bool is_subject) {
        auto it = related.find(other_ref);
        if (it == related.end()) return;
        Entity entity(other_ref, it->second.first);
        entity.semantic_id = it->second.second;
        entity.is_subject = is_subject;
        entity.relation = stringField(rel, "relationship_type");
        result.addRelatedEntity(entity);
    };

    // Outgoing relationships first, then incoming ones.
    for (const auto& object : objects) {
        if (stringField(object, "type") != "relationship") continue;
        if (stringField(object, "source_ref") == is_id) {
            link(object, stringField(object, "target_ref"), false);
        }
    }
    for (const auto& object : objects) {
        if (stringField(object, "type") != "relationship") continue;
        if (stringField(object, "target_ref") == is_id) {
            link(object, stringField(object, "source_ref"), true);
        }
    }

    return result;
}

std::optional<std::string> intrusionSetLabel(const nlohmann::json& objects) {
    if (!objects.is_array()) {
        throw InputFormatError("Bundle 'objects' is not an array");
    }
    for (const auto& object : objects) {
        requireObject(object, "Bundle object");
        std::string id = requireId(object);
        if (id.rfind("intrusion-set", 0) == 0) {
            return stringField(object, "name") + "_" + id;
        }
    }
    return std::nullopt;
}

bool isWellFormedLabel(const std::string& label) {
    static const std::string marker = "_intrusion-set--";
    size_t pos = label.find(marker);
    if (pos == std::string::npos || pos == 0) return false;
    return pos + marker.size() < label.size();
}

LabeledIntrusionSets collectIntrusionSets(const nlohmann::json& corpus) {
    if (!corpus.is_array()) {
        throw InputFormatError("Intrusion-set corpus is not an array");
    }

    LabeledIntrusionSets result;
    std::unordered_map<std::string, size_t> index;

    for (const auto& bundle : corpus) {
        requireObject(bundle, "Intrusion-set bundle");
        auto objects = bundle.find("objects");
        if (objects == bundle.end()) {
            throw InputFormatError("Intrusion-set bundle has no 'objects'");
        }

        auto intrusion_set = buildIntrusionSet(*objects);
        if (!intrusion_set) continue;
        auto label = intrusionSetLabel(*objects);
        if (!label) continue;

        auto it = index.find(*label);
        if (it != index.end()) {
            result[it->second].second = std::move(*intrusion_set);
        } else {
            index[*label] = result.size();
            result.emplace_back(*label, std::move(*intrusion_set));
        }
    }
    return result;
}

} // namespace attrtools
