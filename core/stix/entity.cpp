#include "stix/entity.hpp"

#include <algorithm>

namespace attrtools {

const char* stixType(EntityKind kind) {
    switch (kind) {
        case EntityKind::AttackPattern: return "attack-pattern";
        case EntityKind::Malware:       return "malware";
        case EntityKind::Tool:          return "tool";
        case EntityKind::Identity:      return "identity";
        case EntityKind::Location:      return "location";
        case EntityKind::Vulnerability: return "vulnerability";
        case EntityKind::Indicator:     return "indicator";
    }
    return "";
}

std::optional<EntityKind> kindFromId(const std::string& stix_id) {
    for (EntityKind kind : kEntityKinds) {
        std::string prefix = std::string(stixType(kind)) + "--";
        if (stix_id.rfind(prefix, 0) == 0) return kind;
    }
    return std::nullopt;
}

std::optional<EntityKind> kindFromType(const std::string& type) {
    for (EntityKind kind : kEntityKinds) {
        if (type == stixType(kind)) return kind;
    }
    return std::nullopt;
}

bool IntrusionSet::addRelatedEntity(const Entity& entity) {
    auto& dest = bucket(entity.kind);
    auto it = std::find_if(dest.begin(), dest.end(), [&](const Entity& e) {
        return e.identifier == entity.identifier;
    });
    if (it != dest.end()) return false;
    dest.push_back(entity);
    return true;
}

size_t IntrusionSet::relatedCount() const {
    return attack_patterns.size() + malwares.size() + tools.size() +
           identities.size() + locations.size() + vulnerabilities.size() +
           indicators.size();
}

std::vector<Entity>& IntrusionSet::bucket(EntityKind kind) {
    return const_cast<std::vector<Entity>&>(
        static_cast<const IntrusionSet&>(*this).bucket(kind));
}

const std::vector<Entity>& IntrusionSet::bucket(EntityKind kind) const {
    switch (kind) {
        case EntityKind::AttackPattern: return attack_patterns;
        case EntityKind::Malware:       return malwares;
        case EntityKind::Tool:          return tools;
        case EntityKind::Identity:      return identities;
        case EntityKind::Location:      return locations;
        case EntityKind::Vulnerability: return vulnerabilities;
        case EntityKind::Indicator:     return indicators;
    }
    return indicators;
}

} // namespace attrtools
