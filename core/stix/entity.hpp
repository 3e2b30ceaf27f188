#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace attrtools {

/// STIX object kinds that contribute tokens to a feature string.
enum class EntityKind {
    AttackPattern,
    Malware,
    Tool,
    Identity,
    Location,
    Vulnerability,
    Indicator,
};

/// Fixed scan order used when matching ids and listing kinds.
inline constexpr std::array<EntityKind, 7> kEntityKinds = {
    EntityKind::AttackPattern, EntityKind::Malware, EntityKind::Tool,
    EntityKind::Identity, EntityKind::Location, EntityKind::Vulnerability,
    EntityKind::Indicator,
};

/// STIX type name, e.g. "attack-pattern".
const char* stixType(EntityKind kind);

/// Kind of a STIX id of the form "<type>--<uuid>", if recognized.
std::optional<EntityKind> kindFromId(const std::string& stix_id);

/// Kind for an exact STIX type name, if recognized.
std::optional<EntityKind> kindFromType(const std::string& type);

/// An object related to an intrusion set through a STIX relationship.
struct Entity {
    std::string identifier;      // STIX id
    EntityKind kind = EntityKind::AttackPattern;
    std::string semantic_id;     // feature token
    bool is_subject = false;     // true if the entity is the relationship source
    std::string relation;        // relationship_type

    Entity() = default;
    Entity(std::string identifier, EntityKind kind)
        : identifier(std::move(identifier)), kind(kind) {}
};

// ─── IntrusionSet ──────────────────────────────────────────────
// One attacker group and the entities linked to it, bucketed by kind.

struct IntrusionSet {
    std::string identifier;

    std::vector<Entity> attack_patterns;
    std::vector<Entity> malwares;
    std::vector<Entity> tools;
    std::vector<Entity> identities;
    std::vector<Entity> locations;
    std::vector<Entity> vulnerabilities;
    std::vector<Entity> indicators;

    IntrusionSet() = default;
    explicit IntrusionSet(std::string identifier)
        : identifier(std::move(identifier)) {}

    /// Add an entity to its bucket. Entities with the same kind and
    /// identifier are kept once. Returns false on a duplicate.
    bool addRelatedEntity(const Entity& entity);

    bool empty() const { return relatedCount() == 0; }
    size_t relatedCount() const;

    std::vector<Entity>& bucket(EntityKind kind);
    const std::vector<Entity>& bucket(EntityKind kind) const;
};

} // namespace attrtools
