#pragma once

#include "stix/entity.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace attrtools {

// ─── Semantic ids ──────────────────────────────────────────────
// The token one STIX object contributes to a feature string.
// Whitespace is stripped from names so that a token never splits.

/// "attack-pattern-" + x_mitre_id up to the first '.'
/// {"x_mitre_id": "T1003.001"} -> "attack-pattern-T1003"
std::string semanticIdFromAttackPattern(const nlohmann::json& object);

/// {"name": "Malware Name"} -> "malware-MalwareName"
std::string semanticIdFromMalware(const nlohmann::json& object);

/// {"name": "Tool Name"} -> "tool-ToolName"
std::string semanticIdFromTool(const nlohmann::json& object);

/// identity, location, vulnerability and indicator use the STIX id.
std::string semanticIdFromId(const nlohmann::json& object);

std::string semanticId(EntityKind kind, const nlohmann::json& object);

// ─── Feature Serializer ────────────────────────────────────────

/// Convert an incident bundle to its feature string: the semantic ids
/// of the recognized objects in "objects", in bundle order, joined by
/// single spaces. Pure and deterministic.
///
/// Throws InputFormatError if the incident is not an object, "objects"
/// is not an array, an element is not an object or lacks a string "id",
/// or a used text field is not a string.
std::string incidentToFeatureString(const nlohmann::json& incident);

// ─── Intrusion-set bundles ─────────────────────────────────────
// A bundle describes one intrusion set: its first "intrusion-set"
// object plus entities linked to it by "relationship" objects.

/// Build the intrusion set of a bundle's "objects" array.
/// std::nullopt if the bundle has no intrusion-set object.
std::optional<IntrusionSet> buildIntrusionSet(const nlohmann::json& objects);

/// "<name>_<id>" of the first intrusion-set object, e.g.
/// "Aggah_intrusion-set--088d7359-97fb-591b-aeed-be46caf1027d".
std::optional<std::string> intrusionSetLabel(const nlohmann::json& objects);

/// True for "<name>_intrusion-set--<uuid>" with non-empty name and uuid.
bool isWellFormedLabel(const std::string& label);

using LabeledIntrusionSets = std::vector<std::pair<std::string, IntrusionSet>>;

/// Parse a corpus (array of bundles) into labeled intrusion sets, in
/// first-seen label order. A repeated label replaces the earlier entry.
/// Bundles without an intrusion set are skipped.
LabeledIntrusionSets collectIntrusionSets(const nlohmann::json& corpus);

} // namespace attrtools
