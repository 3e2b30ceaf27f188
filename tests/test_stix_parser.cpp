#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "stix/entity.hpp"
#include "stix/stix_parser.hpp"
#include "stix_fixtures.hpp"

using namespace attrtools;
using nlohmann::json;

// ─── Semantic ids ──────────────────────────────────────────────

TEST(StixParserTest, AttackPatternDropsSubTechnique) {
    EXPECT_EQ(semanticIdFromAttackPattern({{"x_mitre_id", "T1003.001"}}), "attack-pattern-T1003");
    EXPECT_EQ(semanticIdFromAttackPattern({{"x_mitre_id", "T1100"}}), "attack-pattern-T1100");
    EXPECT_EQ(semanticIdFromAttackPattern(json::object()), "attack-pattern-");
}

TEST(StixParserTest, NamesLoseWhitespace) {
    EXPECT_EQ(semanticIdFromMalware({{"name", "Malware Name"}}), "malware-MalwareName");
    EXPECT_EQ(semanticIdFromTool({{"name", "Tool Name"}}), "tool-ToolName");
    EXPECT_EQ(semanticIdFromTool({{"name", "Tool\tName\n"}}), "tool-ToolName");
}

TEST(StixParserTest, IdBasedKinds) {
    json obj = {{"id", "identity--f11b0831-e7e6-5214-9431-ccf054e53e94"}};
    EXPECT_EQ(semanticId(EntityKind::Identity, obj), "identity--f11b0831-e7e6-5214-9431-ccf054e53e94");
    EXPECT_EQ(semanticId(EntityKind::Location, {{"id", "location--1"}}), "location--1");
    EXPECT_EQ(semanticId(EntityKind::Vulnerability, {{"id", "vulnerability--1"}}), "vulnerability--1");
    EXPECT_EQ(semanticId(EntityKind::Indicator, {{"id", "indicator--1"}}), "indicator--1");
}

TEST(StixParserTest, KindFromId) {
    EXPECT_EQ(kindFromId("attack-pattern--abc"), EntityKind::AttackPattern);
    EXPECT_EQ(kindFromId("malware--abc"), EntityKind::Malware);
    EXPECT_FALSE(kindFromId("malware-analysis--abc").has_value());
    EXPECT_FALSE(kindFromId("intrusion-set--abc").has_value());
    EXPECT_FALSE(kindFromId("relationship--abc").has_value());
}

// ─── Feature Serializer ────────────────────────────────────────

TEST(StixParserTest, IncidentToFeatureString) {
    json incident = json::parse(R"({
        "type": "bundle",
        "id": "bundle--1",
        "objects": [
            {"type": "attack-pattern", "id": "attack-pattern--1", "x_mitre_id": "T1571"},
            {"type": "malware", "id": "malware--1", "name": "Fysbis"},
            {"type": "relationship", "id": "relationship--1", "source_ref": "malware--1",
             "target_ref": "attack-pattern--1", "relationship_type": "uses"},
            {"type": "tool", "id": "tool--1", "name": "Cobalt Strike"},
            {"type": "identity", "id": "identity--7", "name": "ACME"},
            {"type": "location", "id": "location--3"},
            {"type": "vulnerability", "id": "vulnerability--9", "name": "CVE-2021-44228"},
            {"type": "indicator", "id": "indicator--5", "pattern": "[ipv4-addr:value = '10.0.0.1']"},
            {"type": "note", "id": "note--1", "content": "ignored"}
        ]
    })");

    EXPECT_EQ(incidentToFeatureString(incident),
              "attack-pattern-T1571 malware-Fysbis tool-CobaltStrike identity--7 "
              "location--3 vulnerability--9 indicator--5");
}

TEST(StixParserTest, SerializationIsDeterministic) {
    json incident = fixtures::makeBundle(fixtures::aggah());
    std::string first = incidentToFeatureString(incident);
    std::string second = incidentToFeatureString(incident);
    EXPECT_EQ(first, second);
    EXPECT_FALSE(first.empty());
}

TEST(StixParserTest, KeyOrderDoesNotMatter) {
    json a = json::parse(R"({"objects": [{"name": "Fysbis", "type": "malware", "id": "malware--1"}]})");
    json b = json::parse(R"({"objects": [{"id": "malware--1", "type": "malware", "name": "Fysbis"}], "id": "x"})");
    EXPECT_EQ(incidentToFeatureString(a), incidentToFeatureString(b));
}

TEST(StixParserTest, MissingObjectsSerializesEmpty) {
    EXPECT_EQ(incidentToFeatureString(json::object()), "");
    EXPECT_EQ(incidentToFeatureString({{"objects", json::array()}}), "");
}

TEST(StixParserTest, MalformedIncidentsThrow) {
    EXPECT_THROW(incidentToFeatureString(json::array()), InputFormatError);
    EXPECT_THROW(incidentToFeatureString("text"), InputFormatError);
    EXPECT_THROW(incidentToFeatureString({{"objects", 5}}), InputFormatError);
    EXPECT_THROW(incidentToFeatureString({{"objects", {1, 2}}}), InputFormatError);
    EXPECT_THROW(incidentToFeatureString(json::parse(R"({"objects": [{"type": "tool"}]})")),
                 InputFormatError);
    EXPECT_THROW(incidentToFeatureString(json::parse(
                     R"({"objects": [{"id": "tool--1", "name": 42}]})")),
                 InputFormatError);
}

// ─── Intrusion-set bundles ─────────────────────────────────────

TEST(StixParserTest, BuildIntrusionSet) {
    json bundle = fixtures::makeBundle(fixtures::aggah());
    auto is = buildIntrusionSet(bundle["objects"]);
    ASSERT_TRUE(is.has_value());

    EXPECT_EQ(is->identifier, fixtures::kAggahId);
    EXPECT_EQ(is->attack_patterns.size(), 4u);
    EXPECT_EQ(is->malwares.size(), 2u);
    EXPECT_EQ(is->tools.size(), 2u);
    EXPECT_EQ(is->indicators.size(), 2u);
    EXPECT_EQ(is->relatedCount(), 10u);
    EXPECT_FALSE(is->empty());

    EXPECT_EQ(is->malwares[0].semantic_id, "malware-RevengeRAT");
    EXPECT_EQ(is->malwares[0].relation, "uses");
    EXPECT_FALSE(is->malwares[0].is_subject);
    EXPECT_TRUE(is->indicators[0].is_subject);
    EXPECT_EQ(is->indicators[0].relation, "indicates");
}

TEST(StixParserTest, UnrelatedEntitiesAreIgnored) {
    json objects = json::parse(R"([
        {"type": "intrusion-set", "id": "intrusion-set--1", "name": "G"},
        {"type": "malware", "id": "malware--1", "name": "Linked"},
        {"type": "malware", "id": "malware--2", "name": "Loose"},
        {"type": "relationship", "id": "relationship--1", "relationship_type": "uses",
         "source_ref": "intrusion-set--1", "target_ref": "malware--1"},
        {"type": "relationship", "id": "relationship--2", "relationship_type": "uses",
         "source_ref": "intrusion-set--1", "target_ref": "malware--1"},
        {"type": "relationship", "id": "relationship--3", "relationship_type": "uses",
         "source_ref": "intrusion-set--1", "target_ref": "malware--404"}
    ])");
    auto is = buildIntrusionSet(objects);
    ASSERT_TRUE(is.has_value());
    ASSERT_EQ(is->malwares.size(), 1u);
    EXPECT_EQ(is->malwares[0].identifier, "malware--1");
}

TEST(StixParserTest, BundleWithoutIntrusionSet) {
    json objects = json::parse(R"([{"type": "malware", "id": "malware--1", "name": "X"}])");
    EXPECT_FALSE(buildIntrusionSet(objects).has_value());
    EXPECT_FALSE(intrusionSetLabel(objects).has_value());
}

TEST(StixParserTest, IntrusionSetLabel) {
    json bundle = fixtures::makeBundle(fixtures::aggah());
    auto label = intrusionSetLabel(bundle["objects"]);
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, fixtures::kAggahLabel);
    EXPECT_TRUE(isWellFormedLabel(*label));
}

TEST(StixParserTest, WellFormedLabel) {
    EXPECT_TRUE(isWellFormedLabel("APT 28_intrusion-set--abc"));
    EXPECT_FALSE(isWellFormedLabel("_intrusion-set--abc"));
    EXPECT_FALSE(isWellFormedLabel("Aggah_intrusion-set--"));
    EXPECT_FALSE(isWellFormedLabel("Aggah_malware--abc"));
    EXPECT_FALSE(isWellFormedLabel(" "));
}

TEST(StixParserTest, CollectIntrusionSetsKeepsOrder) {
    json corpus = fixtures::corpus();
    corpus.push_back(fixtures::makeBundle(fixtures::aggah()));  // duplicate label
    corpus.push_back({{"objects", json::array()}});              // no intrusion set

    auto sets = collectIntrusionSets(corpus);
    ASSERT_EQ(sets.size(), 3u);
    EXPECT_EQ(sets[0].first, fixtures::kAggahLabel);
    EXPECT_EQ(sets[1].first, fixtures::kKippisLabel);
    EXPECT_EQ(sets[2].first, fixtures::kUnc2891Label);
}

TEST(StixParserTest, CollectIntrusionSetsRejectsNonArray) {
    EXPECT_THROW(collectIntrusionSets(json::object()), InputFormatError);
    EXPECT_THROW(collectIntrusionSets(json::array({json::object()})), InputFormatError);
}
