#include <gtest/gtest.h>
#include "graph/relation.hpp"
#include "graph/relation_types.hpp"
#include "index/relation_index.hpp"

using namespace lexigraph;

// ==========================================
// Relation Type Registry Tests
// ==========================================

TEST(RelationTypeRegistryTest, Defaults) {
    auto types = RelationTypeRegistry::with_defaults();

    EXPECT_TRUE(types.contains("is_a"));
    EXPECT_TRUE(types.is_transitive("is_a"));
    EXPECT_FALSE(types.is_symmetric("is_a"));

    EXPECT_TRUE(types.is_symmetric("related_to"));
    EXPECT_FALSE(types.is_transitive("related_to"));

    EXPECT_TRUE(types.is_symmetric("equivalent_to"));
    EXPECT_TRUE(types.is_transitive("equivalent_to"));
    EXPECT_TRUE(types.is_reflexive("equivalent_to"));

    EXPECT_EQ(types.inverse_of("part_of"), "has_part");
    EXPECT_EQ(types.inverse_of("has_part"), "part_of");
    EXPECT_EQ(types.inverse_of("broader"), "narrower");
    EXPECT_EQ(types.inverse_of("is_a"), "");
}

TEST(RelationTypeRegistryTest, UnknownType) {
    auto types = RelationTypeRegistry::with_defaults();
    EXPECT_FALSE(types.contains("causes"));
    EXPECT_EQ(types.find("causes"), nullptr);
    EXPECT_FALSE(types.is_transitive("causes"));
}

TEST(RelationTypeRegistryTest, RegisterCustomType) {
    auto types = RelationTypeRegistry::with_defaults();
    size_t before = types.size();

    types.register_type({"precedes", false, true, false, ""});
    EXPECT_EQ(types.size(), before + 1);
    EXPECT_TRUE(types.is_transitive("precedes"));

    // Re-registering replaces the traits
    types.register_type({"precedes", false, false, false, ""});
    EXPECT_EQ(types.size(), before + 1);
    EXPECT_FALSE(types.is_transitive("precedes"));
}

TEST(RelationTypeRegistryTest, RejectsInvalidTraits) {
    RelationTypeRegistry types;
    EXPECT_THROW(types.register_type({"", false, false, false, ""}), std::invalid_argument);
    EXPECT_THROW(types.register_type({"twin", false, false, false, "twin"}), std::invalid_argument);
}

TEST(RelationTypeRegistryTest, InverseMustBeRegistered) {
    RelationTypeRegistry types;
    types.register_type({"contains", false, true, false, "inside"});
    EXPECT_EQ(types.inverse_of("contains"), "");

    types.register_type({"inside", false, true, false, "contains"});
    EXPECT_EQ(types.inverse_of("contains"), "inside");
}

TEST(RelationTypeRegistryTest, JsonRoundtrip) {
    auto types = RelationTypeRegistry::with_defaults();
    auto loaded = RelationTypeRegistry::from_json(types.to_json());

    EXPECT_EQ(loaded.names(), types.names());
    EXPECT_EQ(loaded.inverse_of("part_of"), "has_part");
    EXPECT_TRUE(loaded.is_reflexive("equivalent_to"));
}

// ==========================================
// Canonical Key Tests
// ==========================================

TEST(CanonicalKeyTest, DirectedTypeKeepsOrder) {
    auto types = RelationTypeRegistry::with_defaults();
    auto key = canonical_key("Mammal", "Animal", "is_a", types);
    EXPECT_EQ(key.source_id, "Mammal");
    EXPECT_EQ(key.target_id, "Animal");
}

TEST(CanonicalKeyTest, SymmetricTypeIsDirectionFree) {
    auto types = RelationTypeRegistry::with_defaults();
    auto forward = canonical_key("Dog", "Cat", "related_to", types);
    auto backward = canonical_key("Cat", "Dog", "related_to", types);

    EXPECT_EQ(forward, backward);
    EXPECT_EQ(forward.source_id, "Cat");
}

TEST(CanonicalKeyTest, TypeIsPartOfKey) {
    auto types = RelationTypeRegistry::with_defaults();
    EXPECT_FALSE(canonical_key("A", "B", "is_a", types) == canonical_key("A", "B", "part_of", types));
}

// ==========================================
// Relation Tests
// ==========================================

TEST(RelationTest, MakeAsserted) {
    Relation r = make_asserted("Cat", "Mammal", "is_a", 0.8, "alice");
    EXPECT_EQ(r.provenance, Provenance::Asserted);
    EXPECT_EQ(r.status, RelationStatus::Confirmed);
    EXPECT_DOUBLE_EQ(r.confidence, 0.8);
    EXPECT_EQ(r.created_by, "alice");
    EXPECT_TRUE(r.derivation.empty());
    EXPECT_FALSE(r.is_inferred());
    EXPECT_FALSE(r.is_self_loop());
}

TEST(RelationTest, DerivationAccessors) {
    Relation r;
    r.source_id = "Cat";
    r.target_id = "Animal";
    r.relation_type = "is_a";
    r.provenance = Provenance::Inferred;
    r.derivation = {{"rel_1", "seed", ""}, {"rel_2", "transitive", ""}};

    EXPECT_EQ(r.derivation_path(), (std::vector<std::string>{"rel_1", "rel_2"}));
    EXPECT_EQ(r.rules_applied(), (std::vector<std::string>{"seed", "transitive"}));
    EXPECT_TRUE(r.depends_on("rel_2"));
    EXPECT_FALSE(r.depends_on("rel_3"));
}

TEST(RelationTest, JsonRoundtrip) {
    Relation r;
    r.id = "rel_abc";
    r.source_id = "Cat";
    r.target_id = "Animal";
    r.relation_type = "is_a";
    r.confidence = 0.9;
    r.provenance = Provenance::Inferred;
    r.status = RelationStatus::Provisional;
    r.derivation = {{"rel_1", "seed", ""}, {"rel_2", "transitive", "inverse"}};
    r.created_at = "2024-01-01T00:00:00.000Z";
    r.created_by = "inference";
    r.metadata = "note";

    Relation loaded = Relation::from_json(r.to_json());
    EXPECT_EQ(loaded.id, r.id);
    EXPECT_EQ(loaded.source_id, r.source_id);
    EXPECT_EQ(loaded.target_id, r.target_id);
    EXPECT_DOUBLE_EQ(loaded.confidence, 0.9);
    EXPECT_EQ(loaded.provenance, Provenance::Inferred);
    EXPECT_EQ(loaded.status, RelationStatus::Provisional);
    EXPECT_EQ(loaded.derivation, r.derivation);
    EXPECT_EQ(loaded.metadata, "note");
}

TEST(RelationTest, FromJsonDefaults) {
    nlohmann::json j = {
        {"id", "rel_x"}, {"source_id", "A"}, {"target_id", "B"}, {"relation_type", "is_a"}
    };
    Relation r = Relation::from_json(j);
    EXPECT_DOUBLE_EQ(r.confidence, 1.0);
    EXPECT_EQ(r.provenance, Provenance::Asserted);
    EXPECT_EQ(r.status, RelationStatus::Confirmed);
}

TEST(RelationTest, EnumConversions) {
    EXPECT_EQ(string_to_provenance(provenance_to_string(Provenance::Inferred)), Provenance::Inferred);
    EXPECT_EQ(string_to_status(status_to_string(RelationStatus::Provisional)), RelationStatus::Provisional);
    EXPECT_EQ(relation_error_to_string(RelationError::AlreadyResolved), "already_resolved");
    EXPECT_THROW(string_to_status("pending"), std::invalid_argument);
}

TEST(RelationTest, StatusFilter) {
    EXPECT_TRUE(status_matches(StatusFilter::Any, RelationStatus::Provisional));
    EXPECT_TRUE(status_matches(StatusFilter::Confirmed, RelationStatus::Confirmed));
    EXPECT_FALSE(status_matches(StatusFilter::Confirmed, RelationStatus::Provisional));
    EXPECT_FALSE(status_matches(StatusFilter::Provisional, RelationStatus::Confirmed));
}

// ==========================================
// Utility Tests
// ==========================================

TEST(UtilityTest, GenerateRelationID) {
    std::string id1 = generate_relation_id();
    std::string id2 = generate_relation_id();

    EXPECT_NE(id1, id2);
    EXPECT_EQ(id1.substr(0, 4), "rel_");
    EXPECT_EQ(id1.size(), 20u);
}

TEST(UtilityTest, TimestampFormat) {
    std::string ts = current_timestamp_utc();
    ASSERT_EQ(ts.size(), 24u);  // 2024-01-01T00:00:00.000Z
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}

// ==========================================
// Relation Index Tests
// ==========================================

TEST(RelationIndexTest, AdjacencyAndDependents) {
    auto types = RelationTypeRegistry::with_defaults();
    RelationIndex index;

    Relation a = make_asserted("Cat", "Mammal", "is_a");
    a.id = "rel_a";
    Relation b = make_asserted("Mammal", "Animal", "is_a");
    b.id = "rel_b";
    Relation c;
    c.id = "rel_c";
    c.source_id = "Cat";
    c.target_id = "Animal";
    c.relation_type = "is_a";
    c.provenance = Provenance::Inferred;
    c.derivation = {{"rel_a", "seed", ""}, {"rel_b", "transitive", ""}};

    index.add(a, canonical_key(a, types));
    index.add(b, canonical_key(b, types));
    index.add(c, canonical_key(c, types));

    EXPECT_EQ(index.outgoing("Cat").size(), 2u);
    EXPECT_EQ(index.outgoing("Cat", "part_of").size(), 0u);
    EXPECT_EQ(index.incoming("Animal").size(), 2u);
    EXPECT_EQ(index.dependents_of("rel_a"), std::vector<std::string>{"rel_c"});

    auto found = index.lookup(canonical_key(b, types));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "rel_b");

    index.remove(c, canonical_key(c, types));
    EXPECT_TRUE(index.dependents_of("rel_a").empty());
    EXPECT_EQ(index.terms().size(), 3u);
}
