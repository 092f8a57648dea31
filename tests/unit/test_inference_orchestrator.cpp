#include <gtest/gtest.h>
#include "inference/inference_orchestrator.hpp"
#include "store/memory_graph_store.hpp"
#include "store/sqlite_relation_store.hpp"
#include "flaky_store.hpp"
#include <map>

using namespace lexigraph;
using lexigraph::testing_support::FlakyStore;

namespace {

const CandidateRelation* find_candidate(const std::vector<CandidateRelation>& candidates,
                                        const std::string& source, const std::string& target,
                                        const std::string& type) {
    for (const auto& c : candidates) {
        if (c.source_id == source && c.target_id == target && c.relation_type == type) {
            return &c;
        }
    }
    return nullptr;
}

} // namespace

class InferenceOrchestratorTest : public ::testing::Test {
protected:
    MemoryGraphStore store;
    InferenceOrchestrator orchestrator{store};

    std::string assert_edge(const std::string& source, const std::string& target,
                            const std::string& type, double confidence = 1.0) {
        PutResult result = store.put(make_asserted(source, target, type, confidence));
        EXPECT_EQ(result.error, RelationError::None) << result.error_message;
        return result.id;
    }

    // A -> B -> C -> D
    void build_chain() {
        e1 = assert_edge("A", "B", "is_a");
        e2 = assert_edge("B", "C", "is_a");
        e3 = assert_edge("C", "D", "is_a");
    }

    std::string e1, e2, e3;
};

// ==========================================
// Basic Inference Tests
// ==========================================

TEST_F(InferenceOrchestratorTest, CatIsAnAnimal) {
    std::string cat_mammal = assert_edge("Cat", "Mammal", "is_a");
    std::string mammal_animal = assert_edge("Mammal", "Animal", "is_a");

    auto candidates = orchestrator.infer("Cat", {TransitiveRule{}}, 2);
    ASSERT_EQ(candidates.size(), 1u);

    const auto& c = candidates[0];
    EXPECT_EQ(c.source_id, "Cat");
    EXPECT_EQ(c.target_id, "Animal");
    EXPECT_EQ(c.relation_type, "is_a");
    EXPECT_NEAR(c.confidence, 0.9, 1e-12);
    EXPECT_EQ(c.derivation_path(), (std::vector<std::string>{cat_mammal, mammal_animal}));
    EXPECT_FALSE(c.id.empty());

    auto stored = store.get(c.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, RelationStatus::Provisional);
    EXPECT_EQ(stored->provenance, Provenance::Inferred);
    EXPECT_EQ(stored->derivation_path(), c.derivation_path());
}

TEST(InferenceOrchestratorSqliteTest, CatIsAnAnimal) {
    SqliteRelationStore store(":memory:");
    store.put(make_asserted("Cat", "Mammal", "is_a"));
    store.put(make_asserted("Mammal", "Animal", "is_a"));

    InferenceOrchestrator orchestrator(store);
    auto candidates = orchestrator.infer("Cat", {TransitiveRule{}}, 2);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_NEAR(candidates[0].confidence, 0.9, 1e-12);

    auto pending = store.list(StatusFilter::Provisional);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].target_id, "Animal");
    EXPECT_EQ(pending[0].derivation.size(), 2u);
}

TEST_F(InferenceOrchestratorTest, DepthBoundsDerivationLength) {
    build_chain();

    auto shallow = orchestrator.infer("A", {TransitiveRule{}}, 2);
    ASSERT_EQ(shallow.size(), 1u);
    EXPECT_EQ(shallow[0].target_id, "C");

    auto deep = orchestrator.infer("A", {TransitiveRule{}}, 3);
    ASSERT_EQ(deep.size(), 2u);
    EXPECT_EQ(deep[0].target_id, "C");
    EXPECT_NEAR(deep[0].confidence, 0.9, 1e-12);
    EXPECT_EQ(deep[1].target_id, "D");
    EXPECT_NEAR(deep[1].confidence, 0.81, 1e-12);
    EXPECT_EQ(deep[1].derivation_path(), (std::vector<std::string>{e1, e2, e3}));
}

TEST_F(InferenceOrchestratorTest, NonPositiveDepthReturnsNothing) {
    build_chain();
    EXPECT_TRUE(orchestrator.infer("A", all_rules(), 0).empty());
    EXPECT_TRUE(orchestrator.infer("A", all_rules(), -1).empty());
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(InferenceOrchestratorTest, UnknownTermReturnsNothing) {
    build_chain();
    EXPECT_TRUE(orchestrator.infer("Nowhere", all_rules(), 3).empty());
    EXPECT_TRUE(orchestrator.infer("D", all_rules(), 3).empty());
}

TEST_F(InferenceOrchestratorTest, EmptyRulesUseDefaults) {
    build_chain();
    auto candidates = orchestrator.infer("A", {}, 2);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].target_id, "C");
}

TEST_F(InferenceOrchestratorTest, RuleSelectionIsHonored) {
    build_chain();
    EXPECT_TRUE(orchestrator.infer("A", {SymmetricRule{}, InverseRule{}}, 3).empty());
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(InferenceOrchestratorTest, BestDerivationWins) {
    assert_edge("A", "B", "is_a", 0.5);
    assert_edge("B", "D", "is_a", 1.0);
    std::string ac = assert_edge("A", "C", "is_a", 1.0);
    std::string cd = assert_edge("C", "D", "is_a", 1.0);

    auto candidates = orchestrator.infer("A", {TransitiveRule{}}, 2);
    const auto* ad = find_candidate(candidates, "A", "D", "is_a");
    ASSERT_NE(ad, nullptr);
    EXPECT_NEAR(ad->confidence, 0.9, 1e-12);
    EXPECT_EQ(ad->derivation_path(), (std::vector<std::string>{ac, cd}));
}

TEST_F(InferenceOrchestratorTest, InverseCandidate) {
    std::string wheel_car = assert_edge("Wheel", "Car", "part_of", 0.8);

    auto candidates = orchestrator.infer("Car", {InverseRule{}}, 1);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].source_id, "Car");
    EXPECT_EQ(candidates[0].target_id, "Wheel");
    EXPECT_EQ(candidates[0].relation_type, "has_part");
    EXPECT_DOUBLE_EQ(candidates[0].confidence, 0.8);
    EXPECT_EQ(candidates[0].derivation_path(), std::vector<std::string>{wheel_car});
}

TEST_F(InferenceOrchestratorTest, EquivalencePropagates) {
    assert_edge("Feline", "Cat", "equivalent_to");
    assert_edge("Cat", "Mammal", "is_a");

    auto candidates = orchestrator.infer("Feline", all_rules(), 2);
    const auto* c = find_candidate(candidates, "Feline", "Mammal", "is_a");
    ASSERT_NE(c, nullptr);
    EXPECT_NEAR(c->confidence, 0.9, 1e-12);
}

// ==========================================
// Property Tests
// ==========================================

TEST_F(InferenceOrchestratorTest, Idempotent) {
    build_chain();

    auto first = orchestrator.infer("A", all_rules(), 3);
    size_t size_after_first = store.size();

    InferenceRequest request;
    request.source_id = "A";
    request.rules = all_rules();
    request.max_depth = 3;
    InferenceResult second = orchestrator.run(request);

    EXPECT_EQ(store.size(), size_after_first);
    ASSERT_EQ(second.candidates.size(), first.size());
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(second.candidates[i].id, first[i].id);
        EXPECT_DOUBLE_EQ(second.candidates[i].confidence, first[i].confidence);
    }
    EXPECT_EQ(second.stats.inserted, 0u);
    EXPECT_EQ(second.stats.merged, first.size());
}

TEST_F(InferenceOrchestratorTest, MonotonicUnderNewEdges) {
    assert_edge("A", "B", "is_a", 0.5);
    assert_edge("B", "C", "is_a", 0.5);

    std::map<std::string, double> before;
    for (const auto& c : orchestrator.infer("A", all_rules(), 3)) {
        before[c.key(store.types()).to_string()] = c.confidence;
    }
    ASSERT_FALSE(before.empty());

    // A stronger alternative and an unrelated weak edge
    assert_edge("A", "X", "is_a", 1.0);
    assert_edge("X", "C", "is_a", 1.0);
    assert_edge("C", "Y", "is_a", 0.1);

    std::map<std::string, double> after;
    for (const auto& c : orchestrator.infer("A", all_rules(), 3)) {
        after[c.key(store.types()).to_string()] = c.confidence;
    }

    for (const auto& [key, confidence] : before) {
        ASSERT_TRUE(after.count(key) > 0) << key;
        EXPECT_GE(after[key], confidence) << key;
    }

    auto ac = store.find("A", "C", "is_a");
    ASSERT_TRUE(ac.has_value());
    EXPECT_NEAR(ac->confidence, 0.9, 1e-12);
}

TEST_F(InferenceOrchestratorTest, CycleYieldsNoSelfLoops) {
    assert_edge("A", "B", "is_a");
    assert_edge("B", "C", "is_a");
    assert_edge("C", "A", "is_a");

    InferenceRequest request;
    request.source_id = "A";
    request.rules = all_rules();
    request.max_depth = 5;
    InferenceResult result = orchestrator.run(request);

    EXPECT_GT(result.stats.cycles_rejected, 0u);
    for (const auto& c : result.candidates) {
        EXPECT_NE(c.source_id, c.target_id);
    }
    for (const auto& r : store.export_all()) {
        EXPECT_FALSE(r.is_self_loop()) << r.id;
    }
    EXPECT_NE(find_candidate(result.candidates, "A", "C", "is_a"), nullptr);
}

TEST_F(InferenceOrchestratorTest, SymmetricEdgeNotDuplicated) {
    std::string id = assert_edge("A", "B", "related_to", 0.7);

    auto candidates = orchestrator.infer("B", all_rules(), 3);
    EXPECT_EQ(find_candidate(candidates, "B", "A", "related_to"), nullptr);
    EXPECT_EQ(store.size(), 1u);

    auto found = store.find("B", "A", "related_to");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, id);
}

TEST_F(InferenceOrchestratorTest, ConfirmedEdgeIsNeverOverwritten) {
    assert_edge("Cat", "Mammal", "is_a");
    assert_edge("Mammal", "Animal", "is_a");
    std::string direct = assert_edge("Cat", "Animal", "is_a", 0.5);

    InferenceRequest request;
    request.source_id = "Cat";
    request.rules = {TransitiveRule{}};
    request.max_depth = 2;
    InferenceResult result = orchestrator.run(request);

    EXPECT_EQ(find_candidate(result.candidates, "Cat", "Animal", "is_a"), nullptr);
    EXPECT_EQ(result.stats.dropped_confirmed, 1u);

    auto stored = store.get(direct);
    ASSERT_TRUE(stored.has_value());
    EXPECT_DOUBLE_EQ(stored->confidence, 0.5);
    EXPECT_EQ(stored->provenance, Provenance::Asserted);
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(InferenceOrchestratorTest, ProvisionalEdgesAreNotPremises) {
    build_chain();
    auto first = orchestrator.infer("A", {TransitiveRule{}}, 2);
    ASSERT_EQ(first.size(), 1u);

    auto candidates = orchestrator.infer("A", {TransitiveRule{}}, 3);
    const auto* ad = find_candidate(candidates, "A", "D", "is_a");
    ASSERT_NE(ad, nullptr);
    EXPECT_EQ(ad->derivation_path(), (std::vector<std::string>{e1, e2, e3}));
}

TEST_F(InferenceOrchestratorTest, MinConfidenceFilters) {
    InferenceConfig config;
    config.min_confidence = 0.85;
    InferenceOrchestrator strict(store, config);
    build_chain();

    auto candidates = strict.infer("A", {TransitiveRule{}}, 3);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].target_id, "C");
}

TEST_F(InferenceOrchestratorTest, InvalidDecayThrows) {
    InferenceConfig zero;
    zero.decay = 0.0;
    EXPECT_THROW(InferenceOrchestrator(store, zero), std::invalid_argument);

    InferenceConfig above;
    above.decay = 1.5;
    EXPECT_THROW(InferenceOrchestrator(store, above), std::invalid_argument);
}

// ==========================================
// Run Options Tests
// ==========================================

TEST_F(InferenceOrchestratorTest, DryRunWritesNothing) {
    build_chain();

    InferenceRequest request;
    request.source_id = "A";
    request.max_depth = 3;
    request.persist = false;
    InferenceResult result = orchestrator.run(request);

    EXPECT_EQ(result.candidates.size(), 2u);
    EXPECT_EQ(store.size(), 3u);
    for (const auto& c : result.candidates) {
        EXPECT_TRUE(c.id.empty());
    }
}

TEST_F(InferenceOrchestratorTest, Statistics) {
    build_chain();

    InferenceRequest request;
    request.source_id = "A";
    request.rules = {TransitiveRule{}};
    request.max_depth = 10;
    InferenceResult result = orchestrator.run(request);

    EXPECT_EQ(result.stats.edges_read, 3u);
    EXPECT_TRUE(result.stats.fixed_point || result.stats.hops == 3);
    EXPECT_EQ(result.stats.candidates_proposed, 2u);
    EXPECT_EQ(result.stats.inserted, 2u);
    EXPECT_GE(result.stats.elapsed_ms, 0.0);
    EXPECT_EQ(result.stats.to_json()["inserted"], 2);
}

TEST_F(InferenceOrchestratorTest, CancelledBeforeStart) {
    build_chain();
    CancellationToken token;
    token.cancel();

    InferenceRequest request;
    request.source_id = "A";
    request.max_depth = 3;
    InferenceResult result = orchestrator.run(request, &token);

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(InferenceOrchestratorTest, CancelledMidTraversalPersistsNothing) {
    build_chain();
    CancellationToken token;

    orchestrator.set_progress_callback([&](const std::string&, int, int, const std::string&) {
        token.cancel();
    });

    InferenceRequest request;
    request.source_id = "A";
    request.max_depth = 3;
    InferenceResult result = orchestrator.run(request, &token);

    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.candidates.empty());
    EXPECT_TRUE(store.list(StatusFilter::Provisional).empty());

    // A fresh token runs to completion
    token.reset();
    orchestrator.set_progress_callback(nullptr);
    EXPECT_EQ(orchestrator.run(request, &token).candidates.size(), 2u);
}

TEST(InferenceOrchestratorFailureTest, StoreFailureLeavesNoPartialWrites) {
    FlakyStore store;
    store.put(make_asserted("A", "B", "is_a"));
    store.put(make_asserted("B", "C", "is_a"));
    store.put(make_asserted("C", "D", "is_a"));

    InferenceOrchestrator orchestrator(store);

    store.fail_writes = true;
    EXPECT_THROW(orchestrator.infer("A", all_rules(), 3), StoreUnavailableError);
    store.fail_writes = false;
    EXPECT_TRUE(store.list(StatusFilter::Provisional).empty());

    store.fail_reads = true;
    EXPECT_THROW(orchestrator.infer("A", all_rules(), 3), StoreUnavailableError);
    store.fail_reads = false;
    EXPECT_EQ(store.size(), 3u);
}

TEST_F(InferenceOrchestratorTest, WeakerChainStillReachesTermsTheBestChainVisited) {
    // The best chain to B runs A = C -> B, so it cannot continue to C;
    // the weaker A -> D -> E -> B chain can.
    std::string ac = assert_edge("A", "C", "equivalent_to");
    std::string cb = assert_edge("C", "B", "is_a");
    std::string ad = assert_edge("A", "D", "is_a");
    std::string de = assert_edge("D", "E", "is_a");
    std::string eb = assert_edge("E", "B", "is_a");
    std::string bc = assert_edge("B", "C", "is_a");

    auto candidates = orchestrator.infer("A", {TransitiveRule{}, EquivalencePropagationRule{}}, 4);
    ASSERT_EQ(candidates.size(), 3u);

    const auto* to_b = find_candidate(candidates, "A", "B", "is_a");
    ASSERT_NE(to_b, nullptr);
    EXPECT_NEAR(to_b->confidence, 0.9, 1e-12);
    EXPECT_EQ(to_b->derivation_path(), (std::vector<std::string>{ac, cb}));

    const auto* to_e = find_candidate(candidates, "A", "E", "is_a");
    ASSERT_NE(to_e, nullptr);
    EXPECT_NEAR(to_e->confidence, 0.9, 1e-12);

    const auto* to_c = find_candidate(candidates, "A", "C", "is_a");
    ASSERT_NE(to_c, nullptr);
    EXPECT_NEAR(to_c->confidence, 0.729, 1e-12);
    EXPECT_EQ(to_c->derivation_path(), (std::vector<std::string>{ad, de, eb, bc}));
}

// ==========================================
// Rederive Tests
// ==========================================

TEST_F(InferenceOrchestratorTest, RederiveFindsAlternative) {
    build_chain();
    std::string ax = assert_edge("A", "X", "is_a", 0.8);
    std::string xc = assert_edge("X", "C", "is_a");

    auto candidates = orchestrator.infer("A", {TransitiveRule{}}, 2);
    const auto* ac = find_candidate(candidates, "A", "C", "is_a");
    ASSERT_NE(ac, nullptr);
    EXPECT_EQ(ac->derivation_path(), (std::vector<std::string>{e1, e2}));

    Relation stored = *store.get(ac->id);
    auto alternative = orchestrator.rederive(stored, {e2});
    ASSERT_TRUE(alternative.has_value());
    EXPECT_EQ(alternative->id, stored.id);
    EXPECT_EQ(alternative->derivation_path(), (std::vector<std::string>{ax, xc}));
    EXPECT_NEAR(alternative->confidence, 0.72, 1e-12);

    EXPECT_FALSE(orchestrator.rederive(stored, {e2, xc}).has_value());
}
