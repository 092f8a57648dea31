#include <gtest/gtest.h>
#include "review/review_queue.hpp"
#include "inference/inference_orchestrator.hpp"
#include "store/memory_graph_store.hpp"
#include "store/sqlite_relation_store.hpp"

using namespace lexigraph;

class ReviewQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.put(make_asserted("Cat", "Mammal", "is_a"));
        store.put(make_asserted("Mammal", "Animal", "is_a"));
        store.put(make_asserted("Animal", "Organism", "is_a"));
    }

    // Cat is_a Animal (0.9) and Cat is_a Organism (0.81)
    std::vector<CandidateRelation> infer_from_cat() {
        return orchestrator.infer("Cat", {TransitiveRule{}}, 3);
    }

    MemoryGraphStore store;
    InferenceOrchestrator orchestrator{store};
    ReviewQueue queue{store};
};

// ==========================================
// Pending Tests
// ==========================================

TEST_F(ReviewQueueTest, PendingListsProvisionalOnly) {
    EXPECT_TRUE(queue.get_pending().empty());

    auto candidates = infer_from_cat();
    ASSERT_EQ(candidates.size(), 2u);

    auto pending = queue.get_pending();
    ASSERT_EQ(pending.size(), 2u);
    for (const auto& r : pending) {
        EXPECT_EQ(r.status, RelationStatus::Provisional);
        EXPECT_EQ(r.provenance, Provenance::Inferred);
        EXPECT_FALSE(r.derivation.empty());
    }

    EXPECT_EQ(queue.get_pending(1).size(), 1u);
}

// ==========================================
// Resolve Tests
// ==========================================

TEST_F(ReviewQueueTest, ApproveConfirms) {
    auto candidates = infer_from_cat();
    const std::string id = candidates[0].id;

    ResolveResult result = queue.resolve(id, ReviewDecision::Approve, std::nullopt, "alice");
    ASSERT_TRUE(result.success()) << result.error_message;
    ASSERT_TRUE(result.relation.has_value());
    EXPECT_EQ(result.relation->status, RelationStatus::Confirmed);

    auto stored = store.get(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, RelationStatus::Confirmed);
    EXPECT_EQ(stored->provenance, Provenance::Inferred);
    EXPECT_DOUBLE_EQ(stored->confidence, candidates[0].confidence);
    EXPECT_EQ(stored->created_by, "alice");
    EXPECT_EQ(stored->derivation_path(), candidates[0].derivation_path());

    EXPECT_EQ(queue.get_pending().size(), 1u);
}

TEST_F(ReviewQueueTest, ApproveWithConfidenceOverride) {
    auto candidates = infer_from_cat();
    const std::string id = candidates[1].id;

    ResolveResult result = queue.resolve(id, ReviewDecision::Approve, 0.95);
    ASSERT_TRUE(result.success());
    EXPECT_DOUBLE_EQ(store.get(id)->confidence, 0.95);
}

TEST_F(ReviewQueueTest, InvalidConfidenceThrows) {
    auto candidates = infer_from_cat();
    EXPECT_THROW(queue.resolve(candidates[0].id, ReviewDecision::Approve, 1.5), std::invalid_argument);
    EXPECT_THROW(queue.resolve(candidates[0].id, ReviewDecision::Approve, -0.1), std::invalid_argument);
    EXPECT_EQ(store.get(candidates[0].id)->status, RelationStatus::Provisional);
}

TEST_F(ReviewQueueTest, RejectDeletes) {
    auto candidates = infer_from_cat();
    const std::string id = candidates[0].id;

    ResolveResult result = queue.resolve(id, ReviewDecision::Reject);
    ASSERT_TRUE(result.success());
    ASSERT_TRUE(result.relation.has_value());
    EXPECT_EQ(result.relation->id, id);

    EXPECT_FALSE(store.get(id).has_value());
    EXPECT_FALSE(store.exists("Cat", "Animal", "is_a"));
    EXPECT_EQ(store.size(), 4u);
}

TEST_F(ReviewQueueTest, UnknownIdIsNotFound) {
    ResolveResult result = queue.resolve("rel_missing", ReviewDecision::Approve);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, RelationError::NotFound);
    EXPECT_FALSE(result.relation.has_value());
}

TEST_F(ReviewQueueTest, SecondResolveIsAlreadyResolved) {
    auto candidates = infer_from_cat();
    const std::string id = candidates[0].id;

    ASSERT_TRUE(queue.resolve(id, ReviewDecision::Approve).success());
    EXPECT_EQ(queue.resolve(id, ReviewDecision::Approve).error, RelationError::AlreadyResolved);
    EXPECT_EQ(queue.resolve(id, ReviewDecision::Reject).error, RelationError::AlreadyResolved);
    EXPECT_TRUE(store.get(id).has_value());

    // Rejected edges are gone entirely
    const std::string other = candidates[1].id;
    ASSERT_TRUE(queue.resolve(other, ReviewDecision::Reject).success());
    EXPECT_EQ(queue.resolve(other, ReviewDecision::Reject).error, RelationError::NotFound);
}

TEST_F(ReviewQueueTest, AssertedEdgesCannotBeReviewed) {
    auto asserted = store.find("Cat", "Mammal", "is_a");
    ASSERT_TRUE(asserted.has_value());
    EXPECT_EQ(queue.resolve(asserted->id, ReviewDecision::Reject).error, RelationError::AlreadyResolved);
    EXPECT_TRUE(store.get(asserted->id).has_value());
}

TEST_F(ReviewQueueTest, RejectedEdgeIsProposedAgain) {
    auto first = infer_from_cat();
    const CandidateRelation rejected = first[0];
    ASSERT_TRUE(queue.resolve(rejected.id, ReviewDecision::Reject).success());

    auto second = infer_from_cat();
    ASSERT_EQ(second.size(), 2u);

    auto again = store.find(rejected.source_id, rejected.target_id, rejected.relation_type);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->status, RelationStatus::Provisional);
    EXPECT_NE(again->id, rejected.id);
    EXPECT_EQ(queue.get_pending().size(), 2u);
}

TEST_F(ReviewQueueTest, ApprovedEdgeIsNotReproposed) {
    auto first = infer_from_cat();
    for (const auto& c : first) {
        ASSERT_TRUE(queue.resolve(c.id, ReviewDecision::Approve).success());
    }

    EXPECT_TRUE(infer_from_cat().empty());
    EXPECT_TRUE(queue.get_pending().empty());
}

// ==========================================
// Statistics Tests
// ==========================================

TEST_F(ReviewQueueTest, Statistics) {
    ReviewStats empty = queue.statistics();
    EXPECT_EQ(empty.pending, 0u);
    EXPECT_DOUBLE_EQ(empty.approval_rate, 0.0);

    auto candidates = infer_from_cat();
    EXPECT_EQ(queue.statistics().pending, 2u);

    queue.resolve(candidates[0].id, ReviewDecision::Approve);
    queue.resolve(candidates[1].id, ReviewDecision::Reject);
    queue.resolve("rel_missing", ReviewDecision::Approve);

    ReviewStats stats = queue.statistics();
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_EQ(stats.approved, 1u);
    EXPECT_EQ(stats.rejected, 1u);
    EXPECT_DOUBLE_EQ(stats.approval_rate, 0.5);
    EXPECT_EQ(stats.to_json()["approved"], 1);
}

TEST(ReviewDecisionTest, Conversions) {
    EXPECT_EQ(string_to_review_decision("approve"), ReviewDecision::Approve);
    EXPECT_EQ(string_to_review_decision("rejected"), ReviewDecision::Reject);
    EXPECT_EQ(review_decision_to_string(ReviewDecision::Reject), "reject");
    EXPECT_THROW(string_to_review_decision("maybe"), std::invalid_argument);
}

TEST(ReviewQueueSqliteTest, ApproveAndReject) {
    SqliteRelationStore store(":memory:");
    store.put(make_asserted("A", "B", "is_a"));
    store.put(make_asserted("B", "C", "is_a"));
    store.put(make_asserted("C", "D", "is_a"));

    InferenceOrchestrator orchestrator(store);
    ReviewQueue queue(store);

    auto candidates = orchestrator.infer("A", {TransitiveRule{}}, 3);
    ASSERT_EQ(candidates.size(), 2u);

    ASSERT_TRUE(queue.resolve(candidates[0].id, ReviewDecision::Approve, 0.7, "bob").success());
    ASSERT_TRUE(queue.resolve(candidates[1].id, ReviewDecision::Reject).success());

    auto approved = store.get(candidates[0].id);
    ASSERT_TRUE(approved.has_value());
    EXPECT_EQ(approved->status, RelationStatus::Confirmed);
    EXPECT_DOUBLE_EQ(approved->confidence, 0.7);
    EXPECT_EQ(approved->created_by, "bob");
    EXPECT_EQ(approved->derivation.size(), 2u);

    EXPECT_FALSE(store.get(candidates[1].id).has_value());
    EXPECT_TRUE(queue.get_pending().empty());
}
