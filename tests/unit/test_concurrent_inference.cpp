#include <gtest/gtest.h>
#include "inference/inference_orchestrator.hpp"
#include "store/memory_graph_store.hpp"
#include "store/sqlite_relation_store.hpp"
#include <map>
#include <memory>
#include <set>
#include <thread>
#include <tuple>

using namespace lexigraph;

namespace {

using EdgeKey = std::tuple<std::string, std::string, std::string>;

std::map<EdgeKey, double> provisional_edges(const RelationStore& store) {
    std::map<EdgeKey, double> edges;
    for (const auto& r : store.list(StatusFilter::Provisional)) {
        edges[{r.source_id, r.target_id, r.relation_type}] = r.confidence;
    }
    return edges;
}

} // namespace

template <typename Store>
std::unique_ptr<RelationStore> make_store();

template <>
std::unique_ptr<RelationStore> make_store<MemoryGraphStore>() {
    return std::make_unique<MemoryGraphStore>();
}

template <>
std::unique_ptr<RelationStore> make_store<SqliteRelationStore>() {
    return std::make_unique<SqliteRelationStore>(":memory:");
}

template <typename Store>
class ConcurrentInferenceTest : public ::testing::Test {
protected:
    static constexpr int kThreads = 8;

    std::unique_ptr<RelationStore> store = make_store<Store>();

    // T0 -> T1 -> ... -> T6, plus Cat -> Mammal -> Animal -> Organism
    static void build_graph(RelationStore& target) {
        for (int i = 0; i < 6; i++) {
            target.put(make_asserted("T" + std::to_string(i), "T" + std::to_string(i + 1), "is_a"));
        }
        target.put(make_asserted("Cat", "Mammal", "is_a"));
        target.put(make_asserted("Mammal", "Animal", "is_a"));
        target.put(make_asserted("Animal", "Organism", "is_a", 0.8));
    }
};

using Backends = ::testing::Types<MemoryGraphStore, SqliteRelationStore>;
TYPED_TEST_SUITE(ConcurrentInferenceTest, Backends);

TYPED_TEST(ConcurrentInferenceTest, SameTermYieldsOneEdgePerKey) {
    this->build_graph(*this->store);
    InferenceOrchestrator orchestrator(*this->store);

    std::vector<std::vector<CandidateRelation>> results(TestFixture::kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < TestFixture::kThreads; i++) {
        threads.emplace_back([&, i] {
            results[i] = orchestrator.infer("Cat", {TransitiveRule{}}, 3);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto pending = this->store->list(StatusFilter::Provisional);
    ASSERT_EQ(pending.size(), 2u);

    std::set<EdgeKey> keys;
    std::set<std::string> ids;
    for (const auto& r : pending) {
        keys.insert({r.source_id, r.target_id, r.relation_type});
        ids.insert(r.id);
    }
    EXPECT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys.count({"Cat", "Animal", "is_a"}), 1u);
    EXPECT_EQ(keys.count({"Cat", "Organism", "is_a"}), 1u);

    // Every run reports the edge that was actually stored
    for (const auto& candidates : results) {
        ASSERT_EQ(candidates.size(), 2u);
        for (const auto& c : candidates) {
            EXPECT_EQ(ids.count(c.id), 1u) << c.source_id << " -> " << c.target_id;
        }
    }
}

TYPED_TEST(ConcurrentInferenceTest, DifferentTermsDoNotInterfere) {
    this->build_graph(*this->store);
    InferenceOrchestrator orchestrator(*this->store);

    std::vector<std::string> sources = {"T0", "T1", "T2", "T3", "Cat", "Mammal"};
    std::vector<std::thread> threads;
    for (const auto& source : sources) {
        threads.emplace_back([&orchestrator, source] {
            orchestrator.infer(source, {TransitiveRule{}}, 3);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::unique_ptr<RelationStore> sequential = make_store<TypeParam>();
    this->build_graph(*sequential);
    InferenceOrchestrator reference(*sequential);
    for (const auto& source : sources) {
        reference.infer(source, {TransitiveRule{}}, 3);
    }

    auto expected = provisional_edges(*sequential);
    auto actual = provisional_edges(*this->store);
    ASSERT_EQ(actual.size(), expected.size());
    for (const auto& [key, confidence] : expected) {
        auto it = actual.find(key);
        ASSERT_NE(it, actual.end()) << std::get<0>(key) << " -> " << std::get<1>(key);
        EXPECT_NEAR(it->second, confidence, 1e-12);
    }
}
