#include <gtest/gtest.h>
#include "inference/bulk_reinference.hpp"
#include "store/memory_graph_store.hpp"
#include "flaky_store.hpp"
#include <cstdio>
#include <fstream>

using namespace lexigraph;
using lexigraph::testing_support::FlakyStore;

namespace {

// A -> B -> C -> D -> E and X -> Y; terms sort as A B C D E X Y
void build_chains(RelationStore& store) {
    for (const auto& [source, target] : std::vector<std::pair<std::string, std::string>>{
             {"A", "B"}, {"B", "C"}, {"C", "D"}, {"D", "E"}, {"X", "Y"}}) {
        store.put(make_asserted(source, target, "is_a"));
    }
}

} // namespace

class BulkReinferenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        build_chains(store);
        checkpoint_path = ::testing::TempDir() + "lexigraph_bulk_checkpoint.json";
        std::remove(checkpoint_path.c_str());
    }

    void TearDown() override {
        std::remove(checkpoint_path.c_str());
    }

    BulkOptions options(size_t chunk_size) const {
        BulkOptions opts;
        opts.rules = {TransitiveRule{}};
        opts.max_depth = 3;
        opts.chunk_size = chunk_size;
        opts.checkpoint_path = checkpoint_path;
        return opts;
    }

    MemoryGraphStore store;
    InferenceOrchestrator orchestrator{store};
    std::string checkpoint_path;
};

// ==========================================
// Run Tests
// ==========================================

TEST_F(BulkReinferenceTest, RunAllTerms) {
    BulkReinference bulk(orchestrator, options(3));
    BulkReport report = bulk.run_all();

    EXPECT_FALSE(report.cancelled);
    EXPECT_EQ(report.chunks, 3u);
    EXPECT_TRUE(report.checkpoint.finished());
    EXPECT_EQ(report.checkpoint.total(), 7u);
    EXPECT_EQ(report.checkpoint.completed, 7u);
    EXPECT_EQ(report.checkpoint.candidates, 5u);
    EXPECT_TRUE(report.checkpoint.failed_term.empty());

    EXPECT_EQ(store.list(StatusFilter::Provisional).size(), 5u);
    EXPECT_TRUE(store.exists("A", "D", "is_a"));
    EXPECT_TRUE(store.exists("B", "E", "is_a"));
    EXPECT_FALSE(store.exists("A", "E", "is_a"));

    auto saved = BulkCheckpoint::load(checkpoint_path);
    ASSERT_TRUE(saved.has_value());
    EXPECT_TRUE(saved->finished());
    EXPECT_EQ(saved->run_id, report.checkpoint.run_id);
}

TEST_F(BulkReinferenceTest, RunSelectedTerms) {
    BulkReinference bulk(orchestrator, options(100));
    BulkReport report = bulk.run({"A", "X"});

    EXPECT_EQ(report.chunks, 1u);
    EXPECT_EQ(report.checkpoint.completed, 2u);
    EXPECT_EQ(report.checkpoint.candidates, 2u);
    EXPECT_EQ(store.list(StatusFilter::Provisional).size(), 2u);
}

TEST_F(BulkReinferenceTest, RerunIsIdempotent) {
    BulkReinference bulk(orchestrator, options(2));
    bulk.run_all();
    size_t size = store.size();

    BulkReport again = bulk.run_all();
    EXPECT_EQ(store.size(), size);
    EXPECT_EQ(again.checkpoint.candidates, 5u);
}

TEST_F(BulkReinferenceTest, ZeroChunkSizeThrows) {
    EXPECT_THROW(BulkReinference(orchestrator, options(0)), std::invalid_argument);
}

TEST_F(BulkReinferenceTest, ProgressIsReportedPerChunk) {
    BulkReinference bulk(orchestrator, options(3));

    std::vector<int> reported;
    bulk.set_progress_callback([&](const std::string& stage, int current, int total, const std::string&) {
        EXPECT_EQ(stage, "reinfer");
        EXPECT_EQ(total, 7);
        reported.push_back(current);
    });
    bulk.run_all();

    EXPECT_EQ(reported, (std::vector<int>{3, 6, 7}));
}

// ==========================================
// Cancellation & Resume Tests
// ==========================================

TEST_F(BulkReinferenceTest, CancelThenResume) {
    CancellationToken token;
    BulkReinference bulk(orchestrator, options(3));
    bulk.set_progress_callback([&](const std::string&, int, int, const std::string&) {
        token.cancel();
    });

    BulkReport first = bulk.run_all(&token);
    EXPECT_TRUE(first.cancelled);
    EXPECT_EQ(first.chunks, 1u);
    EXPECT_EQ(first.checkpoint.next_index, 3u);
    EXPECT_EQ(first.checkpoint.completed, 3u);
    EXPECT_FALSE(first.checkpoint.finished());

    // Resume from the file, as a restarted process would
    auto saved = BulkCheckpoint::load(checkpoint_path);
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->next_index, 3u);

    token.reset();
    BulkReinference resumed(orchestrator, options(3));
    BulkReport second = resumed.resume(*saved, &token);
    EXPECT_FALSE(second.cancelled);
    EXPECT_EQ(second.chunks, 2u);
    EXPECT_TRUE(second.checkpoint.finished());
    EXPECT_EQ(second.checkpoint.completed, 7u);
    EXPECT_EQ(second.checkpoint.run_id, first.checkpoint.run_id);

    // Same outcome as an uninterrupted run
    MemoryGraphStore fresh;
    build_chains(fresh);
    InferenceOrchestrator fresh_orchestrator(fresh);
    BulkOptions opts = options(3);
    opts.checkpoint_path.clear();
    BulkReinference(fresh_orchestrator, opts).run_all();

    auto expected = fresh.list(StatusFilter::Provisional);
    auto actual = store.list(StatusFilter::Provisional);
    ASSERT_EQ(actual.size(), expected.size());
    for (const auto& r : expected) {
        auto match = store.find(r.source_id, r.target_id, r.relation_type);
        ASSERT_TRUE(match.has_value()) << r.source_id << " -> " << r.target_id;
        EXPECT_DOUBLE_EQ(match->confidence, r.confidence);
    }
}

TEST_F(BulkReinferenceTest, CancelledBeforeStart) {
    CancellationToken token;
    token.cancel();

    BulkReinference bulk(orchestrator, options(3));
    BulkReport report = bulk.run_all(&token);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.checkpoint.next_index, 0u);
    EXPECT_TRUE(store.list(StatusFilter::Provisional).empty());
}

TEST(BulkReinferenceFailureTest, FailureRecordsTermAndResumes) {
    FlakyStore store;
    build_chains(store);
    InferenceOrchestrator orchestrator(store);

    BulkOptions options;
    options.rules = {TransitiveRule{}};
    options.chunk_size = 3;
    BulkReinference bulk(orchestrator, options);
    bulk.set_progress_callback([&](const std::string&, int current, int, const std::string&) {
        if (current == 3) store.fail_writes = true;
    });

    EXPECT_THROW(bulk.run_all(), StoreUnavailableError);
    BulkCheckpoint failed = bulk.checkpoint();
    EXPECT_EQ(failed.failed_term, "D");
    EXPECT_EQ(failed.next_index, 3u);
    EXPECT_NE(failed.error_message.find("injected"), std::string::npos);

    store.fail_writes = false;
    bulk.set_progress_callback(nullptr);
    BulkReport report = bulk.resume(failed);
    EXPECT_TRUE(report.checkpoint.finished());
    EXPECT_TRUE(report.checkpoint.failed_term.empty());
    EXPECT_EQ(report.checkpoint.completed, 7u);
    EXPECT_EQ(store.list(StatusFilter::Provisional).size(), 5u);
}

// ==========================================
// Checkpoint Tests
// ==========================================

TEST(BulkCheckpointTest, JsonRoundtrip) {
    BulkCheckpoint checkpoint;
    checkpoint.run_id = "bulk_test";
    checkpoint.terms = {"A", "B", "C"};
    checkpoint.next_index = 2;
    checkpoint.completed = 2;
    checkpoint.candidates = 4;
    checkpoint.failed_term = "C";
    checkpoint.error_message = "boom";

    BulkCheckpoint loaded = BulkCheckpoint::from_json(checkpoint.to_json());
    EXPECT_EQ(loaded.run_id, "bulk_test");
    EXPECT_EQ(loaded.terms, checkpoint.terms);
    EXPECT_EQ(loaded.next_index, 2u);
    EXPECT_EQ(loaded.candidates, 4u);
    EXPECT_EQ(loaded.failed_term, "C");
    EXPECT_FALSE(loaded.finished());
    EXPECT_EQ(checkpoint.to_json()["total"], 3);
}

TEST(BulkCheckpointTest, RejectsIndexPastEnd) {
    nlohmann::json j = {{"terms", {"A"}}, {"next_index", 5}};
    EXPECT_THROW(BulkCheckpoint::from_json(j), std::invalid_argument);
}

TEST(BulkCheckpointTest, LoadMissingFile) {
    EXPECT_FALSE(BulkCheckpoint::load(::testing::TempDir() + "lexigraph_no_such_checkpoint.json").has_value());
}

TEST(BulkCheckpointTest, SaveAndLoad) {
    std::string path = ::testing::TempDir() + "lexigraph_checkpoint_roundtrip.json";
    BulkCheckpoint checkpoint;
    checkpoint.run_id = "bulk_file";
    checkpoint.terms = {"A", "B"};
    checkpoint.next_index = 1;
    checkpoint.save(path);

    auto loaded = BulkCheckpoint::load(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->run_id, "bulk_file");
    EXPECT_EQ(loaded->next_index, 1u);
    std::remove(path.c_str());
}
