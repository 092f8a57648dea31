#pragma once

#include "inference/rule_engine.hpp"
#include "store/relation_store.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lexigraph {

// ============================================================================
// Inference Configuration
// ============================================================================

/**
 * @brief Configuration for the inference orchestrator
 */
struct InferenceConfig {
    double decay = 0.9;                         ///< Per-hop confidence multiplier
    double min_confidence = 0.0;                ///< Candidates below this are abandoned
    int max_depth = 3;                          ///< Default traversal depth
    std::vector<Rule> default_rules = all_rules();
    bool verbose = false;                       ///< Verbose logging
};

// ============================================================================
// Inference Statistics
// ============================================================================

/**
 * @brief Statistics from one inference run
 */
struct InferenceStatistics {
    int hops = 0;
    bool fixed_point = false;           ///< Stopped because no chain could be extended

    size_t edges_read = 0;              ///< Edges in the neighborhood snapshot
    size_t chains_extended = 0;
    size_t cycles_rejected = 0;
    size_t below_threshold = 0;

    size_t candidates_proposed = 0;     ///< Before deduplication against the store
    size_t inserted = 0;
    size_t merged = 0;
    size_t dropped_confirmed = 0;

    double elapsed_ms = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// Progress & Cancellation
// ============================================================================

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

/**
 * @brief Cooperative cancellation flag, checked at hop boundaries
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Inference Orchestrator
// ============================================================================

struct InferenceRequest {
    std::string source_id;
    std::vector<Rule> rules;
    int max_depth = 3;
    bool persist = true;                ///< false: compute candidates, write nothing
};

struct InferenceResult {
    std::vector<CandidateRelation> candidates;   ///< Sorted by confidence descending
    InferenceStatistics stats;
    bool cancelled = false;
};

/**
 * @brief Drives bounded breadth-first inference from one term
 *
 * Each call reads one consistent snapshot of the neighborhood, walks it hop by
 * hop with the rule engine, and commits the surviving candidates as
 * provisional edges in a single atomic store call. Calls share no traversal
 * state, so concurrent runs for different terms do not interfere.
 */
class InferenceOrchestrator {
public:
    InferenceOrchestrator(RelationStore& store, InferenceConfig config = {});

    /**
     * @brief Infer and persist provisional relations from a term
     *
     * @return Candidates as stored (with ids), sorted by confidence descending.
     *         Empty for max_depth <= 0 or a term without outgoing edges.
     * @throws StoreUnavailableError; nothing is persisted in that case
     */
    std::vector<CandidateRelation> infer(
        const std::string& source_id,
        const std::vector<Rule>& rules,
        int max_depth
    );

    /**
     * @brief Full form of infer() with statistics and cancellation
     *
     * A run cancelled before its commit persists nothing and returns
     * `cancelled = true` with no candidates.
     */
    InferenceResult run(const InferenceRequest& request, const CancellationToken* token = nullptr);

    /**
     * @brief Look for a derivation of an existing inferred edge
     *
     * Searches the confirmed graph without the edges in `excluded_ids` (and
     * without the edge itself). Nothing is written.
     *
     * @return Best alternative derivation, or nullopt if none remains
     */
    std::optional<CandidateRelation> rederive(
        const Relation& relation,
        const std::set<std::string>& excluded_ids
    );

    const InferenceConfig& config() const { return config_; }
    const RuleEngine& engine() const { return engine_; }
    RelationStore& store() { return store_; }

    void set_progress_callback(ProgressCallback callback);

private:
    struct Traversal {
        DerivationArena arena;
        BestChains best;
        bool cancelled = false;
    };

    // Breadth-first hops over a snapshot; fills stats
    void traverse(
        const std::string& source_id,
        const std::vector<Relation>& edges,
        const std::vector<Rule>& rules,
        int max_depth,
        const CancellationToken* token,
        Traversal& traversal,
        InferenceStatistics& stats
    ) const;

    void report_progress(const std::string& stage, int current, int total, const std::string& message) const;

    RelationStore& store_;
    InferenceConfig config_;
    RuleEngine engine_;
    ProgressCallback progress_callback_;
};

} // namespace lexigraph
