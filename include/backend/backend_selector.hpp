#pragma once

#include "store/relation_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace lexigraph {

enum class BackendKind {
    Relational,
    Graph
};

std::string backend_kind_to_string(BackendKind kind);
BackendKind string_to_backend_kind(const std::string& s);

/**
 * @brief Thresholds for choosing and keeping the graph backend
 */
struct BackendPolicy {
    size_t edge_threshold = 5000;           ///< Benchmark only above this many edges
    double speedup_ratio = 0.5;             ///< Graph p95 must be below ratio * relational p95
    size_t benchmark_samples = 100;         ///< Terms sampled per benchmark
    int benchmark_depth = 3;                ///< Neighborhood depth measured
    double max_secondary_error_rate = 0.05; ///< Mirror failures tolerated before disabling
    size_t min_writes_for_error_rate = 20;  ///< Writes needed before the rate is trusted

    bool validate(std::string& error_message) const;

    nlohmann::json to_json() const;
    static BackendPolicy from_json(const nlohmann::json& j);
};

/**
 * @brief p95 latency of bounded neighborhood expansion on both backends
 */
struct BenchmarkReport {
    bool ran = false;
    size_t edge_count = 0;
    size_t samples = 0;
    int depth = 0;
    double relational_p95_ms = 0.0;
    double graph_p95_ms = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

struct BackendDecision {
    BackendKind backend = BackendKind::Relational;
    std::string reason;
    BenchmarkReport report;

    nlohmann::json to_json() const;
};

/**
 * @brief Measured-scale choice between the relational and graph backends
 *
 * Below the edge threshold the relational backend is kept without measuring.
 * Above it both backends (holding the same edges) are benchmarked and the
 * graph backend is adopted only if it is sufficiently faster.
 */
class BackendSelector {
public:
    explicit BackendSelector(BackendPolicy policy = {});

    const BackendPolicy& policy() const { return policy_; }

    BackendDecision evaluate(const RelationStore& relational, const RelationStore& graph) const;

    /**
     * @brief Time neighborhood() on sampled terms against both stores
     */
    BenchmarkReport benchmark(const RelationStore& relational, const RelationStore& graph) const;

    /**
     * @brief Apply the adoption rule to a finished benchmark
     */
    BackendDecision decide(const BenchmarkReport& report) const;

    // Nearest-rank percentile, p in [0, 1]; 0 for no values
    static double percentile(std::vector<double> values, double p);

    // Evenly spaced subset of `terms`, at most `count` long
    static std::vector<std::string> sample_terms(const std::vector<std::string>& terms, size_t count);

private:
    BackendPolicy policy_;
};

/**
 * @brief Open the configured backend
 *
 * "relational" opens SQLite at `database_path`. "graph" opens SQLite as the
 * source of truth and mirrors it into an in-memory graph store serving reads.
 * "auto" opens SQLite and adopts the mirrored graph only if the selector says
 * so.
 *
 * @throws std::invalid_argument for an unknown backend name
 * @throws StoreUnavailableError if the database cannot be opened
 */
std::unique_ptr<RelationStore> open_backend(
    const std::string& backend,
    const std::string& database_path,
    const RelationTypeRegistry& types,
    const BackendPolicy& policy,
    bool verbose = false
);

} // namespace lexigraph
