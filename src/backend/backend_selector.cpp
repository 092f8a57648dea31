#include "backend/backend_selector.hpp"
#include "backend/migration.hpp"
#include "backend/mirrored_relation_store.hpp"
#include "store/memory_graph_store.hpp"
#include "store/sqlite_relation_store.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

namespace lexigraph {

std::string backend_kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Relational: return "relational";
        case BackendKind::Graph: return "graph";
        default: return "unknown";
    }
}

BackendKind string_to_backend_kind(const std::string& s) {
    if (s == "relational" || s == "sqlite") return BackendKind::Relational;
    if (s == "graph" || s == "memory") return BackendKind::Graph;
    throw std::invalid_argument("Unknown backend: " + s);
}

// ============================================================================
// BackendPolicy
// ============================================================================

bool BackendPolicy::validate(std::string& error_message) const {
    if (speedup_ratio <= 0.0 || speedup_ratio > 1.0) {
        error_message = "speedup_ratio must be in (0, 1]";
        return false;
    }
    if (benchmark_samples == 0) {
        error_message = "benchmark_samples must be positive";
        return false;
    }
    if (benchmark_depth <= 0) {
        error_message = "benchmark_depth must be positive";
        return false;
    }
    if (max_secondary_error_rate < 0.0 || max_secondary_error_rate > 1.0) {
        error_message = "max_secondary_error_rate must be in [0, 1]";
        return false;
    }
    return true;
}

nlohmann::json BackendPolicy::to_json() const {
    nlohmann::json j;
    j["edge_threshold"] = edge_threshold;
    j["speedup_ratio"] = speedup_ratio;
    j["benchmark_samples"] = benchmark_samples;
    j["benchmark_depth"] = benchmark_depth;
    j["max_secondary_error_rate"] = max_secondary_error_rate;
    j["min_writes_for_error_rate"] = min_writes_for_error_rate;
    return j;
}

BackendPolicy BackendPolicy::from_json(const nlohmann::json& j) {
    BackendPolicy policy;
    policy.edge_threshold = j.value("edge_threshold", policy.edge_threshold);
    policy.speedup_ratio = j.value("speedup_ratio", policy.speedup_ratio);
    policy.benchmark_samples = j.value("benchmark_samples", policy.benchmark_samples);
    policy.benchmark_depth = j.value("benchmark_depth", policy.benchmark_depth);
    policy.max_secondary_error_rate = j.value("max_secondary_error_rate", policy.max_secondary_error_rate);
    policy.min_writes_for_error_rate = j.value("min_writes_for_error_rate", policy.min_writes_for_error_rate);
    return policy;
}

// ============================================================================
// Reports
// ============================================================================

void BenchmarkReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Backend Benchmark\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "  Edges: " << edge_count << "\n";
    if (!ran) {
        std::cout << "  Not run (below threshold)\n";
        return;
    }
    std::cout << "  Sampled terms: " << samples << "\n";
    std::cout << "  Neighborhood depth: " << depth << "\n";
    std::cout << "  Relational p95: " << relational_p95_ms << " ms\n";
    std::cout << "  Graph p95: " << graph_p95_ms << " ms\n";
    std::cout << std::string(70, '=') << "\n";
}

nlohmann::json BenchmarkReport::to_json() const {
    nlohmann::json j;
    j["ran"] = ran;
    j["edge_count"] = edge_count;
    j["samples"] = samples;
    j["depth"] = depth;
    j["relational_p95_ms"] = relational_p95_ms;
    j["graph_p95_ms"] = graph_p95_ms;
    return j;
}

nlohmann::json BackendDecision::to_json() const {
    nlohmann::json j;
    j["backend"] = backend_kind_to_string(backend);
    j["reason"] = reason;
    j["benchmark"] = report.to_json();
    return j;
}

// ============================================================================
// BackendSelector
// ============================================================================

BackendSelector::BackendSelector(BackendPolicy policy) : policy_(policy) {
    std::string error;
    if (!policy_.validate(error)) {
        throw std::invalid_argument("Invalid backend policy: " + error);
    }
}

BackendDecision BackendSelector::evaluate(const RelationStore& relational, const RelationStore& graph) const {
    size_t edge_count = relational.size();

    if (edge_count <= policy_.edge_threshold) {
        BackendDecision decision;
        decision.report.edge_count = edge_count;
        decision.reason = std::to_string(edge_count) + " edges, threshold " +
                          std::to_string(policy_.edge_threshold) + " not exceeded";
        return decision;
    }

    if (graph.size() != edge_count) {
        BackendDecision decision;
        decision.report.edge_count = edge_count;
        decision.reason = "graph backend holds " + std::to_string(graph.size()) +
                          " edges, expected " + std::to_string(edge_count);
        return decision;
    }

    return decide(benchmark(relational, graph));
}

BenchmarkReport BackendSelector::benchmark(const RelationStore& relational, const RelationStore& graph) const {
    using clock = std::chrono::steady_clock;

    BenchmarkReport report;
    report.ran = true;
    report.edge_count = relational.size();
    report.depth = policy_.benchmark_depth;

    std::vector<std::string> sampled = sample_terms(relational.terms(), policy_.benchmark_samples);
    report.samples = sampled.size();

    std::vector<double> relational_ms;
    std::vector<double> graph_ms;
    relational_ms.reserve(sampled.size());
    graph_ms.reserve(sampled.size());

    // Interleaved so both backends see the same cache and load conditions
    for (const auto& term : sampled) {
        auto start = clock::now();
        relational.neighborhood(term, policy_.benchmark_depth, StatusFilter::Confirmed);
        auto middle = clock::now();
        graph.neighborhood(term, policy_.benchmark_depth, StatusFilter::Confirmed);
        auto end = clock::now();

        relational_ms.push_back(std::chrono::duration<double, std::milli>(middle - start).count());
        graph_ms.push_back(std::chrono::duration<double, std::milli>(end - middle).count());
    }

    report.relational_p95_ms = percentile(relational_ms, 0.95);
    report.graph_p95_ms = percentile(graph_ms, 0.95);
    return report;
}

BackendDecision BackendSelector::decide(const BenchmarkReport& report) const {
    BackendDecision decision;
    decision.report = report;

    if (!report.ran || report.samples == 0) {
        decision.reason = "no benchmark samples";
        return decision;
    }

    double limit = policy_.speedup_ratio * report.relational_p95_ms;
    if (report.graph_p95_ms < limit) {
        decision.backend = BackendKind::Graph;
        decision.reason = "graph p95 " + std::to_string(report.graph_p95_ms) + " ms < " +
                          std::to_string(limit) + " ms";
    } else {
        decision.reason = "graph p95 " + std::to_string(report.graph_p95_ms) + " ms not below " +
                          std::to_string(limit) + " ms";
    }
    return decision;
}

double BackendSelector::percentile(std::vector<double> values, double p) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());

    double rank = std::ceil(p * static_cast<double>(values.size()));
    size_t index = rank < 1.0 ? 0 : static_cast<size_t>(rank) - 1;
    return values[std::min(index, values.size() - 1)];
}

std::vector<std::string> BackendSelector::sample_terms(const std::vector<std::string>& terms, size_t count) {
    if (terms.size() <= count) {
        return terms;
    }

    std::vector<std::string> sampled;
    sampled.reserve(count);
    double stride = static_cast<double>(terms.size()) / static_cast<double>(count);
    for (size_t i = 0; i < count; i++) {
        sampled.push_back(terms[static_cast<size_t>(static_cast<double>(i) * stride)]);
    }
    return sampled;
}

// ============================================================================
// Backend construction
// ============================================================================

std::unique_ptr<RelationStore> open_backend(
    const std::string& backend,
    const std::string& database_path,
    const RelationTypeRegistry& types,
    const BackendPolicy& policy,
    bool verbose
) {
    if (backend != "auto") {
        // Validates the name
        string_to_backend_kind(backend);
    }

    auto relational = std::make_unique<SqliteRelationStore>(database_path, types);
    if (backend == "relational" || backend == "sqlite") {
        return relational;
    }
    if (backend == "auto" && relational->size() <= policy.edge_threshold) {
        if (verbose) {
            std::cout << "[backend] " << relational->size() << " edges, using relational backend\n";
        }
        return relational;
    }

    auto graph = std::make_unique<MemoryGraphStore>(types);
    MigrationReport loaded = migrate(*relational, *graph);
    if (verbose) {
        std::cout << "[backend] loaded " << loaded.imported << " edges into graph backend in "
                  << loaded.elapsed_ms << " ms\n";
    }

    if (backend == "auto") {
        BackendSelector selector(policy);
        BackendDecision decision = selector.evaluate(*relational, *graph);
        if (verbose) {
            std::cout << "[backend] " << backend_kind_to_string(decision.backend)
                      << ": " << decision.reason << "\n";
        }
        if (decision.backend == BackendKind::Relational) {
            return relational;
        }
    }

    return std::make_unique<MirroredRelationStore>(std::move(relational), std::move(graph), policy, verbose);
}

} // namespace lexigraph
