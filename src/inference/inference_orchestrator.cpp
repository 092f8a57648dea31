#include "inference/inference_orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace lexigraph {

// ============================================================================
// InferenceStatistics
// ============================================================================

void InferenceStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Inference Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Traversal:\n";
    std::cout << "  Hops: " << hops << (fixed_point ? " (fixed point)" : "") << "\n";
    std::cout << "  Edges read: " << edges_read << "\n";
    std::cout << "  Chains extended: " << chains_extended << "\n";
    std::cout << "  Cycles rejected: " << cycles_rejected << "\n";
    std::cout << "  Below threshold: " << below_threshold << "\n\n";

    std::cout << "Candidates:\n";
    std::cout << "  Proposed: " << candidates_proposed << "\n";
    std::cout << "  Inserted: " << inserted << "\n";
    std::cout << "  Merged: " << merged << "\n";
    std::cout << "  Dropped (already confirmed): " << dropped_confirmed << "\n\n";

    std::cout << "Time: " << elapsed_ms << " ms\n";
    std::cout << std::string(70, '=') << "\n";
}

nlohmann::json InferenceStatistics::to_json() const {
    nlohmann::json j;
    j["hops"] = hops;
    j["fixed_point"] = fixed_point;
    j["edges_read"] = edges_read;
    j["chains_extended"] = chains_extended;
    j["cycles_rejected"] = cycles_rejected;
    j["below_threshold"] = below_threshold;
    j["candidates_proposed"] = candidates_proposed;
    j["inserted"] = inserted;
    j["merged"] = merged;
    j["dropped_confirmed"] = dropped_confirmed;
    j["elapsed_ms"] = elapsed_ms;
    return j;
}

// ============================================================================
// InferenceOrchestrator
// ============================================================================

InferenceOrchestrator::InferenceOrchestrator(RelationStore& store, InferenceConfig config)
    : store_(store),
      config_(std::move(config)),
      engine_(store.types(), RuleEngineConfig{config_.decay, config_.min_confidence}) {
    if (config_.decay <= 0.0 || config_.decay > 1.0) {
        throw std::invalid_argument("Decay must be in (0, 1]");
    }
    if (config_.default_rules.empty()) {
        config_.default_rules = all_rules();
    }
}

void InferenceOrchestrator::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void InferenceOrchestrator::report_progress(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) const {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }
}

std::vector<CandidateRelation> InferenceOrchestrator::infer(
    const std::string& source_id,
    const std::vector<Rule>& rules,
    int max_depth
) {
    InferenceRequest request;
    request.source_id = source_id;
    request.rules = rules;
    request.max_depth = max_depth;
    return run(request).candidates;
}

InferenceResult InferenceOrchestrator::run(const InferenceRequest& request, const CancellationToken* token) {
    auto start_time = std::chrono::steady_clock::now();
    auto finish = [&](InferenceResult& result) {
        auto end_time = std::chrono::steady_clock::now();
        result.stats.elapsed_ms =
            std::chrono::duration<double, std::milli>(end_time - start_time).count();
    };

    InferenceResult result;
    if (request.max_depth <= 0) {
        return result;
    }
    if (token && token->cancelled()) {
        result.cancelled = true;
        return result;
    }

    const std::vector<Rule>& rules = request.rules.empty() ? config_.default_rules : request.rules;

    // One consistent read; every hop below works on this snapshot
    std::vector<Relation> edges =
        store_.neighborhood(request.source_id, request.max_depth, StatusFilter::Confirmed);
    result.stats.edges_read = edges.size();

    if (config_.verbose) {
        std::cout << "[infer] " << request.source_id << ": " << edges.size()
                  << " confirmed edges within " << request.max_depth << " hops\n";
    }

    Traversal traversal;
    traverse(request.source_id, edges, rules, request.max_depth, token, traversal, result.stats);

    if (traversal.cancelled) {
        if (config_.verbose) {
            std::cout << "[infer] " << request.source_id << ": cancelled after "
                      << result.stats.hops << " hops, nothing persisted\n";
        }
        result.cancelled = true;
        finish(result);
        return result;
    }

    std::vector<CandidateRelation> proposed;
    for (const auto& chain : traversal.best.chains()) {
        if (engine_.is_candidate(chain)) {
            proposed.push_back(engine_.to_candidate(chain, traversal.arena));
        } else if (chain.inverse_reading) {
            result.stats.below_threshold++;
        }
    }
    result.stats.candidates_proposed = proposed.size();

    // Last chance to stop before anything is written
    if (token && token->cancelled()) {
        result.cancelled = true;
        finish(result);
        return result;
    }

    if (request.persist) {
        std::vector<Relation> relations;
        relations.reserve(proposed.size());
        for (const auto& candidate : proposed) {
            relations.push_back(candidate.to_relation());
        }

        std::vector<CommitOutcome> outcomes = store_.commit_provisional(relations);

        for (size_t i = 0; i < outcomes.size(); i++) {
            const auto& outcome = outcomes[i];
            CandidateRelation candidate = proposed[i];

            switch (outcome.kind) {
                case CommitKind::DroppedConfirmed:
                    result.stats.dropped_confirmed++;
                    continue;
                case CommitKind::Merged:
                    result.stats.merged++;
                    break;
                case CommitKind::Inserted:
                    result.stats.inserted++;
                    break;
            }

            candidate.id = outcome.relation.id;
            candidate.confidence = outcome.relation.confidence;
            candidate.derivation = outcome.relation.derivation;
            result.candidates.push_back(std::move(candidate));
        }
    } else {
        for (auto& candidate : proposed) {
            auto existing = store_.find(candidate.source_id, candidate.target_id, candidate.relation_type);
            if (existing && existing->is_confirmed()) {
                result.stats.dropped_confirmed++;
                continue;
            }
            if (existing) {
                candidate.id = existing->id;
                candidate.confidence = std::max(candidate.confidence, existing->confidence);
            }
            result.candidates.push_back(std::move(candidate));
        }
    }

    sort_candidates(result.candidates);
    finish(result);

    if (config_.verbose) {
        std::cout << "[infer] " << request.source_id << ": " << result.candidates.size()
                  << " candidates (" << result.stats.inserted << " new, "
                  << result.stats.merged << " merged, "
                  << result.stats.dropped_confirmed << " already confirmed, "
                  << result.stats.cycles_rejected << " cycles rejected)\n";
    }

    return result;
}

std::optional<CandidateRelation> InferenceOrchestrator::rederive(
    const Relation& relation,
    const std::set<std::string>& excluded_ids
) {
    int depth = std::max(config_.max_depth, static_cast<int>(relation.derivation.size()));

    std::vector<Relation> edges;
    for (auto& edge : store_.neighborhood(relation.source_id, depth, StatusFilter::Confirmed)) {
        if (edge.id == relation.id || excluded_ids.count(edge.id) > 0) continue;
        edges.push_back(std::move(edge));
    }

    Traversal traversal;
    InferenceStatistics stats;
    traverse(relation.source_id, edges, config_.default_rules, depth, nullptr, traversal, stats);

    RelationKey wanted = canonical_key(relation, store_.types());
    std::optional<CandidateRelation> best;

    for (const auto& chain : traversal.best.chains()) {
        if (!engine_.is_candidate(chain)) continue;

        CandidateRelation candidate = engine_.to_candidate(chain, traversal.arena);
        if (!(candidate.key(store_.types()) == wanted)) continue;

        if (!best || better_candidate(candidate, *best)) {
            best = std::move(candidate);
        }
    }

    if (best) {
        best->id = relation.id;
    }
    return best;
}

void InferenceOrchestrator::traverse(
    const std::string& source_id,
    const std::vector<Relation>& edges,
    const std::vector<Rule>& rules,
    int max_depth,
    const CancellationToken* token,
    Traversal& traversal,
    InferenceStatistics& stats
) const {
    PremiseIndex premises(edges, rules, store_.types());
    ExpansionStats expansion;

    // Hop 1: the source's own edges
    std::vector<Chain> frontier = engine_.seed(source_id, premises, traversal.arena, expansion);
    if (!frontier.empty()) {
        stats.hops = 1;
    }

    // Every chain keeps growing; BestChains only decides which one is proposed.
    // A weaker chain may still reach terms the best chain's path has visited.
    for (const auto& chain : frontier) {
        traversal.best.offer(chain, engine_, traversal.arena);
    }

    for (int hop = 2; hop <= max_depth && !frontier.empty(); hop++) {
        if (token && token->cancelled()) {
            traversal.cancelled = true;
            break;
        }

        report_progress("infer", hop, max_depth,
            source_id + ": " + std::to_string(frontier.size()) + " chains in frontier");

        std::vector<Chain> next = engine_.expand(frontier, premises, rules, traversal.arena, expansion);
        stats.hops = hop;

        if (next.empty()) {
            stats.fixed_point = true;
            break;
        }
        for (const auto& chain : next) {
            traversal.best.offer(chain, engine_, traversal.arena);
        }
        frontier = std::move(next);
    }

    stats.chains_extended += expansion.chains_extended;
    stats.cycles_rejected += expansion.cycles_rejected;
    stats.below_threshold += expansion.below_threshold;
}

} // namespace lexigraph
