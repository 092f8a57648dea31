#pragma once

#include "graph/relation.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lexigraph {

/**
 * @brief A proposed relation produced by the rule engine
 *
 * Not persisted until the orchestrator commits it; `id` is empty until then
 * and afterwards holds the id of the stored provisional edge.
 */
struct CandidateRelation {
    std::string id;
    std::string source_id;
    std::string target_id;
    std::string relation_type;
    double confidence = 0.0;
    std::vector<DerivationStep> derivation;
    std::string earliest_created_at;        // Oldest constituent, used for tie-breaks

    std::vector<std::string> derivation_path() const;

    RelationKey key(const RelationTypeRegistry& types) const {
        return canonical_key(source_id, target_id, relation_type, types);
    }

    /**
     * @brief Provisional, inferred relation ready for the store
     */
    Relation to_relation() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Tie-break between two derivations of the same key
 *
 * Highest confidence, then shortest derivation, then the derivation whose
 * oldest constituent was created first, then the lexicographically smaller
 * path so that results never depend on traversal order.
 */
bool better_candidate(const CandidateRelation& a, const CandidateRelation& b);

/**
 * @brief Order for returned candidates: confidence descending, then key
 */
void sort_candidates(std::vector<CandidateRelation>& candidates);

} // namespace lexigraph
