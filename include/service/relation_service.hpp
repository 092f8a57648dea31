#pragma once

#include "inference/inference_orchestrator.hpp"
#include "service/term_directory.hpp"
#include "store/relation_store.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lexigraph {

enum class Direction {
    Outgoing,
    Incoming,
    Both
};

std::string direction_to_string(Direction direction);
Direction string_to_direction(const std::string& s);

/**
 * @brief Outcome of deleting a relation and re-evaluating its dependents
 */
struct InvalidationReport {
    RelationError error = RelationError::None;
    std::optional<Relation> deleted;
    std::vector<Relation> rederived;    // Kept with an alternative derivation
    std::vector<Relation> retracted;    // Removed, no derivation remained

    bool success() const { return error == RelationError::None; }
    nlohmann::json to_json() const;
};

struct ServiceOptions {
    bool verify_terms = false;          // Reject assertions on unknown terms
    bool verbose = false;
};

/**
 * @brief Entry points used by clients and collaborating subsystems
 *
 * Assertions (direct or confirmed search suggestions), the confirmed-only
 * query surface, and deletion with cascading invalidation.
 */
class RelationService {
public:
    RelationService(
        RelationStore& store,
        InferenceOrchestrator& orchestrator,
        const TermDirectory& terms,
        ServiceOptions options = {}
    );

    /**
     * @brief Assert a confirmed relation
     *
     * @return PutResult with error None, Duplicate (existing id, confidence
     *         merged), InvalidType, or NotFound when term verification is on
     *         and a term is unknown
     * @throws std::invalid_argument for confidence outside [0, 1]
     */
    PutResult create_relation(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relation_type,
        double confidence = 1.0,
        const std::string& created_by = "",
        const std::string& metadata = ""
    );

    /**
     * @brief Confirmed relations of a term; provisional edges are never returned
     */
    std::vector<Relation> get_relations(
        const std::string& term_id,
        Direction direction = Direction::Both,
        const std::string& relation_type = ""
    ) const;

    /**
     * @brief Delete a relation, then re-evaluate every inferred edge that
     *        depended on it
     *
     * Each affected edge is kept if another derivation exists in the
     * remaining confirmed graph, otherwise removed; removals cascade to their
     * own dependents.
     */
    InvalidationReport delete_relation(const std::string& relation_id);

    bool term_exists(const std::string& term_id) const { return terms_.term_exists(term_id); }

private:
    RelationStore& store_;
    InferenceOrchestrator& orchestrator_;
    const TermDirectory& terms_;
    ServiceOptions options_;
};

} // namespace lexigraph
