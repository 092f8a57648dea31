#ifndef LEXIGRAPH_RELATION_HPP
#define LEXIGRAPH_RELATION_HPP

#include "graph/relation_types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace lexigraph {

/**
 * @brief How a relation came into existence
 */
enum class Provenance {
    Asserted,   // Created directly by a user action
    Inferred    // Produced by the rule engine
};

/**
 * @brief Visibility of a relation to query consumers
 */
enum class RelationStatus {
    Confirmed,    // Visible to consumers
    Provisional   // Awaiting a review decision
};

/**
 * @brief Status filter for store queries
 */
enum class StatusFilter {
    Any,
    Confirmed,
    Provisional
};

/**
 * @brief Structural errors returned as typed results at component boundaries
 */
enum class RelationError {
    None,
    Duplicate,         // Same key already stored; confidence merged, existing id returned
    InvalidType,       // Unknown relation type or type/direction mismatch
    NotFound,          // Missing relation id (or unknown term when terms are verified)
    AlreadyResolved    // Review decision on an edge that is no longer provisional
};

std::string provenance_to_string(Provenance provenance);
Provenance string_to_provenance(const std::string& s);

std::string status_to_string(RelationStatus status);
RelationStatus string_to_status(const std::string& s);

std::string relation_error_to_string(RelationError error);

bool status_matches(StatusFilter filter, RelationStatus status);

/**
 * @brief One constituent of a derivation
 *
 * `rule` is the rule that joined this constituent into the proof ("seed" for
 * the first step). `via` is "symmetric" or "inverse" when the stored edge was
 * read against its stored direction, empty otherwise.
 */
struct DerivationStep {
    std::string relation_id;
    std::string rule;
    std::string via;

    bool operator==(const DerivationStep& other) const {
        return relation_id == other.relation_id && rule == other.rule && via == other.via;
    }

    nlohmann::json to_json() const;
    static DerivationStep from_json(const nlohmann::json& j);
};

/**
 * @brief Uniqueness key of a stored relation
 *
 * For symmetric types the key is direction-free: source_id holds the smaller
 * of the two term ids (see canonical_key()).
 */
struct RelationKey {
    std::string source_id;
    std::string target_id;
    std::string relation_type;

    bool operator<(const RelationKey& other) const {
        if (source_id != other.source_id) return source_id < other.source_id;
        if (target_id != other.target_id) return target_id < other.target_id;
        return relation_type < other.relation_type;
    }

    bool operator==(const RelationKey& other) const {
        return source_id == other.source_id &&
               target_id == other.target_id &&
               relation_type == other.relation_type;
    }

    std::string to_string() const;
};

/**
 * @brief A typed, directed, weighted edge between two terms
 *
 * Terms are opaque identifiers; the relation never inspects term content.
 * Inferred relations carry the ordered list of stored edges that justify them.
 */
struct Relation {
    std::string id;                              // Immutable once assigned
    std::string source_id;
    std::string target_id;
    std::string relation_type;
    double confidence = 1.0;                     // [0, 1]; 1.0 for human-asserted edges

    Provenance provenance = Provenance::Asserted;
    std::vector<DerivationStep> derivation;      // Empty for asserted edges
    RelationStatus status = RelationStatus::Confirmed;

    std::string created_at;                      // ISO-8601 UTC
    std::string created_by;
    std::string metadata;                        // Free-form text supplied by the caller

    /**
     * @brief Ordered constituent relation ids
     */
    std::vector<std::string> derivation_path() const;

    /**
     * @brief Rule applied at each step of the derivation
     */
    std::vector<std::string> rules_applied() const;

    bool is_self_loop() const { return source_id == target_id; }
    bool is_inferred() const { return provenance == Provenance::Inferred; }
    bool is_confirmed() const { return status == RelationStatus::Confirmed; }

    /**
     * @brief Check whether a stored edge is one of the constituents
     */
    bool depends_on(const std::string& relation_id) const;

    nlohmann::json to_json() const;
    static Relation from_json(const nlohmann::json& j);
};

/**
 * @brief Build a confirmed, asserted relation
 */
Relation make_asserted(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type,
    double confidence = 1.0,
    const std::string& created_by = ""
);

/**
 * @brief Uniqueness key honoring the type's symmetric flag
 */
RelationKey canonical_key(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type,
    const RelationTypeRegistry& types
);

RelationKey canonical_key(const Relation& relation, const RelationTypeRegistry& types);

/**
 * @brief Generate a unique relation id ("rel_" + 16 hex digits)
 */
std::string generate_relation_id();

/**
 * @brief Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
std::string current_timestamp_utc();

} // namespace lexigraph

#endif // LEXIGRAPH_RELATION_HPP
