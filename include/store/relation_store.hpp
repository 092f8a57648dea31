#pragma once

#include "graph/relation.hpp"
#include "graph/relation_types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lexigraph {

/**
 * @brief Backend I/O failure
 *
 * Fatal for the caller of infer()/put(). Stores guarantee that the call that
 * raised it left no partial write behind. Retrying is the caller's concern.
 */
class StoreUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Result of RelationStore::put()
 *
 * `Duplicate` is not fatal: `id` is the existing edge, whose confidence has
 * been merged with max().
 */
struct PutResult {
    std::string id;
    RelationError error = RelationError::None;
    bool promoted = false;              // Provisional edge promoted by an assertion
    std::string error_message;

    bool success() const {
        return error == RelationError::None || error == RelationError::Duplicate;
    }
};

/**
 * @brief Result of RelationStore::remove()
 */
struct DeleteResult {
    RelationError error = RelationError::None;
    std::optional<Relation> deleted;
    std::vector<Relation> affected;     // Inferred edges whose derivation referenced the deleted edge

    bool success() const { return error == RelationError::None; }
};

enum class CommitKind {
    Inserted,           // New provisional edge
    Merged,             // Existing provisional edge, confidence merged with max()
    DroppedConfirmed    // Identical to a confirmed edge, nothing written
};

std::string commit_kind_to_string(CommitKind kind);

struct CommitOutcome {
    Relation relation;                  // The edge as stored after the commit
    CommitKind kind = CommitKind::Inserted;
};

/**
 * @brief Counts over the stored graph
 */
struct StoreStatistics {
    size_t num_relations = 0;
    size_t num_confirmed = 0;
    size_t num_provisional = 0;
    size_t num_asserted = 0;
    size_t num_inferred = 0;
    size_t num_terms = 0;
    std::map<std::string, size_t> by_type;

    nlohmann::json to_json() const;
};

/**
 * @brief Persistence and indexed lookup of relations
 *
 * Two implementations exist: SqliteRelationStore (relational engine, recursive
 * queries for neighborhood expansion) and MemoryGraphStore (native adjacency
 * traversal). Both enforce one stored edge per canonical key; the check and
 * the write happen as one unit inside the store.
 *
 * Every method may throw StoreUnavailableError.
 */
class RelationStore {
public:
    explicit RelationStore(RelationTypeRegistry types) : types_(std::move(types)) {}
    virtual ~RelationStore() = default;

    RelationStore(const RelationStore&) = delete;
    RelationStore& operator=(const RelationStore&) = delete;

    const RelationTypeRegistry& types() const { return types_; }

    virtual std::string backend_name() const = 0;

    // ==========================================
    // Writes
    // ==========================================

    /**
     * @brief Insert a relation, or merge it into the edge holding its key
     *
     * Assigns `id` and `created_at` when empty. A second confirmed edge with
     * the same key is rejected with Duplicate after merging confidence. A
     * confirmed edge replaces a provisional one holding the key (promotion).
     *
     * @throws std::invalid_argument on empty term ids or confidence outside [0, 1]
     */
    virtual PutResult put(const Relation& relation) = 0;

    /**
     * @brief Delete a relation by id
     *
     * Returns the inferred edges whose derivation referenced it so the caller
     * can re-evaluate them. Dependents are not touched.
     */
    virtual DeleteResult remove(const std::string& relation_id) = 0;

    /**
     * @brief Insert-or-merge a batch of provisional candidates atomically
     *
     * Either every candidate is applied or, on failure, none is.
     */
    virtual std::vector<CommitOutcome> commit_provisional(const std::vector<Relation>& candidates) = 0;

    /**
     * @brief Replace a stored relation with the same id
     * @return false if no relation has this id
     * @throws std::invalid_argument if the update would change the edge's key
     */
    virtual bool update(const Relation& relation) = 0;

    /**
     * @brief Insert relations as-is, skipping ids or keys already present
     * @return Number of relations inserted
     */
    virtual size_t import_relations(const std::vector<Relation>& relations) = 0;

    // ==========================================
    // Reads
    // ==========================================

    virtual std::optional<Relation> get(const std::string& relation_id) const = 0;

    /**
     * @brief Edges leaving a term
     *
     * Symmetric edges stored in the opposite direction are included, as
     * stored. An empty type matches every type.
     */
    virtual std::vector<Relation> get_outgoing(
        const std::string& term_id,
        const std::string& relation_type = "",
        StatusFilter filter = StatusFilter::Any
    ) const = 0;

    /**
     * @brief Edges entering a term (symmetric edges in both directions)
     */
    virtual std::vector<Relation> get_incoming(
        const std::string& term_id,
        const std::string& relation_type = "",
        StatusFilter filter = StatusFilter::Any
    ) const = 0;

    /**
     * @brief Edge holding the key of (source, target, type), any status
     *
     * Direction-aware per the type's symmetric flag.
     */
    virtual std::optional<Relation> find(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relation_type
    ) const = 0;

    bool exists(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relation_type
    ) const {
        return find(source_id, target_id, relation_type).has_value();
    }

    /**
     * @brief All edges within `depth` hops of a term, in one consistent read
     *
     * Edges are followed in both directions. depth <= 0 yields nothing.
     */
    virtual std::vector<Relation> neighborhood(
        const std::string& term_id,
        int depth,
        StatusFilter filter = StatusFilter::Confirmed
    ) const = 0;

    /**
     * @brief Relations ordered by (created_at, id); limit 0 means unlimited
     */
    virtual std::vector<Relation> list(
        StatusFilter filter,
        size_t limit = 0,
        size_t offset = 0
    ) const = 0;

    // Inferred relations whose derivation references relation_id
    virtual std::vector<Relation> dependents(const std::string& relation_id) const = 0;

    // Every term that appears as a source or target, sorted
    virtual std::vector<std::string> terms() const = 0;

    virtual size_t size() const = 0;

    virtual StoreStatistics statistics() const = 0;

    std::vector<Relation> export_all() const { return list(StatusFilter::Any); }

protected:
    RelationTypeRegistry types_;
};

// ==========================================
// Merge policy shared by the backends
// ==========================================

/**
 * @brief Check a relation against the type registry
 *
 * @return InvalidType for unknown types or a self-loop on a non-reflexive
 *         type, None otherwise (with `message` describing the problem)
 * @throws std::invalid_argument on empty term ids or confidence outside [0, 1]
 */
RelationError validate_relation(
    const Relation& relation,
    const RelationTypeRegistry& types,
    std::string& message
);

/**
 * @brief Fill id and created_at when missing
 */
Relation prepare_for_insert(const Relation& relation);

enum class WriteAction {
    Insert,
    Update,
    Keep
};

struct WritePlan {
    WriteAction action = WriteAction::Keep;
    Relation relation;                  // What to write (or the existing edge for Keep)
    RelationError error = RelationError::None;
    bool promoted = false;
    CommitKind kind = CommitKind::Inserted;
};

/**
 * @brief Decide how put() applies `incoming` given the edge holding its key
 */
WritePlan plan_put(const std::optional<Relation>& existing, const Relation& incoming);

/**
 * @brief Decide how commit_provisional() applies one candidate
 */
WritePlan plan_commit(const std::optional<Relation>& existing, const Relation& candidate);

/**
 * @brief True if derivation `a` should be kept over `b` for the same key
 *
 * Higher confidence wins, then the shorter derivation.
 */
bool preferred_derivation(const Relation& a, const Relation& b);

} // namespace lexigraph
