#pragma once

#include "store/relation_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace lexigraph {

class MirroredRelationStore;

/**
 * @brief Outcome of copying edges between backends
 */
struct MigrationReport {
    size_t exported = 0;
    size_t imported = 0;            // Newly inserted in the target
    size_t skipped = 0;             // Already present (by id or key)
    size_t stale = 0;               // Out of sync with the primary, not copied back
    bool verified = false;          // Every exported edge found in the target
    double elapsed_ms = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

/**
 * @brief Copy every edge, with derivation and confidence, from one store to another
 *
 * Idempotent: edges already in the target are skipped, so a repeated or
 * resumed migration converges to the same state.
 */
MigrationReport migrate(const RelationStore& from, RelationStore& to, size_t batch_size = 1000);

/**
 * @brief Move off the graph backend
 *
 * Reads switch to the relational primary first, then the secondary's edges
 * are re-imported into the primary and the secondary is released. Edges the
 * mirror marked dirty are never copied back, so an edge deleted, rejected or
 * retracted on the primary stays gone.
 */
MigrationReport rollback_to_relational(MirroredRelationStore& mirrored);

/**
 * @brief Dump every edge and the type registry to a JSON file
 * @throws std::runtime_error if the file cannot be written
 */
void export_to_json_file(const RelationStore& store, const std::string& path);

/**
 * @brief Import a file written by export_to_json_file()
 * @throws std::runtime_error if the file cannot be read
 */
MigrationReport import_from_json_file(RelationStore& store, const std::string& path);

} // namespace lexigraph
