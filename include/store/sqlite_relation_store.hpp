#pragma once

#include "store/relation_store.hpp"
#include <mutex>

struct sqlite3;

namespace lexigraph {

/**
 * @brief Relational backend on SQLite
 *
 * One row per canonical key, enforced by a UNIQUE constraint. Derivation
 * steps live in a side table indexed by constituent id so that dependents of
 * a deleted edge are found without a scan. Neighborhood expansion is a
 * bounded recursive CTE.
 *
 * The connection is serialized by a mutex; every write runs inside one
 * BEGIN IMMEDIATE transaction and rolls back on failure.
 */
class SqliteRelationStore : public RelationStore {
public:
    /**
     * @brief Open (or create) the database at `path`
     *
     * ":memory:" gives a private in-memory database.
     * @throws StoreUnavailableError if the database cannot be opened or migrated
     */
    explicit SqliteRelationStore(
        const std::string& path,
        RelationTypeRegistry types = RelationTypeRegistry::with_defaults()
    );
    ~SqliteRelationStore() override;

    std::string backend_name() const override { return "relational"; }
    const std::string& path() const { return path_; }

    PutResult put(const Relation& relation) override;
    DeleteResult remove(const std::string& relation_id) override;
    std::vector<CommitOutcome> commit_provisional(const std::vector<Relation>& candidates) override;
    bool update(const Relation& relation) override;
    size_t import_relations(const std::vector<Relation>& relations) override;

    std::optional<Relation> get(const std::string& relation_id) const override;

    std::vector<Relation> get_outgoing(
        const std::string& term_id,
        const std::string& relation_type = "",
        StatusFilter filter = StatusFilter::Any
    ) const override;

    std::vector<Relation> get_incoming(
        const std::string& term_id,
        const std::string& relation_type = "",
        StatusFilter filter = StatusFilter::Any
    ) const override;

    std::optional<Relation> find(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relation_type
    ) const override;

    std::vector<Relation> neighborhood(
        const std::string& term_id,
        int depth,
        StatusFilter filter = StatusFilter::Confirmed
    ) const override;

    std::vector<Relation> list(
        StatusFilter filter,
        size_t limit = 0,
        size_t offset = 0
    ) const override;

    std::vector<Relation> dependents(const std::string& relation_id) const override;
    std::vector<std::string> terms() const override;
    size_t size() const override;
    StoreStatistics statistics() const override;

    static constexpr int kSchemaVersion = 1;

private:
    void create_schema();

    // Caller holds mutex_
    void insert_locked(const Relation& relation);
    void update_locked(const Relation& relation);
    void write_steps_locked(const Relation& relation);
    std::optional<Relation> get_locked(const std::string& relation_id) const;
    std::optional<Relation> find_locked(const RelationKey& key) const;
    std::vector<Relation> dependents_locked(const std::string& relation_id) const;
    std::vector<Relation> adjacent_locked(
        const std::string& term_id,
        const std::string& relation_type,
        StatusFilter filter,
        bool outgoing
    ) const;
    void load_derivation_locked(Relation& relation) const;

    std::string path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace lexigraph
