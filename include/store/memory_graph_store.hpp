#pragma once

#include "store/relation_store.hpp"
#include "index/relation_index.hpp"
#include <map>
#include <shared_mutex>

namespace lexigraph {

/**
 * @brief Native graph backend
 *
 * Relations live in memory with adjacency indices by source and target, so
 * neighborhood expansion is a direct traversal. Readers share a lock; every
 * write takes it exclusively, which makes check-and-insert atomic.
 */
class MemoryGraphStore : public RelationStore {
public:
    explicit MemoryGraphStore(RelationTypeRegistry types = RelationTypeRegistry::with_defaults());

    std::string backend_name() const override { return "graph"; }

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

    void clear();

private:
    // Caller holds mutex_
    void insert_locked(const Relation& relation);
    void replace_locked(const Relation& relation);
    std::optional<Relation> find_locked(const RelationKey& key) const;
    std::vector<Relation> collect_locked(
        const std::vector<std::string>& ids,
        StatusFilter filter
    ) const;
    std::vector<Relation> adjacent_locked(
        const std::string& term_id,
        const std::string& relation_type,
        StatusFilter filter,
        bool outgoing
    ) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Relation> relations_;
    RelationIndex index_;
};

} // namespace lexigraph
