#pragma once

#include "backend/backend_selector.hpp"
#include "store/relation_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace lexigraph {

/**
 * @brief Relational source of truth with a graph backend as read replica
 *
 * Every write is applied to the primary first; its failure propagates and
 * nothing is mirrored. The touched edges are then copied to the secondary.
 * Mirror failures are counted and the edges involved marked dirty; reads are
 * served by the secondary only while it is enabled and has no dirty edges.
 * Once the failure rate exceeds the policy the secondary is disabled for good
 * and every read goes to the primary.
 */
class MirroredRelationStore : public RelationStore {
public:
    MirroredRelationStore(
        std::unique_ptr<RelationStore> primary,
        std::unique_ptr<RelationStore> secondary,
        BackendPolicy policy = {},
        bool verbose = false
    );

    std::string backend_name() const override;

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

    // ==========================================
    // Replica state
    // ==========================================

    bool secondary_enabled() const { return secondary_enabled_.load(); }

    // True when reads are currently served by the secondary
    bool serving_from_secondary() const;

    size_t mirrored_writes() const { return mirrored_writes_.load(); }
    size_t mirror_failures() const { return mirror_failures_.load(); }
    double error_rate() const;
    std::string disabled_reason() const;

    /**
     * @brief Edges whose secondary copy may differ from the primary
     *
     * Kept after the secondary is disabled, and grown by every later write.
     */
    std::set<std::string> dirty_ids() const;

    /**
     * @brief Stop using the secondary; reads go to the primary from now on
     */
    void disable_secondary(const std::string& reason);

    /**
     * @brief Compare edge counts; disables the secondary on mismatch
     * @return true if both stores hold the same number of edges
     */
    bool check_consistency();

    RelationStore& primary() { return *primary_; }
    const RelationStore& primary() const { return *primary_; }
    RelationStore* secondary() { return secondary_.get(); }

    /**
     * @brief Detach the secondary (must already be disabled)
     * @throws std::logic_error while the secondary is still enabled
     */
    std::unique_ptr<RelationStore> release_secondary();

private:
    // Copy the current primary state of these edges to the secondary
    void mirror(const std::vector<std::string>& ids);
    bool mirror_one(const std::string& id);
    void record_failure(const std::string& what, const std::string& detail) const;

    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const RelationStore&>()));

    std::unique_ptr<RelationStore> primary_;
    std::unique_ptr<RelationStore> secondary_;
    BackendPolicy policy_;
    bool verbose_;

    std::atomic<bool> secondary_enabled_{true};
    std::atomic<size_t> mirrored_writes_{0};
    mutable std::atomic<size_t> mirror_failures_{0};

    mutable std::mutex state_mutex_;
    std::set<std::string> dirty_;          // Mirror failed, or written after disable
    std::string disabled_reason_;
};

} // namespace lexigraph
