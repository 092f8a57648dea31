#pragma once

#include "store/memory_graph_store.hpp"
#include <atomic>
#include <memory>

namespace lexigraph {
namespace testing_support {

// Memory store that raises StoreUnavailableError on demand
class FlakyStore : public RelationStore {
public:
    FlakyStore()
        : RelationStore(RelationTypeRegistry::with_defaults()),
          inner_(std::make_unique<MemoryGraphStore>()) {}

    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_reads{false};

    MemoryGraphStore& inner() { return *inner_; }

    std::string backend_name() const override { return "flaky"; }

    PutResult put(const Relation& relation) override {
        write_check();
        return inner_->put(relation);
    }

    DeleteResult remove(const std::string& relation_id) override {
        write_check();
        return inner_->remove(relation_id);
    }

    std::vector<CommitOutcome> commit_provisional(const std::vector<Relation>& candidates) override {
        write_check();
        return inner_->commit_provisional(candidates);
    }

    bool update(const Relation& relation) override {
        write_check();
        return inner_->update(relation);
    }

    size_t import_relations(const std::vector<Relation>& relations) override {
        write_check();
        return inner_->import_relations(relations);
    }

    std::optional<Relation> get(const std::string& relation_id) const override {
        read_check();
        return inner_->get(relation_id);
    }

    std::vector<Relation> get_outgoing(
        const std::string& term_id,
        const std::string& relation_type = "",
        StatusFilter filter = StatusFilter::Any
    ) const override {
        read_check();
        return inner_->get_outgoing(term_id, relation_type, filter);
    }

    std::vector<Relation> get_incoming(
        const std::string& term_id,
        const std::string& relation_type = "",
        StatusFilter filter = StatusFilter::Any
    ) const override {
        read_check();
        return inner_->get_incoming(term_id, relation_type, filter);
    }

    std::optional<Relation> find(
        const std::string& source_id,
        const std::string& target_id,
        const std::string& relation_type
    ) const override {
        read_check();
        return inner_->find(source_id, target_id, relation_type);
    }

    std::vector<Relation> neighborhood(
        const std::string& term_id,
        int depth,
        StatusFilter filter = StatusFilter::Confirmed
    ) const override {
        read_check();
        return inner_->neighborhood(term_id, depth, filter);
    }

    std::vector<Relation> list(StatusFilter filter, size_t limit = 0, size_t offset = 0) const override {
        read_check();
        return inner_->list(filter, limit, offset);
    }

    std::vector<Relation> dependents(const std::string& relation_id) const override {
        read_check();
        return inner_->dependents(relation_id);
    }

    std::vector<std::string> terms() const override {
        read_check();
        return inner_->terms();
    }

    size_t size() const override {
        read_check();
        return inner_->size();
    }

    StoreStatistics statistics() const override {
        read_check();
        return inner_->statistics();
    }

private:
    void write_check() const {
        if (fail_writes.load()) throw StoreUnavailableError("injected write failure");
    }

    void read_check() const {
        if (fail_reads.load()) throw StoreUnavailableError("injected read failure");
    }

    std::unique_ptr<MemoryGraphStore> inner_;
};

} // namespace testing_support
} // namespace lexigraph
