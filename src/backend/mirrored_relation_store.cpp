#include "backend/mirrored_relation_store.hpp"
#include <iostream>
#include <stdexcept>

namespace lexigraph {

MirroredRelationStore::MirroredRelationStore(
    std::unique_ptr<RelationStore> primary,
    std::unique_ptr<RelationStore> secondary,
    BackendPolicy policy,
    bool verbose
)
    : RelationStore(primary ? primary->types() : RelationTypeRegistry::with_defaults()),
      primary_(std::move(primary)),
      secondary_(std::move(secondary)),
      policy_(policy),
      verbose_(verbose) {
    if (!primary_) {
        throw std::invalid_argument("Mirrored store needs a primary backend");
    }
    if (!secondary_) {
        secondary_enabled_.store(false);
        disabled_reason_ = "no secondary backend";
    }
}

std::string MirroredRelationStore::backend_name() const {
    if (!secondary_enabled()) {
        return primary_->backend_name();
    }
    return primary_->backend_name() + "+" + secondary_->backend_name();
}

// ==========================================
// Writes: primary first, then mirror
// ==========================================

PutResult MirroredRelationStore::put(const Relation& relation) {
    PutResult result = primary_->put(relation);
    if (!result.id.empty()) {
        mirror({result.id});
    }
    return result;
}

DeleteResult MirroredRelationStore::remove(const std::string& relation_id) {
    DeleteResult result = primary_->remove(relation_id);
    if (result.success()) {
        mirror({relation_id});
    }
    return result;
}

std::vector<CommitOutcome> MirroredRelationStore::commit_provisional(const std::vector<Relation>& candidates) {
    std::vector<CommitOutcome> outcomes = primary_->commit_provisional(candidates);

    std::vector<std::string> touched;
    for (const auto& outcome : outcomes) {
        if (outcome.kind != CommitKind::DroppedConfirmed) {
            touched.push_back(outcome.relation.id);
        }
    }
    mirror(touched);
    return outcomes;
}

bool MirroredRelationStore::update(const Relation& relation) {
    bool updated = primary_->update(relation);
    if (updated) {
        mirror({relation.id});
    }
    return updated;
}

size_t MirroredRelationStore::import_relations(const std::vector<Relation>& relations) {
    size_t inserted = primary_->import_relations(relations);

    std::vector<std::string> ids;
    ids.reserve(relations.size());
    for (const auto& relation : relations) {
        ids.push_back(relation.id);
    }
    mirror(ids);
    return inserted;
}

// ==========================================
// Reads: secondary while healthy
// ==========================================

template <typename Fn>
auto MirroredRelationStore::read(Fn&& fn) const -> decltype(fn(std::declval<const RelationStore&>())) {
    if (serving_from_secondary()) {
        try {
            return fn(*secondary_);
        } catch (const std::exception& e) {
            mirror_failures_++;
            record_failure("read", e.what());
        }
    }
    return fn(*primary_);
}

std::optional<Relation> MirroredRelationStore::get(const std::string& relation_id) const {
    return read([&](const RelationStore& store) { return store.get(relation_id); });
}

std::vector<Relation> MirroredRelationStore::get_outgoing(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter
) const {
    return read([&](const RelationStore& store) {
        return store.get_outgoing(term_id, relation_type, filter);
    });
}

std::vector<Relation> MirroredRelationStore::get_incoming(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter
) const {
    return read([&](const RelationStore& store) {
        return store.get_incoming(term_id, relation_type, filter);
    });
}

std::optional<Relation> MirroredRelationStore::find(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type
) const {
    return read([&](const RelationStore& store) {
        return store.find(source_id, target_id, relation_type);
    });
}

std::vector<Relation> MirroredRelationStore::neighborhood(
    const std::string& term_id,
    int depth,
    StatusFilter filter
) const {
    return read([&](const RelationStore& store) { return store.neighborhood(term_id, depth, filter); });
}

std::vector<Relation> MirroredRelationStore::list(StatusFilter filter, size_t limit, size_t offset) const {
    return read([&](const RelationStore& store) { return store.list(filter, limit, offset); });
}

std::vector<Relation> MirroredRelationStore::dependents(const std::string& relation_id) const {
    return read([&](const RelationStore& store) { return store.dependents(relation_id); });
}

std::vector<std::string> MirroredRelationStore::terms() const {
    return read([&](const RelationStore& store) { return store.terms(); });
}

size_t MirroredRelationStore::size() const {
    return read([&](const RelationStore& store) { return store.size(); });
}

StoreStatistics MirroredRelationStore::statistics() const {
    return read([&](const RelationStore& store) { return store.statistics(); });
}

// ==========================================
// Replica state
// ==========================================

bool MirroredRelationStore::serving_from_secondary() const {
    if (!secondary_enabled() || !secondary_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    return dirty_.empty();
}

double MirroredRelationStore::error_rate() const {
    size_t writes = mirrored_writes_.load();
    if (writes == 0) return 0.0;
    return static_cast<double>(mirror_failures_.load()) / static_cast<double>(writes);
}

std::string MirroredRelationStore::disabled_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return disabled_reason_;
}

void MirroredRelationStore::disable_secondary(const std::string& reason) {
    if (!secondary_enabled_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        disabled_reason_ = reason;
    }
    std::cerr << "[backend] Graph backend disabled, serving reads from "
              << primary_->backend_name() << ": " << reason << "\n";
}

bool MirroredRelationStore::check_consistency() {
    if (!secondary_enabled()) {
        return false;
    }

    size_t primary_size = primary_->size();
    size_t secondary_size = secondary_->size();
    if (primary_size != secondary_size) {
        disable_secondary("out of sync (" + std::to_string(primary_size) + " relational edges, " +
                          std::to_string(secondary_size) + " graph edges)");
        return false;
    }
    return true;
}

std::unique_ptr<RelationStore> MirroredRelationStore::release_secondary() {
    if (secondary_enabled()) {
        throw std::logic_error("Disable the secondary backend before releasing it");
    }
    return std::move(secondary_);
}

std::set<std::string> MirroredRelationStore::dirty_ids() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return dirty_;
}

void MirroredRelationStore::mirror(const std::vector<std::string>& ids) {
    if (!secondary_ || ids.empty()) {
        return;
    }
    if (!secondary_enabled()) {
        // A disabled secondary no longer follows these edges
        std::lock_guard<std::mutex> lock(state_mutex_);
        dirty_.insert(ids.begin(), ids.end());
        return;
    }

    // Retry edges left dirty by earlier failures along with the new ones
    std::set<std::string> pending(ids.begin(), ids.end());
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending.insert(dirty_.begin(), dirty_.end());
    }

    for (const auto& id : pending) {
        mirrored_writes_++;
        bool ok = mirror_one(id);

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (ok) {
            dirty_.erase(id);
        } else {
            dirty_.insert(id);
            mirror_failures_++;
        }
    }

    if (mirrored_writes_.load() >= policy_.min_writes_for_error_rate &&
        error_rate() > policy_.max_secondary_error_rate) {
        disable_secondary("mirror error rate " + std::to_string(error_rate()) +
                          " exceeds " + std::to_string(policy_.max_secondary_error_rate));
    } else if (verbose_ && mirror_failures_.load() > 0) {
        std::cout << "[backend] mirror error rate " << error_rate() << "\n";
    }
}

bool MirroredRelationStore::mirror_one(const std::string& id) {
    try {
        auto current = primary_->get(id);
        if (!current) {
            DeleteResult removed = secondary_->remove(id);
            return removed.success() || removed.error == RelationError::NotFound;
        }

        if (secondary_->get(id)) {
            return secondary_->update(*current);
        }

        // A stale edge under another id may hold the key in the replica
        auto stale = secondary_->find(current->source_id, current->target_id, current->relation_type);
        if (stale && stale->id != id && !secondary_->remove(stale->id).success()) {
            return false;
        }
        return secondary_->import_relations({*current}) == 1;
    } catch (const std::exception& e) {
        record_failure("mirror " + id, e.what());
        return false;
    }
}

void MirroredRelationStore::record_failure(const std::string& what, const std::string& detail) const {
    std::cerr << "[backend] Graph backend " << what << " failed: " << detail << "\n";
}

} // namespace lexigraph
