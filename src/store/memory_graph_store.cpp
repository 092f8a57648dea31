#include "store/memory_graph_store.hpp"
#include <algorithm>
#include <mutex>
#include <set>

namespace lexigraph {

MemoryGraphStore::MemoryGraphStore(RelationTypeRegistry types)
    : RelationStore(std::move(types)) {}

// ==========================================
// Writes
// ==========================================

PutResult MemoryGraphStore::put(const Relation& relation) {
    PutResult result;
    RelationError error = validate_relation(relation, types_, result.error_message);
    if (error != RelationError::None) {
        result.error = error;
        return result;
    }

    RelationKey key = canonical_key(relation, types_);

    std::unique_lock lock(mutex_);
    WritePlan plan = plan_put(find_locked(key), relation);

    if (plan.action == WriteAction::Insert) {
        insert_locked(plan.relation);
    } else if (plan.action == WriteAction::Update) {
        replace_locked(plan.relation);
    }

    result.id = plan.relation.id;
    result.error = plan.error;
    result.promoted = plan.promoted;
    return result;
}

DeleteResult MemoryGraphStore::remove(const std::string& relation_id) {
    DeleteResult result;

    std::unique_lock lock(mutex_);
    auto it = relations_.find(relation_id);
    if (it == relations_.end()) {
        result.error = RelationError::NotFound;
        return result;
    }

    result.deleted = it->second;
    result.affected = collect_locked(index_.dependents_of(relation_id), StatusFilter::Any);

    index_.remove(it->second, canonical_key(it->second, types_));
    relations_.erase(it);
    return result;
}

std::vector<CommitOutcome> MemoryGraphStore::commit_provisional(const std::vector<Relation>& candidates) {
    // Validate the whole batch before touching anything
    for (const auto& candidate : candidates) {
        std::string message;
        if (validate_relation(candidate, types_, message) != RelationError::None) {
            throw std::invalid_argument("Cannot commit candidate: " + message);
        }
    }

    std::vector<CommitOutcome> outcomes;
    outcomes.reserve(candidates.size());

    std::unique_lock lock(mutex_);
    for (const auto& candidate : candidates) {
        WritePlan plan = plan_commit(find_locked(canonical_key(candidate, types_)), candidate);

        if (plan.action == WriteAction::Insert) {
            insert_locked(plan.relation);
        } else if (plan.action == WriteAction::Update) {
            replace_locked(plan.relation);
        }

        outcomes.push_back({plan.relation, plan.kind});
    }
    return outcomes;
}

bool MemoryGraphStore::update(const Relation& relation) {
    std::unique_lock lock(mutex_);
    auto it = relations_.find(relation.id);
    if (it == relations_.end()) {
        return false;
    }

    if (!(canonical_key(it->second, types_) == canonical_key(relation, types_))) {
        throw std::invalid_argument("Update would change the key of relation " + relation.id);
    }

    replace_locked(relation);
    return true;
}

size_t MemoryGraphStore::import_relations(const std::vector<Relation>& relations) {
    for (const auto& relation : relations) {
        std::string message;
        if (relation.id.empty()) {
            throw std::invalid_argument("Imported relation has no id");
        }
        if (validate_relation(relation, types_, message) != RelationError::None) {
            throw std::invalid_argument("Cannot import " + relation.id + ": " + message);
        }
    }

    std::unique_lock lock(mutex_);
    size_t inserted = 0;
    for (const auto& relation : relations) {
        if (relations_.count(relation.id) > 0) continue;
        if (index_.lookup(canonical_key(relation, types_))) continue;

        insert_locked(prepare_for_insert(relation));
        inserted++;
    }
    return inserted;
}

void MemoryGraphStore::clear() {
    std::unique_lock lock(mutex_);
    relations_.clear();
    index_.clear();
}

// ==========================================
// Reads
// ==========================================

std::optional<Relation> MemoryGraphStore::get(const std::string& relation_id) const {
    std::shared_lock lock(mutex_);
    auto it = relations_.find(relation_id);
    if (it == relations_.end()) return std::nullopt;
    return it->second;
}

std::vector<Relation> MemoryGraphStore::get_outgoing(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter
) const {
    std::shared_lock lock(mutex_);
    return adjacent_locked(term_id, relation_type, filter, true);
}

std::vector<Relation> MemoryGraphStore::get_incoming(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter
) const {
    std::shared_lock lock(mutex_);
    return adjacent_locked(term_id, relation_type, filter, false);
}

std::optional<Relation> MemoryGraphStore::find(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type
) const {
    std::shared_lock lock(mutex_);
    return find_locked(canonical_key(source_id, target_id, relation_type, types_));
}

std::vector<Relation> MemoryGraphStore::neighborhood(
    const std::string& term_id,
    int depth,
    StatusFilter filter
) const {
    if (depth <= 0) return {};

    std::shared_lock lock(mutex_);

    std::set<std::string> visited = {term_id};
    std::vector<std::string> frontier = {term_id};
    std::set<std::string> edge_ids;

    for (int level = 0; level < depth && !frontier.empty(); level++) {
        std::vector<std::string> next;
        for (const auto& term : frontier) {
            std::vector<std::string> ids = index_.outgoing(term);
            std::vector<std::string> in = index_.incoming(term);
            ids.insert(ids.end(), in.begin(), in.end());

            for (const auto& id : ids) {
                const Relation& relation = relations_.at(id);
                if (!status_matches(filter, relation.status)) continue;

                edge_ids.insert(id);
                const std::string& other =
                    relation.source_id == term ? relation.target_id : relation.source_id;
                if (visited.insert(other).second) {
                    next.push_back(other);
                }
            }
        }
        frontier = std::move(next);
    }

    std::vector<Relation> result;
    result.reserve(edge_ids.size());
    for (const auto& id : edge_ids) {
        result.push_back(relations_.at(id));
    }
    return result;
}

std::vector<Relation> MemoryGraphStore::list(
    StatusFilter filter,
    size_t limit,
    size_t offset
) const {
    std::vector<Relation> matching;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, relation] : relations_) {
            if (status_matches(filter, relation.status)) {
                matching.push_back(relation);
            }
        }
    }

    std::sort(matching.begin(), matching.end(), [](const Relation& a, const Relation& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });

    if (offset >= matching.size()) return {};
    auto first = matching.begin() + static_cast<std::ptrdiff_t>(offset);
    auto last = matching.end();
    if (limit > 0 && limit < matching.size() - offset) {
        last = first + static_cast<std::ptrdiff_t>(limit);
    }
    return std::vector<Relation>(first, last);
}

std::vector<Relation> MemoryGraphStore::dependents(const std::string& relation_id) const {
    std::shared_lock lock(mutex_);
    return collect_locked(index_.dependents_of(relation_id), StatusFilter::Any);
}

std::vector<std::string> MemoryGraphStore::terms() const {
    std::shared_lock lock(mutex_);
    std::set<std::string> all = index_.terms();
    return std::vector<std::string>(all.begin(), all.end());
}

size_t MemoryGraphStore::size() const {
    std::shared_lock lock(mutex_);
    return relations_.size();
}

StoreStatistics MemoryGraphStore::statistics() const {
    std::shared_lock lock(mutex_);

    StoreStatistics stats;
    stats.num_relations = relations_.size();
    for (const auto& [id, relation] : relations_) {
        if (relation.is_confirmed()) stats.num_confirmed++;
        else stats.num_provisional++;

        if (relation.is_inferred()) stats.num_inferred++;
        else stats.num_asserted++;

        stats.by_type[relation.relation_type]++;
    }
    stats.num_terms = index_.terms().size();
    return stats;
}

// ==========================================
// Helpers (caller holds mutex_)
// ==========================================

void MemoryGraphStore::insert_locked(const Relation& relation) {
    relations_[relation.id] = relation;
    index_.add(relation, canonical_key(relation, types_));
}

void MemoryGraphStore::replace_locked(const Relation& relation) {
    auto it = relations_.find(relation.id);
    if (it != relations_.end()) {
        index_.remove(it->second, canonical_key(it->second, types_));
    }
    insert_locked(relation);
}

std::optional<Relation> MemoryGraphStore::find_locked(const RelationKey& key) const {
    auto id = index_.lookup(key);
    if (!id) return std::nullopt;
    return relations_.at(*id);
}

std::vector<Relation> MemoryGraphStore::collect_locked(
    const std::vector<std::string>& ids,
    StatusFilter filter
) const {
    std::vector<Relation> result;
    for (const auto& id : ids) {
        auto it = relations_.find(id);
        if (it != relations_.end() && status_matches(filter, it->second.status)) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<Relation> MemoryGraphStore::adjacent_locked(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter,
    bool outgoing
) const {
    std::set<std::string> ids;

    for (const auto& id : outgoing ? index_.outgoing(term_id, relation_type)
                                   : index_.incoming(term_id, relation_type)) {
        ids.insert(id);
    }

    // Symmetric edges hold in both directions regardless of storage order
    for (const auto& id : outgoing ? index_.incoming(term_id, relation_type)
                                   : index_.outgoing(term_id, relation_type)) {
        if (types_.is_symmetric(relations_.at(id).relation_type)) {
            ids.insert(id);
        }
    }

    return collect_locked(std::vector<std::string>(ids.begin(), ids.end()), filter);
}

} // namespace lexigraph
