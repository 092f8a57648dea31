#pragma once

#include "graph/relation.hpp"
#include <map>
#include <set>
#include <vector>
#include <string>
#include <optional>
#include <utility>

namespace lexigraph {

// Ordered indices over stored relations. Every lookup is O(log n) plus the
// size of the result; ranges over a term with any type are prefix scans.
struct RelationIndex {
    using TermTypeKey = std::pair<std::string, std::string>;

    // (source_id, relation_type) -> relation ids
    std::map<TermTypeKey, std::set<std::string>> by_source;

    // (target_id, relation_type) -> relation ids
    std::map<TermTypeKey, std::set<std::string>> by_target;

    // Canonical key -> relation id (one stored edge per key)
    std::map<RelationKey, std::string> by_key;

    // Constituent relation id -> ids of inferred relations derived from it
    std::map<std::string, std::set<std::string>> dependents;

    void add(const Relation& relation, const RelationKey& key) {
        by_source[{relation.source_id, relation.relation_type}].insert(relation.id);
        by_target[{relation.target_id, relation.relation_type}].insert(relation.id);
        by_key[key] = relation.id;
        for (const auto& step : relation.derivation) {
            dependents[step.relation_id].insert(relation.id);
        }
    }

    void remove(const Relation& relation, const RelationKey& key) {
        erase_from(by_source, {relation.source_id, relation.relation_type}, relation.id);
        erase_from(by_target, {relation.target_id, relation.relation_type}, relation.id);

        auto key_it = by_key.find(key);
        if (key_it != by_key.end() && key_it->second == relation.id) {
            by_key.erase(key_it);
        }

        for (const auto& step : relation.derivation) {
            auto dep_it = dependents.find(step.relation_id);
            if (dep_it == dependents.end()) continue;
            dep_it->second.erase(relation.id);
            if (dep_it->second.empty()) {
                dependents.erase(dep_it);
            }
        }
        // Entries naming this relation as a constituent stay until each
        // dependent is itself replaced or removed.
    }

    // Relation ids with the given source; empty type matches every type
    std::vector<std::string> outgoing(const std::string& term, const std::string& type = "") const {
        return scan(by_source, term, type);
    }

    // Relation ids with the given target; empty type matches every type
    std::vector<std::string> incoming(const std::string& term, const std::string& type = "") const {
        return scan(by_target, term, type);
    }

    std::optional<std::string> lookup(const RelationKey& key) const {
        auto it = by_key.find(key);
        if (it == by_key.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> dependents_of(const std::string& relation_id) const {
        auto it = dependents.find(relation_id);
        if (it == dependents.end()) return {};
        return std::vector<std::string>(it->second.begin(), it->second.end());
    }

    std::set<std::string> terms() const {
        std::set<std::string> result;
        for (const auto& [key, ids] : by_source) {
            if (!ids.empty()) result.insert(key.first);
        }
        for (const auto& [key, ids] : by_target) {
            if (!ids.empty()) result.insert(key.first);
        }
        return result;
    }

    void clear() {
        by_source.clear();
        by_target.clear();
        by_key.clear();
        dependents.clear();
    }

private:
    static void erase_from(
        std::map<TermTypeKey, std::set<std::string>>& index,
        const TermTypeKey& key,
        const std::string& relation_id
    ) {
        auto it = index.find(key);
        if (it == index.end()) return;
        it->second.erase(relation_id);
        if (it->second.empty()) {
            index.erase(it);
        }
    }

    static std::vector<std::string> scan(
        const std::map<TermTypeKey, std::set<std::string>>& index,
        const std::string& term,
        const std::string& type
    ) {
        std::vector<std::string> result;
        if (!type.empty()) {
            auto it = index.find({term, type});
            if (it != index.end()) {
                result.assign(it->second.begin(), it->second.end());
            }
            return result;
        }

        for (auto it = index.lower_bound({term, ""});
             it != index.end() && it->first.first == term; ++it) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
        return result;
    }
};

} // namespace lexigraph
