#include "inference/derivation_arena.hpp"
#include <algorithm>

namespace lexigraph {

int DerivationArena::add(ChainSegment segment) {
    segments_.push_back(std::move(segment));
    return static_cast<int>(segments_.size()) - 1;
}

std::vector<DerivationStep> DerivationArena::steps(int tail) const {
    std::vector<DerivationStep> result;
    for (int i = tail; i >= 0; i = at(i).parent) {
        const auto& segment = at(i);
        result.push_back({segment.relation_id, segment.rule, segment.via});
    }
    std::reverse(result.begin(), result.end());
    return result;
}

bool DerivationArena::visits(int tail, const std::string& term) const {
    for (int i = tail; i >= 0; i = at(i).parent) {
        if (at(i).term == term) return true;
    }
    return false;
}

bool DerivationArena::uses(int tail, const std::string& relation_id) const {
    for (int i = tail; i >= 0; i = at(i).parent) {
        if (at(i).relation_id == relation_id) return true;
    }
    return false;
}

std::string DerivationArena::earliest_created_at(int tail) const {
    std::string earliest;
    for (int i = tail; i >= 0; i = at(i).parent) {
        const auto& created = at(i).created_at;
        if (earliest.empty() || (!created.empty() && created < earliest)) {
            earliest = created;
        }
    }
    return earliest;
}

} // namespace lexigraph
