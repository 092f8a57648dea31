#pragma once

#include "graph/relation.hpp"
#include <string>
#include <vector>

namespace lexigraph {

/**
 * @brief One edge of a derivation chain, linked to its predecessor by index
 */
struct ChainSegment {
    std::string relation_id;
    std::string term;           // Term reached through this segment
    int parent = -1;            // Previous segment, -1 for the first
    std::string rule;           // Rule that joined this segment ("seed" for the first)
    std::string via;
    std::string created_at;
};

/**
 * @brief Append-only storage of chain segments for one traversal
 *
 * Chains sharing a prefix share its segments, so extending a chain costs one
 * segment instead of a copy of the whole path. Per-path visited checks walk
 * the parent links.
 */
class DerivationArena {
public:
    int add(ChainSegment segment);

    const ChainSegment& at(int index) const { return segments_.at(static_cast<size_t>(index)); }

    /**
     * @brief Derivation steps from the first segment to `tail`
     */
    std::vector<DerivationStep> steps(int tail) const;

    // True if the chain ending at `tail` already reaches `term`
    bool visits(int tail, const std::string& term) const;

    // True if the chain ending at `tail` already uses `relation_id`
    bool uses(int tail, const std::string& relation_id) const;

    // Oldest created_at among the chain's constituents
    std::string earliest_created_at(int tail) const;

    size_t size() const { return segments_.size(); }
    void clear() { segments_.clear(); }

private:
    std::vector<ChainSegment> segments_;
};

} // namespace lexigraph
