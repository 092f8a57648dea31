#pragma once

#include "inference/candidate.hpp"
#include "inference/derivation_arena.hpp"
#include "inference/rules.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace lexigraph {

/**
 * @brief A derivation in progress: the chain of premises from a source term
 */
struct Chain {
    int tail = -1;                  // Last segment in the arena
    std::string source_id;
    std::string target_id;
    std::string relation_type;      // Type the chain currently proves
    double confidence = 0.0;
    size_t length = 0;              // Stored edges in the chain
    bool inverse_reading = false;   // Single edge read through InverseRule
};

/**
 * @brief Premises of an edge set, indexed by the term they leave
 */
class PremiseIndex {
public:
    PremiseIndex() = default;
    PremiseIndex(
        const std::vector<Relation>& edges,
        const std::vector<Rule>& rules,
        const RelationTypeRegistry& types
    );

    const std::vector<Premise>& from(const std::string& term) const;
    std::vector<std::string> terms() const;
    size_t size() const { return count_; }

private:
    std::map<std::string, std::vector<Premise>> by_from_;
    size_t count_ = 0;
};

struct RuleEngineConfig {
    double decay = 0.9;             // Per-hop confidence multiplier
    double min_confidence = 0.0;    // Chains below this are abandoned
};

struct ExpansionStats {
    size_t chains_extended = 0;
    size_t cycles_rejected = 0;
    size_t below_threshold = 0;
};

/**
 * @brief Applies inference rules to chains of stored edges
 *
 * Stateless apart from configuration; all traversal state lives in the
 * caller's DerivationArena, so one engine serves concurrent traversals.
 */
class RuleEngine {
public:
    explicit RuleEngine(RelationTypeRegistry types, RuleEngineConfig config = {});

    const RuleEngineConfig& config() const { return config_; }
    const RelationTypeRegistry& types() const { return types_; }

    /**
     * @brief Single-edge chains leaving `source`
     *
     * Self-loops are rejected here and counted as cycles.
     */
    std::vector<Chain> seed(
        const std::string& source,
        const PremiseIndex& premises,
        DerivationArena& arena,
        ExpansionStats& stats
    ) const;

    /**
     * @brief Extend every chain of the frontier by one premise
     *
     * A chain is only extended to terms it has not visited yet and never
     * back to its source.
     */
    std::vector<Chain> expand(
        const std::vector<Chain>& frontier,
        const PremiseIndex& premises,
        const std::vector<Rule>& rules,
        DerivationArena& arena,
        ExpansionStats& stats
    ) const;

    /**
     * @brief Whether a chain proposes a relation that is not one of its premises
     */
    bool is_candidate(const Chain& chain) const;

    CandidateRelation to_candidate(const Chain& chain, const DerivationArena& arena) const;

    /**
     * @brief One round of every rule over an edge set
     *
     * Pure: reads nothing but its arguments. Each edge seeds a chain which is
     * joined once with every adjacent edge; the best derivation per key is
     * kept and results are sorted by confidence descending.
     */
    std::vector<CandidateRelation> apply_rules(
        const std::vector<Relation>& edges,
        const std::vector<Rule>& rules
    ) const;

private:
    RelationTypeRegistry types_;
    RuleEngineConfig config_;
};

/**
 * @brief Best chain per (target, type) seen during one traversal
 */
class BestChains {
public:
    /**
     * @brief Record a chain if it is new for its (target, type) or beats the
     *        recorded one
     * @return true if the chain was recorded
     */
    bool offer(const Chain& chain, const RuleEngine& engine, const DerivationArena& arena);

    const Chain* find(const std::string& target_id, const std::string& relation_type) const;

    std::vector<Chain> chains() const;
    size_t size() const { return best_.size(); }

private:
    std::map<std::pair<std::string, std::string>, Chain> best_;
};

} // namespace lexigraph
