#include "inference/rule_engine.hpp"

namespace lexigraph {

// ==========================================
// PremiseIndex Implementation
// ==========================================

PremiseIndex::PremiseIndex(
    const std::vector<Relation>& edges,
    const std::vector<Rule>& rules,
    const RelationTypeRegistry& types
) {
    for (const auto& edge : edges) {
        for (auto& premise : premises_of(edge, rules, types)) {
            by_from_[premise.from].push_back(std::move(premise));
            count_++;
        }
    }
}

const std::vector<Premise>& PremiseIndex::from(const std::string& term) const {
    static const std::vector<Premise> empty;
    auto it = by_from_.find(term);
    return it == by_from_.end() ? empty : it->second;
}

std::vector<std::string> PremiseIndex::terms() const {
    std::vector<std::string> result;
    result.reserve(by_from_.size());
    for (const auto& [term, premises] : by_from_) {
        result.push_back(term);
    }
    return result;
}

// ==========================================
// RuleEngine Implementation
// ==========================================

RuleEngine::RuleEngine(RelationTypeRegistry types, RuleEngineConfig config)
    : types_(std::move(types)), config_(config) {}

std::vector<Chain> RuleEngine::seed(
    const std::string& source,
    const PremiseIndex& premises,
    DerivationArena& arena,
    ExpansionStats& stats
) const {
    std::vector<Chain> chains;

    for (const auto& premise : premises.from(source)) {
        if (premise.to == source) {
            stats.cycles_rejected++;
            continue;
        }

        ChainSegment segment;
        segment.relation_id = premise.relation_id;
        segment.term = premise.to;
        segment.rule = "seed";
        segment.via = premise.via;
        segment.created_at = premise.created_at;

        Chain chain;
        chain.tail = arena.add(std::move(segment));
        chain.source_id = source;
        chain.target_id = premise.to;
        chain.relation_type = premise.relation_type;
        chain.confidence = premise.confidence;
        chain.length = 1;
        chain.inverse_reading = premise.via == "inverse";
        chains.push_back(std::move(chain));
    }

    return chains;
}

std::vector<Chain> RuleEngine::expand(
    const std::vector<Chain>& frontier,
    const PremiseIndex& premises,
    const std::vector<Rule>& rules,
    DerivationArena& arena,
    ExpansionStats& stats
) const {
    RuleContext context{types_, config_.decay};
    std::vector<Chain> extended;

    for (const auto& chain : frontier) {
        for (const auto& premise : premises.from(chain.target_id)) {
            // Cycle guard: the proof may not return to its source or revisit a term
            if (premise.to == chain.source_id || arena.visits(chain.tail, premise.to)) {
                stats.cycles_rejected++;
                continue;
            }

            for (const auto& rule : rules) {
                auto joined = apply_join(rule, chain.relation_type, chain.confidence, premise, context);
                if (!joined) continue;

                if (joined->confidence < config_.min_confidence) {
                    stats.below_threshold++;
                    continue;
                }

                ChainSegment segment;
                segment.relation_id = premise.relation_id;
                segment.term = premise.to;
                segment.parent = chain.tail;
                segment.rule = rule_name(rule);
                segment.via = premise.via;
                segment.created_at = premise.created_at;

                Chain next;
                next.tail = arena.add(std::move(segment));
                next.source_id = chain.source_id;
                next.target_id = premise.to;
                next.relation_type = joined->relation_type;
                next.confidence = joined->confidence;
                next.length = chain.length + 1;
                extended.push_back(std::move(next));
                stats.chains_extended++;
            }
        }
    }

    return extended;
}

bool RuleEngine::is_candidate(const Chain& chain) const {
    if (chain.length < 2 && !chain.inverse_reading) {
        return false;
    }
    return chain.confidence >= config_.min_confidence;
}

CandidateRelation RuleEngine::to_candidate(const Chain& chain, const DerivationArena& arena) const {
    CandidateRelation candidate;
    candidate.source_id = chain.source_id;
    candidate.target_id = chain.target_id;
    candidate.relation_type = chain.relation_type;
    candidate.confidence = chain.confidence;
    candidate.derivation = arena.steps(chain.tail);
    candidate.earliest_created_at = arena.earliest_created_at(chain.tail);
    return candidate;
}

std::vector<CandidateRelation> RuleEngine::apply_rules(
    const std::vector<Relation>& edges,
    const std::vector<Rule>& rules
) const {
    PremiseIndex premises(edges, rules, types_);
    DerivationArena arena;
    ExpansionStats stats;

    std::map<RelationKey, CandidateRelation> best;
    auto consider = [&](const Chain& chain) {
        if (!is_candidate(chain)) return;
        CandidateRelation candidate = to_candidate(chain, arena);
        RelationKey key = candidate.key(types_);

        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(key, std::move(candidate));
        } else if (better_candidate(candidate, it->second)) {
            it->second = std::move(candidate);
        }
    };

    for (const auto& term : premises.terms()) {
        std::vector<Chain> seeds = seed(term, premises, arena, stats);
        for (const auto& chain : seeds) {
            consider(chain);
        }
        for (const auto& chain : expand(seeds, premises, rules, arena, stats)) {
            consider(chain);
        }
    }

    // A proposal that restates an input edge is not new
    for (const auto& edge : edges) {
        best.erase(canonical_key(edge, types_));
    }

    std::vector<CandidateRelation> result;
    result.reserve(best.size());
    for (auto& [key, candidate] : best) {
        result.push_back(std::move(candidate));
    }
    sort_candidates(result);
    return result;
}

// ==========================================
// BestChains Implementation
// ==========================================

bool BestChains::offer(const Chain& chain, const RuleEngine& engine, const DerivationArena& arena) {
    auto key = std::make_pair(chain.target_id, chain.relation_type);
    auto it = best_.find(key);
    if (it == best_.end()) {
        best_.emplace(key, chain);
        return true;
    }

    if (better_candidate(engine.to_candidate(chain, arena), engine.to_candidate(it->second, arena))) {
        it->second = chain;
        return true;
    }
    return false;
}

const Chain* BestChains::find(const std::string& target_id, const std::string& relation_type) const {
    auto it = best_.find({target_id, relation_type});
    return it == best_.end() ? nullptr : &it->second;
}

std::vector<Chain> BestChains::chains() const {
    std::vector<Chain> result;
    result.reserve(best_.size());
    for (const auto& [key, chain] : best_) {
        result.push_back(chain);
    }
    return result;
}

} // namespace lexigraph
