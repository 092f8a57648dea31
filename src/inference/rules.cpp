#include "inference/rules.hpp"
#include <stdexcept>

namespace lexigraph {

// ==========================================
// Rule evaluation
// ==========================================

std::optional<Join> TransitiveRule::join(
    const std::string& chain_type,
    double chain_confidence,
    const Premise& next,
    const RuleContext& context
) const {
    if (chain_type != next.relation_type || !context.types.is_transitive(chain_type)) {
        return std::nullopt;
    }
    return Join{chain_type, chain_confidence * next.confidence * context.decay};
}

std::optional<Premise> SymmetricRule::view(const Relation& edge, const RelationTypeRegistry& types) const {
    if (!types.is_symmetric(edge.relation_type) || edge.is_self_loop()) {
        return std::nullopt;
    }

    Premise reverse;
    reverse.relation_id = edge.id;
    reverse.from = edge.target_id;
    reverse.to = edge.source_id;
    reverse.relation_type = edge.relation_type;
    reverse.confidence = edge.confidence;
    reverse.via = "symmetric";
    reverse.created_at = edge.created_at;
    return reverse;
}

std::optional<Join> EquivalencePropagationRule::join(
    const std::string& chain_type,
    double chain_confidence,
    const Premise& next,
    const RuleContext& context
) const {
    if (chain_type != kEquivalentTo || next.relation_type == kEquivalentTo) {
        return std::nullopt;
    }
    if (!context.types.is_transitive(next.relation_type)) {
        return std::nullopt;
    }
    return Join{next.relation_type, chain_confidence * next.confidence * context.decay};
}

std::optional<Premise> InverseRule::view(const Relation& edge, const RelationTypeRegistry& types) const {
    std::string inverse = types.inverse_of(edge.relation_type);
    if (inverse.empty() || edge.is_self_loop()) {
        return std::nullopt;
    }

    Premise flipped;
    flipped.relation_id = edge.id;
    flipped.from = edge.target_id;
    flipped.to = edge.source_id;
    flipped.relation_type = inverse;
    flipped.confidence = edge.confidence;
    flipped.via = "inverse";
    flipped.created_at = edge.created_at;
    return flipped;
}

// ==========================================
// Names
// ==========================================

std::string rule_name(const Rule& rule) {
    return std::visit([](const auto& r) { return std::string(r.name()); }, rule);
}

Rule parse_rule(const std::string& name) {
    if (name == TransitiveRule::name()) return TransitiveRule{};
    if (name == SymmetricRule::name()) return SymmetricRule{};
    if (name == EquivalencePropagationRule::name() || name == "equivalence_propagation") {
        return EquivalencePropagationRule{};
    }
    if (name == InverseRule::name()) return InverseRule{};
    throw std::invalid_argument("Unknown inference rule: " + name);
}

std::vector<Rule> parse_rules(const std::vector<std::string>& names) {
    std::vector<Rule> rules;
    rules.reserve(names.size());
    for (const auto& name : names) {
        rules.push_back(parse_rule(name));
    }
    return rules;
}

std::vector<std::string> rule_names(const std::vector<Rule>& rules) {
    std::vector<std::string> names;
    names.reserve(rules.size());
    for (const auto& rule : rules) {
        names.push_back(rule_name(rule));
    }
    return names;
}

std::vector<Rule> all_rules() {
    return {TransitiveRule{}, SymmetricRule{}, EquivalencePropagationRule{}, InverseRule{}};
}

// ==========================================
// Premises and joins
// ==========================================

std::vector<Premise> premises_of(
    const Relation& edge,
    const std::vector<Rule>& rules,
    const RelationTypeRegistry& types
) {
    std::vector<Premise> premises;

    Premise direct;
    direct.relation_id = edge.id;
    direct.from = edge.source_id;
    direct.to = edge.target_id;
    direct.relation_type = edge.relation_type;
    direct.confidence = edge.confidence;
    direct.created_at = edge.created_at;
    premises.push_back(direct);

    for (const auto& rule : rules) {
        auto extra = std::visit([&](const auto& r) { return r.view(edge, types); }, rule);
        if (!extra) continue;

        bool seen = false;
        for (const auto& p : premises) {
            if (p.via == extra->via) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            premises.push_back(*extra);
        }
    }
    return premises;
}

std::optional<Join> apply_join(
    const Rule& rule,
    const std::string& chain_type,
    double chain_confidence,
    const Premise& next,
    const RuleContext& context
) {
    return std::visit([&](const auto& r) {
        return r.join(chain_type, chain_confidence, next, context);
    }, rule);
}

} // namespace lexigraph
