#pragma once

#include "graph/relation.hpp"
#include "graph/relation_types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lexigraph {

// ============================================================================
// Premises
// ============================================================================

/**
 * @brief A stored edge as read by the rule engine, in one orientation
 *
 * Besides the stored direction, rules may expose extra readings of an edge:
 * the reverse of a symmetric edge, or the inverse type read backwards.
 */
struct Premise {
    std::string relation_id;
    std::string from;
    std::string to;
    std::string relation_type;
    double confidence = 1.0;
    std::string via;            // "", "symmetric" or "inverse"
    std::string created_at;
};

/**
 * @brief Result of joining a chain with one more premise
 */
struct Join {
    std::string relation_type;
    double confidence = 0.0;
};

struct RuleContext {
    const RelationTypeRegistry& types;
    double decay;
};

// ============================================================================
// Rules
// ============================================================================

/**
 * @brief A-T->B, B-T->C with T transitive => A-T->C, confidence c1 * c2 * decay
 */
struct TransitiveRule {
    static const char* name() { return "transitive"; }

    std::optional<Premise> view(const Relation&, const RelationTypeRegistry&) const {
        return std::nullopt;
    }

    std::optional<Join> join(
        const std::string& chain_type,
        double chain_confidence,
        const Premise& next,
        const RuleContext& context
    ) const;
};

/**
 * @brief Symmetric edges are traversable in both directions
 *
 * Contributes the reverse reading of each symmetric edge; it never joins on
 * its own, so a symmetric edge alone never proposes its own mirror.
 */
struct SymmetricRule {
    static const char* name() { return "symmetric"; }

    std::optional<Premise> view(const Relation& edge, const RelationTypeRegistry& types) const;

    std::optional<Join> join(const std::string&, double, const Premise&, const RuleContext&) const {
        return std::nullopt;
    }
};

/**
 * @brief A equivalent_to B, B-U->C with U transitive => A-U->C
 */
struct EquivalencePropagationRule {
    static const char* name() { return "equivalence"; }

    std::optional<Premise> view(const Relation&, const RelationTypeRegistry&) const {
        return std::nullopt;
    }

    std::optional<Join> join(
        const std::string& chain_type,
        double chain_confidence,
        const Premise& next,
        const RuleContext& context
    ) const;
};

/**
 * @brief B-U->A with U declaring inverse V reads as A-V->B
 *
 * The inverse reading keeps the stored confidence (no hop decay).
 */
struct InverseRule {
    static const char* name() { return "inverse"; }

    std::optional<Premise> view(const Relation& edge, const RelationTypeRegistry& types) const;

    std::optional<Join> join(const std::string&, double, const Premise&, const RuleContext&) const {
        return std::nullopt;
    }
};

using Rule = std::variant<TransitiveRule, SymmetricRule, EquivalencePropagationRule, InverseRule>;

std::string rule_name(const Rule& rule);

/**
 * @brief Rule from its name ("transitive", "symmetric", "equivalence", "inverse")
 * @throws std::invalid_argument for unknown names
 */
Rule parse_rule(const std::string& name);

std::vector<Rule> parse_rules(const std::vector<std::string>& names);
std::vector<std::string> rule_names(const std::vector<Rule>& rules);

// Every rule, in evaluation order
std::vector<Rule> all_rules();

// ============================================================================
// Evaluation
// ============================================================================

/**
 * @brief Readings of a stored edge under the active rules
 *
 * The stored direction always comes first.
 */
std::vector<Premise> premises_of(
    const Relation& edge,
    const std::vector<Rule>& rules,
    const RelationTypeRegistry& types
);

std::optional<Join> apply_join(
    const Rule& rule,
    const std::string& chain_type,
    double chain_confidence,
    const Premise& next,
    const RuleContext& context
);

} // namespace lexigraph
