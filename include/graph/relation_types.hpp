#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>

namespace lexigraph {

/**
 * @brief Algebraic properties of a relation type
 *
 * A type is identified by its name. `inverse` names the type that holds in the
 * opposite direction (broader <-> narrower); empty when the type has none.
 */
struct RelationTypeTraits {
    std::string name;
    bool symmetric = false;
    bool transitive = false;
    bool reflexive = false;
    std::string inverse;

    nlohmann::json to_json() const;
    static RelationTypeTraits from_json(const nlohmann::json& j);
};

/**
 * @brief Registry of known relation types
 *
 * The enumeration is fixed at runtime but extensible through configuration:
 * callers register additional types before constructing stores.
 */
class RelationTypeRegistry {
public:
    RelationTypeRegistry() = default;

    /**
     * @brief Registry with the built-in ontology types
     *
     * is_a, part_of, has_part, broader, narrower (transitive),
     * related_to (symmetric), equivalent_to (symmetric, transitive, reflexive).
     */
    static RelationTypeRegistry with_defaults();

    /**
     * @brief Add or replace a type
     * @throws std::invalid_argument on an empty name or a self-inverse
     *         declared on a non-symmetric type
     */
    void register_type(const RelationTypeTraits& traits);

    const RelationTypeTraits* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    bool is_symmetric(const std::string& name) const;
    bool is_transitive(const std::string& name) const;
    bool is_reflexive(const std::string& name) const;

    // Empty string when the type has no inverse
    std::string inverse_of(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return types_.size(); }

    nlohmann::json to_json() const;
    static RelationTypeRegistry from_json(const nlohmann::json& j);

private:
    std::map<std::string, RelationTypeTraits> types_;
};

// Names of the built-in types used by the rule engine
inline const std::string kEquivalentTo = "equivalent_to";

} // namespace lexigraph
