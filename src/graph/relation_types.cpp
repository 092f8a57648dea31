#include "graph/relation_types.hpp"
#include <stdexcept>

namespace lexigraph {

// ==========================================
// RelationTypeTraits Implementation
// ==========================================

nlohmann::json RelationTypeTraits::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["symmetric"] = symmetric;
    j["transitive"] = transitive;
    j["reflexive"] = reflexive;
    if (!inverse.empty()) {
        j["inverse"] = inverse;
    }
    return j;
}

RelationTypeTraits RelationTypeTraits::from_json(const nlohmann::json& j) {
    RelationTypeTraits traits;
    traits.name = j.at("name").get<std::string>();
    traits.symmetric = j.value("symmetric", false);
    traits.transitive = j.value("transitive", false);
    traits.reflexive = j.value("reflexive", false);
    traits.inverse = j.value("inverse", "");
    return traits;
}

// ==========================================
// RelationTypeRegistry Implementation
// ==========================================

RelationTypeRegistry RelationTypeRegistry::with_defaults() {
    RelationTypeRegistry registry;
    registry.register_type({"is_a", false, true, false, ""});
    registry.register_type({"part_of", false, true, false, "has_part"});
    registry.register_type({"has_part", false, true, false, "part_of"});
    registry.register_type({"broader", false, true, false, "narrower"});
    registry.register_type({"narrower", false, true, false, "broader"});
    registry.register_type({"related_to", true, false, false, ""});
    registry.register_type({kEquivalentTo, true, true, true, ""});
    return registry;
}

void RelationTypeRegistry::register_type(const RelationTypeTraits& traits) {
    if (traits.name.empty()) {
        throw std::invalid_argument("Relation type name must not be empty");
    }
    if (traits.inverse == traits.name && !traits.symmetric) {
        throw std::invalid_argument(
            "Relation type '" + traits.name + "' is its own inverse but not symmetric");
    }
    types_[traits.name] = traits;
}

const RelationTypeTraits* RelationTypeRegistry::find(const std::string& name) const {
    auto it = types_.find(name);
    return it != types_.end() ? &it->second : nullptr;
}

bool RelationTypeRegistry::is_symmetric(const std::string& name) const {
    auto* traits = find(name);
    return traits && traits->symmetric;
}

bool RelationTypeRegistry::is_transitive(const std::string& name) const {
    auto* traits = find(name);
    return traits && traits->transitive;
}

bool RelationTypeRegistry::is_reflexive(const std::string& name) const {
    auto* traits = find(name);
    return traits && traits->reflexive;
}

std::string RelationTypeRegistry::inverse_of(const std::string& name) const {
    auto* traits = find(name);
    if (!traits || traits->inverse.empty()) {
        return "";
    }
    // An inverse that was never registered cannot be proposed
    return contains(traits->inverse) ? traits->inverse : "";
}

std::vector<std::string> RelationTypeRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (const auto& [name, traits] : types_) {
        result.push_back(name);
    }
    return result;
}

nlohmann::json RelationTypeRegistry::to_json() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [name, traits] : types_) {
        j.push_back(traits.to_json());
    }
    return j;
}

RelationTypeRegistry RelationTypeRegistry::from_json(const nlohmann::json& j) {
    RelationTypeRegistry registry;
    for (const auto& item : j) {
        registry.register_type(RelationTypeTraits::from_json(item));
    }
    return registry;
}

} // namespace lexigraph
