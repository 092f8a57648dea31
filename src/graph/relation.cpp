#include "graph/relation.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace lexigraph {

// ==========================================
// Enum conversions
// ==========================================

std::string provenance_to_string(Provenance provenance) {
    switch (provenance) {
        case Provenance::Asserted: return "asserted";
        case Provenance::Inferred: return "inferred";
        default: return "unknown";
    }
}

Provenance string_to_provenance(const std::string& s) {
    if (s == "asserted") return Provenance::Asserted;
    if (s == "inferred") return Provenance::Inferred;
    throw std::invalid_argument("Unknown provenance: " + s);
}

std::string status_to_string(RelationStatus status) {
    switch (status) {
        case RelationStatus::Confirmed: return "confirmed";
        case RelationStatus::Provisional: return "provisional";
        default: return "unknown";
    }
}

RelationStatus string_to_status(const std::string& s) {
    if (s == "confirmed") return RelationStatus::Confirmed;
    if (s == "provisional") return RelationStatus::Provisional;
    throw std::invalid_argument("Unknown relation status: " + s);
}

std::string relation_error_to_string(RelationError error) {
    switch (error) {
        case RelationError::None: return "none";
        case RelationError::Duplicate: return "duplicate";
        case RelationError::InvalidType: return "invalid_type";
        case RelationError::NotFound: return "not_found";
        case RelationError::AlreadyResolved: return "already_resolved";
        default: return "unknown";
    }
}

bool status_matches(StatusFilter filter, RelationStatus status) {
    switch (filter) {
        case StatusFilter::Confirmed: return status == RelationStatus::Confirmed;
        case StatusFilter::Provisional: return status == RelationStatus::Provisional;
        default: return true;
    }
}

// ==========================================
// DerivationStep Implementation
// ==========================================

nlohmann::json DerivationStep::to_json() const {
    nlohmann::json j;
    j["relation_id"] = relation_id;
    j["rule"] = rule;
    if (!via.empty()) {
        j["via"] = via;
    }
    return j;
}

DerivationStep DerivationStep::from_json(const nlohmann::json& j) {
    DerivationStep step;
    step.relation_id = j.at("relation_id").get<std::string>();
    step.rule = j.value("rule", "");
    step.via = j.value("via", "");
    return step;
}

// ==========================================
// RelationKey Implementation
// ==========================================

std::string RelationKey::to_string() const {
    return source_id + " --" + relation_type + "--> " + target_id;
}

// ==========================================
// Relation Implementation
// ==========================================

std::vector<std::string> Relation::derivation_path() const {
    std::vector<std::string> path;
    path.reserve(derivation.size());
    for (const auto& step : derivation) {
        path.push_back(step.relation_id);
    }
    return path;
}

std::vector<std::string> Relation::rules_applied() const {
    std::vector<std::string> rules;
    rules.reserve(derivation.size());
    for (const auto& step : derivation) {
        rules.push_back(step.rule);
    }
    return rules;
}

bool Relation::depends_on(const std::string& relation_id) const {
    return std::any_of(derivation.begin(), derivation.end(),
        [&](const DerivationStep& step) { return step.relation_id == relation_id; });
}

nlohmann::json Relation::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["source_id"] = source_id;
    j["target_id"] = target_id;
    j["relation_type"] = relation_type;
    j["confidence"] = confidence;
    j["provenance"] = provenance_to_string(provenance);
    j["status"] = status_to_string(status);
    j["created_at"] = created_at;
    j["created_by"] = created_by;

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : derivation) {
        steps.push_back(step.to_json());
    }
    j["derivation"] = steps;

    if (!metadata.empty()) {
        j["metadata"] = metadata;
    }

    return j;
}

Relation Relation::from_json(const nlohmann::json& j) {
    Relation relation;
    relation.id = j.at("id").get<std::string>();
    relation.source_id = j.at("source_id").get<std::string>();
    relation.target_id = j.at("target_id").get<std::string>();
    relation.relation_type = j.at("relation_type").get<std::string>();
    relation.confidence = j.value("confidence", 1.0);
    relation.provenance = string_to_provenance(j.value("provenance", "asserted"));
    relation.status = string_to_status(j.value("status", "confirmed"));
    relation.created_at = j.value("created_at", "");
    relation.created_by = j.value("created_by", "");
    relation.metadata = j.value("metadata", "");

    if (j.contains("derivation")) {
        for (const auto& step : j["derivation"]) {
            relation.derivation.push_back(DerivationStep::from_json(step));
        }
    }

    return relation;
}

Relation make_asserted(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type,
    double confidence,
    const std::string& created_by
) {
    Relation relation;
    relation.source_id = source_id;
    relation.target_id = target_id;
    relation.relation_type = relation_type;
    relation.confidence = confidence;
    relation.provenance = Provenance::Asserted;
    relation.status = RelationStatus::Confirmed;
    relation.created_by = created_by;
    return relation;
}

// ==========================================
// Keys, ids and timestamps
// ==========================================

RelationKey canonical_key(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type,
    const RelationTypeRegistry& types
) {
    if (types.is_symmetric(relation_type) && target_id < source_id) {
        return {target_id, source_id, relation_type};
    }
    return {source_id, target_id, relation_type};
}

RelationKey canonical_key(const Relation& relation, const RelationTypeRegistry& types) {
    return canonical_key(relation.source_id, relation.target_id, relation.relation_type, types);
}

std::string generate_relation_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::stringstream ss;
    ss << "rel_" << std::hex << std::setw(16) << std::setfill('0') << rng();
    return ss.str();
}

std::string current_timestamp_utc() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return ss.str();
}

} // namespace lexigraph
