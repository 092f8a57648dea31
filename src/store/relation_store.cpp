#include "store/relation_store.hpp"
#include <algorithm>

namespace lexigraph {

std::string commit_kind_to_string(CommitKind kind) {
    switch (kind) {
        case CommitKind::Inserted: return "inserted";
        case CommitKind::Merged: return "merged";
        case CommitKind::DroppedConfirmed: return "dropped_confirmed";
        default: return "unknown";
    }
}

nlohmann::json StoreStatistics::to_json() const {
    nlohmann::json j;
    j["num_relations"] = num_relations;
    j["num_confirmed"] = num_confirmed;
    j["num_provisional"] = num_provisional;
    j["num_asserted"] = num_asserted;
    j["num_inferred"] = num_inferred;
    j["num_terms"] = num_terms;
    j["by_type"] = by_type;
    return j;
}

RelationError validate_relation(
    const Relation& relation,
    const RelationTypeRegistry& types,
    std::string& message
) {
    if (relation.source_id.empty() || relation.target_id.empty()) {
        throw std::invalid_argument("Relation endpoints must not be empty");
    }
    if (relation.confidence < 0.0 || relation.confidence > 1.0) {
        throw std::invalid_argument(
            "Confidence must be in [0, 1], got " + std::to_string(relation.confidence));
    }

    if (!types.contains(relation.relation_type)) {
        message = "Unknown relation type: " + relation.relation_type;
        return RelationError::InvalidType;
    }
    if (relation.is_self_loop() && !types.is_reflexive(relation.relation_type)) {
        message = "Relation type '" + relation.relation_type +
                  "' is not reflexive; source and target must differ";
        return RelationError::InvalidType;
    }

    message.clear();
    return RelationError::None;
}

Relation prepare_for_insert(const Relation& relation) {
    Relation prepared = relation;
    if (prepared.id.empty()) {
        prepared.id = generate_relation_id();
    }
    if (prepared.created_at.empty()) {
        prepared.created_at = current_timestamp_utc();
    }
    return prepared;
}

bool preferred_derivation(const Relation& a, const Relation& b) {
    if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
    }
    return a.derivation.size() < b.derivation.size();
}

WritePlan plan_put(const std::optional<Relation>& existing, const Relation& incoming) {
    WritePlan plan;

    if (!existing) {
        plan.action = WriteAction::Insert;
        plan.relation = prepare_for_insert(incoming);
        return plan;
    }

    plan.relation = *existing;

    if (existing->is_confirmed()) {
        // Re-assertion never duplicates; it can only raise confidence
        plan.error = RelationError::Duplicate;
        if (incoming.is_confirmed() && incoming.confidence > existing->confidence) {
            plan.relation.confidence = incoming.confidence;
            plan.action = WriteAction::Update;
        }
        return plan;
    }

    if (incoming.is_confirmed()) {
        // Asserting a pending inference promotes it in place
        plan.action = WriteAction::Update;
        plan.promoted = true;
        plan.relation.provenance = incoming.provenance;
        plan.relation.status = RelationStatus::Confirmed;
        plan.relation.derivation = incoming.derivation;
        plan.relation.confidence = std::max(existing->confidence, incoming.confidence);
        plan.relation.created_by = incoming.created_by;
        if (!incoming.metadata.empty()) {
            plan.relation.metadata = incoming.metadata;
        }
        return plan;
    }

    plan.error = RelationError::Duplicate;
    WritePlan merged = plan_commit(existing, incoming);
    plan.action = merged.action;
    plan.relation = merged.relation;
    return plan;
}

WritePlan plan_commit(const std::optional<Relation>& existing, const Relation& candidate) {
    WritePlan plan;

    if (!existing) {
        plan.action = WriteAction::Insert;
        plan.kind = CommitKind::Inserted;
        plan.relation = prepare_for_insert(candidate);
        plan.relation.status = RelationStatus::Provisional;
        plan.relation.provenance = Provenance::Inferred;
        return plan;
    }

    plan.relation = *existing;

    if (existing->is_confirmed()) {
        plan.kind = CommitKind::DroppedConfirmed;
        return plan;
    }

    plan.kind = CommitKind::Merged;
    if (preferred_derivation(candidate, *existing)) {
        plan.relation.confidence = candidate.confidence;
        plan.relation.derivation = candidate.derivation;
        plan.action = WriteAction::Update;
    }
    return plan;
}

} // namespace lexigraph
