#include "inference/candidate.hpp"
#include <algorithm>
#include <tuple>

namespace lexigraph {

std::vector<std::string> CandidateRelation::derivation_path() const {
    std::vector<std::string> path;
    path.reserve(derivation.size());
    for (const auto& step : derivation) {
        path.push_back(step.relation_id);
    }
    return path;
}

Relation CandidateRelation::to_relation() const {
    Relation relation;
    relation.id = id;
    relation.source_id = source_id;
    relation.target_id = target_id;
    relation.relation_type = relation_type;
    relation.confidence = confidence;
    relation.provenance = Provenance::Inferred;
    relation.status = RelationStatus::Provisional;
    relation.derivation = derivation;
    relation.created_by = "inference";
    return relation;
}

nlohmann::json CandidateRelation::to_json() const {
    nlohmann::json j;
    if (!id.empty()) {
        j["id"] = id;
    }
    j["source_id"] = source_id;
    j["target_id"] = target_id;
    j["relation_type"] = relation_type;
    j["confidence"] = confidence;
    j["derivation_path"] = derivation_path();

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : derivation) {
        steps.push_back(step.to_json());
    }
    j["derivation"] = steps;
    return j;
}

bool better_candidate(const CandidateRelation& a, const CandidateRelation& b) {
    if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
    }
    if (a.derivation.size() != b.derivation.size()) {
        return a.derivation.size() < b.derivation.size();
    }
    if (a.earliest_created_at != b.earliest_created_at) {
        return a.earliest_created_at < b.earliest_created_at;
    }
    return a.derivation_path() < b.derivation_path();
}

void sort_candidates(std::vector<CandidateRelation>& candidates) {
    std::sort(candidates.begin(), candidates.end(),
        [](const CandidateRelation& a, const CandidateRelation& b) {
            if (a.confidence != b.confidence) return a.confidence > b.confidence;
            return std::tie(a.source_id, a.relation_type, a.target_id) <
                   std::tie(b.source_id, b.relation_type, b.target_id);
        });
}

} // namespace lexigraph
