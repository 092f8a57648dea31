#include "service/relation_service.hpp"
#include <algorithm>
#include <deque>
#include <iostream>
#include <set>

namespace lexigraph {

std::string direction_to_string(Direction direction) {
    switch (direction) {
        case Direction::Outgoing: return "outgoing";
        case Direction::Incoming: return "incoming";
        case Direction::Both: return "both";
        default: return "unknown";
    }
}

Direction string_to_direction(const std::string& s) {
    if (s == "outgoing" || s == "out") return Direction::Outgoing;
    if (s == "incoming" || s == "in") return Direction::Incoming;
    if (s == "both") return Direction::Both;
    throw std::invalid_argument("Unknown direction: " + s);
}

nlohmann::json InvalidationReport::to_json() const {
    nlohmann::json j;
    j["error"] = relation_error_to_string(error);
    if (deleted) {
        j["deleted"] = deleted->to_json();
    }

    j["rederived"] = nlohmann::json::array();
    for (const auto& relation : rederived) {
        j["rederived"].push_back(relation.to_json());
    }
    j["retracted"] = nlohmann::json::array();
    for (const auto& relation : retracted) {
        j["retracted"].push_back(relation.to_json());
    }
    return j;
}

RelationService::RelationService(
    RelationStore& store,
    InferenceOrchestrator& orchestrator,
    const TermDirectory& terms,
    ServiceOptions options
)
    : store_(store), orchestrator_(orchestrator), terms_(terms), options_(options) {}

PutResult RelationService::create_relation(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type,
    double confidence,
    const std::string& created_by,
    const std::string& metadata
) {
    if (options_.verify_terms) {
        for (const auto& term : {source_id, target_id}) {
            if (!terms_.term_exists(term)) {
                PutResult result;
                result.error = RelationError::NotFound;
                result.error_message = "Unknown term: " + term;
                return result;
            }
        }
    }

    Relation relation = make_asserted(source_id, target_id, relation_type, confidence, created_by);
    relation.metadata = metadata;

    PutResult result = store_.put(relation);

    if (options_.verbose) {
        std::cout << "[assert] " << source_id << " --" << relation_type << "--> " << target_id
                  << ": " << (result.error == RelationError::None ? "created"
                                                                 : relation_error_to_string(result.error))
                  << (result.promoted ? " (promoted pending inference)" : "")
                  << (result.id.empty() ? "" : " " + result.id) << "\n";
    }
    return result;
}

std::vector<Relation> RelationService::get_relations(
    const std::string& term_id,
    Direction direction,
    const std::string& relation_type
) const {
    std::vector<Relation> result;
    std::set<std::string> seen;

    auto append = [&](std::vector<Relation> relations) {
        for (auto& relation : relations) {
            if (seen.insert(relation.id).second) {
                result.push_back(std::move(relation));
            }
        }
    };

    if (direction != Direction::Incoming) {
        append(store_.get_outgoing(term_id, relation_type, StatusFilter::Confirmed));
    }
    if (direction != Direction::Outgoing) {
        append(store_.get_incoming(term_id, relation_type, StatusFilter::Confirmed));
    }
    return result;
}

InvalidationReport RelationService::delete_relation(const std::string& relation_id) {
    InvalidationReport report;

    DeleteResult deleted = store_.remove(relation_id);
    if (!deleted.success()) {
        report.error = deleted.error;
        return report;
    }
    report.deleted = deleted.deleted;

    std::set<std::string> excluded = {relation_id};
    std::deque<Relation> worklist(deleted.affected.begin(), deleted.affected.end());

    auto record_rederived = [&](const Relation& relation) {
        for (auto& existing : report.rederived) {
            if (existing.id == relation.id) {
                existing = relation;
                return;
            }
        }
        report.rederived.push_back(relation);
    };

    // Every retraction can only enqueue dependents of the retracted edge, so
    // the worklist drains once no more edges are removed.
    while (!worklist.empty()) {
        Relation edge = std::move(worklist.front());
        worklist.pop_front();

        auto current = store_.get(edge.id);
        if (!current) continue;

        auto alternative = orchestrator_.rederive(*current, excluded);
        if (alternative) {
            Relation updated = *current;
            updated.derivation = alternative->derivation;
            // An approved edge keeps the reviewer's confidence unless the new derivation beats it
            updated.confidence = current->is_confirmed()
                ? std::max(current->confidence, alternative->confidence)
                : alternative->confidence;
            if (!store_.update(updated)) continue;
            record_rederived(updated);
            continue;
        }

        DeleteResult retracted = store_.remove(edge.id);
        if (!retracted.success()) continue;

        excluded.insert(edge.id);
        report.retracted.push_back(*retracted.deleted);
        for (auto& dependent : retracted.affected) {
            worklist.push_back(std::move(dependent));
        }
    }

    // Re-derived first and retracted later: report as retracted only
    for (auto it = report.rederived.begin(); it != report.rederived.end();) {
        if (!store_.get(it->id)) {
            it = report.rederived.erase(it);
        } else {
            ++it;
        }
    }

    if (options_.verbose) {
        std::cout << "[delete] " << relation_id << ": " << report.rederived.size()
                  << " re-derived, " << report.retracted.size() << " retracted\n";
    }
    return report;
}

} // namespace lexigraph
