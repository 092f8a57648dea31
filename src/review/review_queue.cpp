#include "review/review_queue.hpp"
#include <stdexcept>

namespace lexigraph {

std::string review_decision_to_string(ReviewDecision decision) {
    switch (decision) {
        case ReviewDecision::Approve: return "approve";
        case ReviewDecision::Reject: return "reject";
        default: return "unknown";
    }
}

ReviewDecision string_to_review_decision(const std::string& s) {
    if (s == "approve" || s == "approved") return ReviewDecision::Approve;
    if (s == "reject" || s == "rejected") return ReviewDecision::Reject;
    throw std::invalid_argument("Unknown review decision: " + s);
}

nlohmann::json ReviewStats::to_json() const {
    nlohmann::json j;
    j["pending"] = pending;
    j["approved"] = approved;
    j["rejected"] = rejected;
    j["approval_rate"] = approval_rate;
    return j;
}

std::vector<Relation> ReviewQueue::get_pending(size_t limit) const {
    return store_.list(StatusFilter::Provisional, limit);
}

ResolveResult ReviewQueue::resolve(
    const std::string& relation_id,
    ReviewDecision decision,
    std::optional<double> reviewer_confidence,
    const std::string& reviewer
) {
    if (reviewer_confidence && (*reviewer_confidence < 0.0 || *reviewer_confidence > 1.0)) {
        throw std::invalid_argument("Reviewer confidence must be in [0, 1]");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ResolveResult result;

    auto relation = store_.get(relation_id);
    if (!relation) {
        result.error = RelationError::NotFound;
        result.error_message = "No relation with id " + relation_id;
        return result;
    }
    if (relation->is_confirmed()) {
        result.error = RelationError::AlreadyResolved;
        result.error_message = "Relation " + relation_id + " is already confirmed";
        return result;
    }

    if (decision == ReviewDecision::Reject) {
        DeleteResult deleted = store_.remove(relation_id);
        if (!deleted.success()) {
            result.error = deleted.error;
            result.error_message = "Relation " + relation_id + " disappeared during review";
            return result;
        }
        result.relation = deleted.deleted;
        rejected_++;
        return result;
    }

    relation->status = RelationStatus::Confirmed;
    if (reviewer_confidence) {
        relation->confidence = *reviewer_confidence;
    }
    if (!reviewer.empty()) {
        relation->created_by = reviewer;
    }

    if (!store_.update(*relation)) {
        result.error = RelationError::NotFound;
        result.error_message = "Relation " + relation_id + " disappeared during review";
        return result;
    }

    result.relation = relation;
    approved_++;
    return result;
}

ReviewStats ReviewQueue::statistics() const {
    ReviewStats stats;
    stats.pending = store_.statistics().num_provisional;

    std::lock_guard<std::mutex> lock(mutex_);
    stats.approved = approved_;
    stats.rejected = rejected_;
    size_t decided = approved_ + rejected_;
    stats.approval_rate = decided == 0 ? 0.0 : static_cast<double>(approved_) / decided;
    return stats;
}

} // namespace lexigraph
