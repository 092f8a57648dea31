#pragma once
// Review queue: human decisions on inferred relations
//
// Provisional edges written by the inference orchestrator wait here until a
// reviewer approves them (they become confirmed) or rejects them (they are
// deleted, leaving no trace that would block a later re-proposal).

#include "store/relation_store.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lexigraph {

enum class ReviewDecision {
    Approve,
    Reject
};

std::string review_decision_to_string(ReviewDecision decision);
ReviewDecision string_to_review_decision(const std::string& s);

// Review statistics for the lifetime of the queue
struct ReviewStats {
    size_t pending = 0;
    size_t approved = 0;
    size_t rejected = 0;
    double approval_rate = 0.0;     // approved / (approved + rejected)

    nlohmann::json to_json() const;
};

struct ResolveResult {
    RelationError error = RelationError::None;
    std::optional<Relation> relation;   // Approved edge, or the deleted one on reject
    std::string error_message;

    bool success() const { return error == RelationError::None; }
};

class ReviewQueue {
public:
    explicit ReviewQueue(RelationStore& store) : store_(store) {}

    // Provisional edges, oldest first; limit 0 returns all
    std::vector<Relation> get_pending(size_t limit = 0) const;

    // Resolve one provisional edge.
    // NotFound for unknown ids, AlreadyResolved for edges that are not provisional.
    // Throws std::invalid_argument if reviewer_confidence is outside [0, 1].
    ResolveResult resolve(
        const std::string& relation_id,
        ReviewDecision decision,
        std::optional<double> reviewer_confidence = std::nullopt,
        const std::string& reviewer = ""
    );

    ReviewStats statistics() const;

private:
    RelationStore& store_;
    mutable std::mutex mutex_;
    size_t approved_ = 0;
    size_t rejected_ = 0;
};

} // namespace lexigraph
