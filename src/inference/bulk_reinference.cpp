#include "inference/bulk_reinference.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>

namespace lexigraph {

// ============================================================================
// BulkCheckpoint
// ============================================================================

nlohmann::json BulkCheckpoint::to_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["terms"] = terms;
    j["next_index"] = next_index;
    j["total"] = total();
    j["completed"] = completed;
    j["candidates"] = candidates;
    j["failed_term"] = failed_term;
    j["error_message"] = error_message;
    return j;
}

BulkCheckpoint BulkCheckpoint::from_json(const nlohmann::json& j) {
    BulkCheckpoint checkpoint;
    checkpoint.run_id = j.value("run_id", "");
    checkpoint.terms = j.at("terms").get<std::vector<std::string>>();
    checkpoint.next_index = j.value("next_index", size_t(0));
    checkpoint.completed = j.value("completed", size_t(0));
    checkpoint.candidates = j.value("candidates", size_t(0));
    checkpoint.failed_term = j.value("failed_term", "");
    checkpoint.error_message = j.value("error_message", "");

    if (checkpoint.next_index > checkpoint.terms.size()) {
        throw std::invalid_argument("Checkpoint next_index is past the end of its term list");
    }
    return checkpoint;
}

void BulkCheckpoint::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write checkpoint: " + path);
    }
    file << to_json().dump(2);
}

std::optional<BulkCheckpoint> BulkCheckpoint::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    file >> j;
    return from_json(j);
}

// ============================================================================
// BulkReinference
// ============================================================================

BulkReinference::BulkReinference(InferenceOrchestrator& orchestrator, BulkOptions options)
    : orchestrator_(orchestrator), options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
}

void BulkReinference::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

BulkReport BulkReinference::run(const std::vector<std::string>& terms, const CancellationToken* token) {
    checkpoint_ = BulkCheckpoint{};
    checkpoint_.run_id = "bulk_" + current_timestamp_utc();
    checkpoint_.terms = terms;
    save_checkpoint();
    return process(token);
}

BulkReport BulkReinference::run_all(const CancellationToken* token) {
    return run(orchestrator_.store().terms(), token);
}

BulkReport BulkReinference::resume(const BulkCheckpoint& checkpoint, const CancellationToken* token) {
    checkpoint_ = checkpoint;
    checkpoint_.failed_term.clear();
    checkpoint_.error_message.clear();
    return process(token);
}

BulkReport BulkReinference::process(const CancellationToken* token) {
    BulkReport report;
    const bool verbose = orchestrator_.config().verbose;
    const size_t total = checkpoint_.total();

    if (verbose) {
        std::cout << "[bulk] " << checkpoint_.run_id << ": terms "
                  << checkpoint_.next_index << ".." << total << "\n";
    }

    while (!checkpoint_.finished()) {
        size_t chunk_end = std::min(checkpoint_.next_index + options_.chunk_size, total);

        for (size_t i = checkpoint_.next_index; i < chunk_end; i++) {
            if (token && token->cancelled()) {
                checkpoint_.next_index = i;
                save_checkpoint();
                report.checkpoint = checkpoint_;
                report.cancelled = true;
                return report;
            }

            const std::string& term = checkpoint_.terms[i];
            InferenceRequest request;
            request.source_id = term;
            request.rules = options_.rules;
            request.max_depth = options_.max_depth;

            try {
                InferenceResult result = orchestrator_.run(request, token);
                if (result.cancelled) {
                    checkpoint_.next_index = i;
                    save_checkpoint();
                    report.checkpoint = checkpoint_;
                    report.cancelled = true;
                    return report;
                }
                checkpoint_.candidates += result.candidates.size();
            } catch (const std::exception& e) {
                checkpoint_.next_index = i;
                checkpoint_.failed_term = term;
                checkpoint_.error_message = e.what();
                save_checkpoint();
                std::cerr << "[bulk] " << checkpoint_.run_id << ": failed at term '" << term
                          << "' (" << i << "/" << total << "): " << e.what() << "\n";
                throw;
            }
            checkpoint_.completed++;
        }

        checkpoint_.next_index = chunk_end;
        save_checkpoint();
        report.chunks++;

        if (progress_callback_) {
            progress_callback_("reinfer", static_cast<int>(chunk_end), static_cast<int>(total),
                               std::to_string(checkpoint_.candidates) + " candidates");
        }
        if (verbose) {
            std::cout << "[bulk] " << chunk_end << "/" << total << " terms, "
                      << checkpoint_.candidates << " candidates\n";
        }
    }

    report.checkpoint = checkpoint_;
    return report;
}

void BulkReinference::save_checkpoint() const {
    if (!options_.checkpoint_path.empty()) {
        checkpoint_.save(options_.checkpoint_path);
    }
}

} // namespace lexigraph
