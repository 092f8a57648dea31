#pragma once

#include "inference/inference_orchestrator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lexigraph {

/**
 * @brief Progress of a bulk re-inference run, persisted after every chunk
 */
struct BulkCheckpoint {
    std::string run_id;
    std::vector<std::string> terms;     // Partition order, fixed for the run
    size_t next_index = 0;              // First term not yet processed
    size_t completed = 0;
    size_t candidates = 0;              // Candidates committed so far
    std::string failed_term;
    std::string error_message;

    size_t total() const { return terms.size(); }
    bool finished() const { return next_index >= terms.size(); }

    nlohmann::json to_json() const;
    static BulkCheckpoint from_json(const nlohmann::json& j);

    /**
     * @brief Write to a JSON file
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const std::string& path) const;

    /**
     * @brief Read a checkpoint file; nullopt if it does not exist
     */
    static std::optional<BulkCheckpoint> load(const std::string& path);
};

struct BulkOptions {
    std::vector<Rule> rules;            // Empty: orchestrator defaults
    int max_depth = 3;
    size_t chunk_size = 100;
    std::string checkpoint_path;        // Empty: keep the checkpoint in memory only
};

struct BulkReport {
    BulkCheckpoint checkpoint;
    size_t chunks = 0;                  // Chunks completed by this call
    bool cancelled = false;
};

/**
 * @brief Re-runs inference over many terms in resumable chunks
 *
 * Terms are processed in order, `chunk_size` at a time. After each chunk the
 * checkpoint is saved. On failure the checkpoint records the failing term and
 * the exception is rethrown; resume() then continues from that term without
 * revisiting the ones already done.
 */
class BulkReinference {
public:
    BulkReinference(InferenceOrchestrator& orchestrator, BulkOptions options);

    /**
     * @brief Start a new run over `terms`
     */
    BulkReport run(const std::vector<std::string>& terms, const CancellationToken* token = nullptr);

    /**
     * @brief Start a new run over every term in the store
     */
    BulkReport run_all(const CancellationToken* token = nullptr);

    /**
     * @brief Continue an interrupted run
     */
    BulkReport resume(const BulkCheckpoint& checkpoint, const CancellationToken* token = nullptr);

    const BulkCheckpoint& checkpoint() const { return checkpoint_; }

    void set_progress_callback(ProgressCallback callback);

private:
    BulkReport process(const CancellationToken* token);
    void save_checkpoint() const;

    InferenceOrchestrator& orchestrator_;
    BulkOptions options_;
    BulkCheckpoint checkpoint_;
    ProgressCallback progress_callback_;
};

} // namespace lexigraph
