#pragma once

#include "backend/backend_selector.hpp"
#include "graph/relation_types.hpp"
#include "inference/bulk_reinference.hpp"
#include "inference/inference_orchestrator.hpp"
#include "service/relation_service.hpp"
#include <string>
#include <vector>

namespace lexigraph {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Configuration for the relation store and inference engine
 */
struct EngineConfig {
    // Storage Configuration
    std::string database_path = "lexigraph.db";     ///< SQLite file, or ":memory:"
    std::string backend = "auto";                   ///< "auto", "relational" or "graph"

    // Inference Configuration
    double decay = 0.9;                             ///< Per-hop confidence multiplier
    int max_depth = 3;                              ///< Default traversal depth
    double min_confidence = 0.0;                    ///< Candidates below this are abandoned
    std::vector<std::string> default_rules = rule_names(all_rules());

    // Relation Types
    RelationTypeRegistry relation_types = RelationTypeRegistry::with_defaults();

    // Service Configuration
    bool verify_terms = false;                      ///< Reject assertions on unknown terms
    std::string terms_file;                         ///< JSON array of known term ids

    // Bulk Re-inference Configuration
    size_t bulk_chunk_size = 100;                   ///< Terms per checkpointed chunk
    std::string checkpoint_path = "lexigraph_reinfer.checkpoint.json";

    // Backend Selection
    BackendPolicy backend_policy;

    bool verbose = false;                           ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load from environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    InferenceConfig inference_config() const;
    BulkOptions bulk_options() const;
    ServiceOptions service_options() const;
};

/**
 * @brief Load configuration from file with fallback to environment
 *
 * Tries the given path, then lexigraph.json in the working directory and its
 * parents. Environment variables override whatever file was found.
 */
EngineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace lexigraph
