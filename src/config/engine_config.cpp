#include "config/engine_config.hpp"
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace lexigraph {

namespace {

bool env_flag(const char* value) {
    std::string s(value);
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

// Numeric variables that do not parse are reported and ignored
template <typename T, typename Parse>
void read_env(const char* name, T& target, Parse parse) {
    const char* value = std::getenv(name);
    if (!value || !*value) return;
    try {
        target = static_cast<T>(parse(std::string(value)));
    } catch (const std::exception& e) {
        std::cerr << "Warning: ignoring " << name << "=" << value << ": " << e.what() << "\n";
    }
}

void apply_environment(EngineConfig& config) {
    const char* db = std::getenv("LEXIGRAPH_DB");
    if (db && *db) config.database_path = db;

    const char* backend = std::getenv("LEXIGRAPH_BACKEND");
    if (backend && *backend) config.backend = backend;

    read_env("LEXIGRAPH_DECAY", config.decay,
             [](const std::string& s) { return std::stod(s); });
    read_env("LEXIGRAPH_MAX_DEPTH", config.max_depth,
             [](const std::string& s) { return std::stoi(s); });
    read_env("LEXIGRAPH_EDGE_THRESHOLD", config.backend_policy.edge_threshold,
             [](const std::string& s) { return std::stoull(s); });

    const char* verbose = std::getenv("LEXIGRAPH_VERBOSE");
    if (verbose) config.verbose = env_flag(verbose);
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    // Storage config
    if (j.contains("database_path")) config.database_path = j["database_path"];
    if (j.contains("backend")) config.backend = j["backend"];

    // Inference config
    if (j.contains("decay")) config.decay = j["decay"];
    if (j.contains("max_depth")) config.max_depth = j["max_depth"];
    if (j.contains("min_confidence")) config.min_confidence = j["min_confidence"];
    if (j.contains("default_rules")) {
        config.default_rules = j["default_rules"].get<std::vector<std::string>>();
    }

    // Relation types extend the built-in registry
    if (j.contains("relation_types")) {
        for (const auto& item : j["relation_types"]) {
            config.relation_types.register_type(RelationTypeTraits::from_json(item));
        }
    }

    // Service config
    if (j.contains("verify_terms")) config.verify_terms = j["verify_terms"];
    if (j.contains("terms_file")) config.terms_file = j["terms_file"];

    // Bulk config
    if (j.contains("bulk_chunk_size")) config.bulk_chunk_size = j["bulk_chunk_size"];
    if (j.contains("checkpoint_path")) config.checkpoint_path = j["checkpoint_path"];

    // Backend policy, nested or flat
    if (j.contains("backend_policy")) {
        config.backend_policy = BackendPolicy::from_json(j["backend_policy"]);
    } else if (j.contains("edge_threshold")) {
        config.backend_policy.edge_threshold = j["edge_threshold"];
    }

    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

json EngineConfig::to_json() const {
    json j;

    j["database_path"] = database_path;
    j["backend"] = backend;

    j["decay"] = decay;
    j["max_depth"] = max_depth;
    j["min_confidence"] = min_confidence;
    j["default_rules"] = default_rules;

    j["relation_types"] = relation_types.to_json();

    j["verify_terms"] = verify_terms;
    if (!terms_file.empty()) {
        j["terms_file"] = terms_file;
    }

    j["bulk_chunk_size"] = bulk_chunk_size;
    j["checkpoint_path"] = checkpoint_path;

    j["backend_policy"] = backend_policy.to_json();
    j["verbose"] = verbose;

    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;
    apply_environment(config);
    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (database_path.empty()) {
        error_message = "Database path is required";
        return false;
    }

    if (backend != "auto" && backend != "relational" && backend != "graph") {
        error_message = "Backend must be 'auto', 'relational' or 'graph'";
        return false;
    }

    if (decay <= 0.0 || decay > 1.0) {
        error_message = "Decay must be in (0.0, 1.0]";
        return false;
    }

    if (max_depth < 1) {
        error_message = "Max depth must be at least 1";
        return false;
    }

    if (min_confidence < 0.0 || min_confidence > 1.0) {
        error_message = "Min confidence must be between 0.0 and 1.0";
        return false;
    }

    try {
        parse_rules(default_rules);
    } catch (const std::invalid_argument& e) {
        error_message = e.what();
        return false;
    }

    if (verify_terms && terms_file.empty()) {
        error_message = "verify_terms requires terms_file";
        return false;
    }

    if (bulk_chunk_size == 0) {
        error_message = "Bulk chunk size must be positive";
        return false;
    }

    return backend_policy.validate(error_message);
}

InferenceConfig EngineConfig::inference_config() const {
    InferenceConfig config;
    config.decay = decay;
    config.min_confidence = min_confidence;
    config.max_depth = max_depth;
    config.default_rules = parse_rules(default_rules);
    config.verbose = verbose;
    return config;
}

BulkOptions EngineConfig::bulk_options() const {
    BulkOptions options;
    options.max_depth = max_depth;
    options.chunk_size = bulk_chunk_size;
    options.checkpoint_path = checkpoint_path;
    return options;
}

ServiceOptions EngineConfig::service_options() const {
    ServiceOptions options;
    options.verify_terms = verify_terms;
    options.verbose = verbose;
    return options;
}

// ============================================================================
// Utility Functions
// ============================================================================

EngineConfig load_config_with_fallback(const std::string& config_path) {
    if (!config_path.empty()) {
        // An explicitly named file must load
        EngineConfig config = EngineConfig::from_json_file(config_path);
        apply_environment(config);
        return config;
    }

    const std::vector<std::string> paths_to_try = {
        "lexigraph.json",
        "../lexigraph.json",
        "../../lexigraph.json"
    };

    for (const auto& path : paths_to_try) {
        if (!file_exists(path)) continue;
        try {
            EngineConfig config = EngineConfig::from_json_file(path);
            apply_environment(config);
            return config;
        } catch (const std::exception& e) {
            std::cerr << "Warning: skipping config " << path << ": " << e.what() << "\n";
        }
    }

    return EngineConfig::from_environment();
}

} // namespace lexigraph
