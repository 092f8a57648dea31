#include "cli/cli.hpp"
#include "backend/backend_selector.hpp"
#include "backend/migration.hpp"
#include "config/engine_config.hpp"
#include "inference/bulk_reinference.hpp"
#include "inference/inference_orchestrator.hpp"
#include "review/review_queue.hpp"
#include "service/relation_service.hpp"
#include "service/term_directory.hpp"
#include "store/memory_graph_store.hpp"
#include "store/sqlite_relation_store.hpp"
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

using namespace lexigraph;

// ============== Helper Functions ==============

namespace {

CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.cancel();
}

std::string format_confidence(double confidence) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(3) << confidence;
    return ss.str();
}

void print_relation(const Relation& relation) {
    std::cout << "  " << relation.id << "  "
              << relation.source_id << " -[" << relation.relation_type << "]-> " << relation.target_id
              << "  conf=" << format_confidence(relation.confidence)
              << "  " << status_to_string(relation.status)
              << "/" << provenance_to_string(relation.provenance) << "\n";

    if (relation.is_inferred()) {
        std::cout << "      via ";
        const auto path = relation.derivation_path();
        for (size_t i = 0; i < path.size(); ++i) {
            if (i > 0) std::cout << " -> ";
            std::cout << path[i];
        }
        std::cout << "  (";
        const auto rules = relation.rules_applied();
        for (size_t i = 0; i < rules.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << rules[i];
        }
        std::cout << ")\n";
    }
}

void print_candidate(const CandidateRelation& candidate) {
    std::cout << "  " << (candidate.id.empty() ? std::string("(not stored)") : candidate.id) << "  "
              << candidate.source_id << " -[" << candidate.relation_type << "]-> " << candidate.target_id
              << "  conf=" << format_confidence(candidate.confidence) << "\n";
    std::cout << "      via ";
    const auto path = candidate.derivation_path();
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) std::cout << " -> ";
        std::cout << path[i];
    }
    std::cout << "\n";
}

// Config, store and engine shared by every command
struct Session {
    EngineConfig config;
    std::unique_ptr<RelationStore> store;
    std::unique_ptr<TermDirectory> terms;
    std::unique_ptr<InferenceOrchestrator> orchestrator;

    explicit Session(const Args& args) {
        config = load_config_with_fallback(args.get("config").value);
        if (args.has("db")) config.database_path = args.require("db");
        if (args.has("backend")) config.backend = args.require("backend");
        if (args.has("verbose")) config.verbose = true;

        std::string error;
        if (!config.validate(error)) {
            throw std::invalid_argument("Invalid configuration: " + error);
        }

        store = open_backend(config.backend, config.database_path, config.relation_types,
                             config.backend_policy, config.verbose);
        if (config.verify_terms) {
            terms = std::make_unique<StaticTermDirectory>(
                StaticTermDirectory::from_json_file(config.terms_file));
        } else {
            terms = std::make_unique<AnyTermDirectory>();
        }
        orchestrator = std::make_unique<InferenceOrchestrator>(*store, config.inference_config());

        if (config.verbose) {
            std::cout << "Using " << store->backend_name() << " backend at "
                      << config.database_path << " (" << store->size() << " relations)\n";
        }
    }

    RelationService service() {
        return RelationService(*store, *orchestrator, *terms, config.service_options());
    }
};

} // namespace

// ============== lexigraph assert ==============
int cmd_assert(const Args& args) {
    Session session(args);
    RelationService service = session.service();

    PutResult result = service.create_relation(
        args.require("source"),
        args.require("target"),
        args.require("type"),
        args.get("confidence").as_confidence(1.0),
        args.get("by").value
    );

    if (!result.success()) {
        std::cerr << "Error: " << relation_error_to_string(result.error);
        if (!result.error_message.empty()) {
            std::cerr << ": " << result.error_message;
        }
        std::cerr << "\n";
        return 1;
    }

    auto stored = session.store->get(result.id);
    if (result.error == RelationError::Duplicate) {
        std::cout << "Relation already exists" << (result.promoted ? " (promoted to confirmed)" : "") << ":\n";
    } else {
        std::cout << "Relation created:\n";
    }
    if (stored) {
        print_relation(*stored);
    }
    return 0;
}

// ============== lexigraph delete ==============
int cmd_delete(const Args& args) {
    Session session(args);
    RelationService service = session.service();

    std::string relation_id = args.require_positional("id");
    InvalidationReport report = service.delete_relation(relation_id);

    if (!report.success()) {
        std::cerr << "Error: " << relation_error_to_string(report.error) << ": " << relation_id << "\n";
        return 1;
    }

    if (args.has("json")) {
        std::cout << report.to_json().dump(2) << "\n";
        return 0;
    }

    std::cout << "Deleted:\n";
    if (report.deleted) {
        print_relation(*report.deleted);
    }
    if (!report.rederived.empty()) {
        std::cout << "\nRe-derived (" << report.rederived.size() << "):\n";
        for (const auto& relation : report.rederived) print_relation(relation);
    }
    if (!report.retracted.empty()) {
        std::cout << "\nRetracted (" << report.retracted.size() << "):\n";
        for (const auto& relation : report.retracted) print_relation(relation);
    }
    return 0;
}

// ============== lexigraph relations ==============
int cmd_relations(const Args& args) {
    Session session(args);
    RelationService service = session.service();

    std::string term_id = args.require_positional("term");
    Direction direction = args.get("direction").as_direction(Direction::Both);
    auto relations = service.get_relations(term_id, direction, args.get("type").value);

    if (args.has("json")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& relation : relations) j.push_back(relation.to_json());
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << relations.size() << " confirmed relation(s) for " << term_id
              << " (" << direction_to_string(direction) << "):\n";
    for (const auto& relation : relations) {
        print_relation(relation);
    }
    return 0;
}

// ============== lexigraph infer ==============
int cmd_infer(const Args& args) {
    Session session(args);

    InferenceRequest request;
    request.source_id = args.require_positional("term");
    request.rules = args.get("rules").as_rules();
    request.max_depth = args.get("max-depth").as_int(session.config.max_depth);
    request.persist = !args.has("dry-run");

    if (session.config.verbose) {
        session.orchestrator->set_progress_callback(
            [](const std::string& stage, int current, int total, const std::string& message) {
                std::cout << "  [" << stage << "] " << current << "/" << total << " " << message << "\n";
            });
    }

    std::signal(SIGINT, handle_interrupt);
    InferenceResult result = session.orchestrator->run(request, &g_cancel);

    if (result.cancelled) {
        std::cerr << "Inference cancelled, nothing was stored\n";
        return 130;
    }

    if (args.has("json")) {
        nlohmann::json j;
        j["source_id"] = request.source_id;
        j["persisted"] = request.persist;
        j["candidates"] = nlohmann::json::array();
        for (const auto& candidate : result.candidates) j["candidates"].push_back(candidate.to_json());
        j["statistics"] = result.stats.to_json();
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << result.candidates.size() << " candidate(s) from " << request.source_id
              << (request.persist ? ", stored as provisional" : " (dry run)") << ":\n";
    for (const auto& candidate : result.candidates) {
        print_candidate(candidate);
    }
    if (session.config.verbose) {
        result.stats.print_summary();
    }
    return 0;
}

// ============== lexigraph pending ==============
int cmd_pending(const Args& args) {
    Session session(args);
    ReviewQueue queue(*session.store);

    auto pending = queue.get_pending(args.get("limit", "0").as_size());

    if (args.has("json")) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& relation : pending) j.push_back(relation.to_json());
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << pending.size() << " relation(s) awaiting review:\n";
    for (const auto& relation : pending) {
        print_relation(relation);
    }
    return 0;
}

// ============== lexigraph resolve ==============
int cmd_resolve(const Args& args) {
    Session session(args);
    ReviewQueue queue(*session.store);

    std::string relation_id = args.require_positional("id");
    ReviewDecision decision = string_to_review_decision(args.require("decision"));

    std::optional<double> confidence;
    if (args.has("confidence")) {
        confidence = args.get("confidence").as_confidence();
    }

    ResolveResult result = queue.resolve(relation_id, decision, confidence, args.get("reviewer").value);
    if (!result.success()) {
        std::cerr << "Error: " << relation_error_to_string(result.error);
        if (!result.error_message.empty()) {
            std::cerr << ": " << result.error_message;
        }
        std::cerr << "\n";
        return 1;
    }

    std::cout << (decision == ReviewDecision::Approve ? "Approved:\n" : "Rejected and removed:\n");
    if (result.relation) {
        print_relation(*result.relation);
    }
    return 0;
}

// ============== lexigraph reinfer ==============
int cmd_reinfer(const Args& args) {
    Session session(args);

    BulkOptions options = session.config.bulk_options();
    options.rules = args.get("rules").as_rules();
    options.max_depth = args.get("max-depth").as_int(options.max_depth);
    options.chunk_size = args.get("chunk-size").as_size(options.chunk_size);
    if (args.has("checkpoint")) options.checkpoint_path = args.require("checkpoint");

    BulkReinference bulk(*session.orchestrator, options);
    bulk.set_progress_callback([](const std::string&, int current, int total, const std::string&) {
        std::cout << "  [reinfer] " << current << "/" << total << "\r" << std::flush;
    });

    std::signal(SIGINT, handle_interrupt);

    BulkReport report;
    if (args.has("resume")) {
        auto checkpoint = BulkCheckpoint::load(options.checkpoint_path);
        if (!checkpoint) {
            std::cerr << "Error: no checkpoint at " << options.checkpoint_path << "\n";
            return 1;
        }
        std::cout << "Resuming " << checkpoint->run_id << " at term "
                  << checkpoint->next_index << "/" << checkpoint->total() << "\n";
        report = bulk.resume(*checkpoint, &g_cancel);
    } else if (args.has("terms")) {
        report = bulk.run(args.get("terms").as_list(), &g_cancel);
    } else {
        report = bulk.run_all(&g_cancel);
    }

    const BulkCheckpoint& checkpoint = report.checkpoint;
    std::cout << "\n";
    if (report.cancelled) {
        std::cout << "Interrupted after " << checkpoint.next_index << "/" << checkpoint.total()
                  << " terms; resume with --resume\n";
        return 130;
    }

    std::cout << "Re-inferred " << checkpoint.completed << " term(s) in " << report.chunks
              << " chunk(s), " << checkpoint.candidates << " candidate(s) committed\n";
    return 0;
}

// ============== lexigraph stats ==============
int cmd_stats(const Args& args) {
    Session session(args);
    StoreStatistics stats = session.store->statistics();
    ReviewStats review = ReviewQueue(*session.store).statistics();

    if (args.has("json")) {
        nlohmann::json j = stats.to_json();
        j["backend"] = session.store->backend_name();
        j["review"] = review.to_json();
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Relation Store Statistics\n";
    std::cout << std::string(70, '=') << "\n\n";
    std::cout << "  Backend: " << session.store->backend_name() << "\n";
    std::cout << "  Relations: " << stats.num_relations << "\n";
    std::cout << "    Confirmed: " << stats.num_confirmed << "\n";
    std::cout << "    Provisional: " << stats.num_provisional << "\n";
    std::cout << "    Asserted: " << stats.num_asserted << "\n";
    std::cout << "    Inferred: " << stats.num_inferred << "\n";
    std::cout << "  Terms: " << stats.num_terms << "\n";
    std::cout << "\nBy type:\n";
    for (const auto& [type, count] : stats.by_type) {
        std::cout << "  " << type << ": " << count << "\n";
    }
    std::cout << std::string(70, '=') << "\n";
    return 0;
}

// ============== lexigraph benchmark ==============
int cmd_benchmark(const Args& args) {
    EngineConfig config = load_config_with_fallback(args.get("config").value);
    if (args.has("db")) config.database_path = args.require("db");
    if (args.has("samples")) config.backend_policy.benchmark_samples = args.get("samples").as_size();
    if (args.has("depth")) config.backend_policy.benchmark_depth = args.get("depth").as_int();

    SqliteRelationStore relational(config.database_path, config.relation_types);
    MemoryGraphStore graph(config.relation_types);

    std::cout << "Loading " << relational.size() << " relations into the graph backend...\n";
    MigrationReport loaded = migrate(relational, graph);
    if (!loaded.verified) {
        std::cerr << "Error: graph backend copy is incomplete\n";
        return 1;
    }

    BackendSelector selector(config.backend_policy);
    BenchmarkReport report = selector.benchmark(relational, graph);
    BackendDecision decision = selector.decide(report);

    if (args.has("json")) {
        std::cout << decision.to_json().dump(2) << "\n";
        return 0;
    }

    report.print_summary();
    std::cout << "\nRecommended backend: " << backend_kind_to_string(decision.backend)
              << " (" << decision.reason << ")\n";
    if (report.edge_count <= config.backend_policy.edge_threshold) {
        std::cout << "Note: " << report.edge_count << " relations is within the "
                  << config.backend_policy.edge_threshold << " edge threshold; 'auto' stays relational\n";
    }
    return 0;
}

// ============== lexigraph export ==============
int cmd_export(const Args& args) {
    Session session(args);
    std::string output_path = args.require("output");

    export_to_json_file(*session.store, output_path);
    std::cout << "Exported " << session.store->size() << " relations to: " << output_path << "\n";
    return 0;
}

// ============== lexigraph import ==============
int cmd_import(const Args& args) {
    Session session(args);
    std::string input_path = args.require("input");

    std::cout << "Importing relations from: " << input_path << "\n";
    MigrationReport report = import_from_json_file(*session.store, input_path);
    report.print_summary();
    return report.verified ? 0 : 1;
}

// ============== lexigraph config ==============
int cmd_config(const Args& args) {
    EngineConfig config = load_config_with_fallback(args.get("config").value);
    if (args.has("db")) config.database_path = args.require("db");
    if (args.has("backend")) config.backend = args.require("backend");
    if (args.has("verbose")) config.verbose = true;

    std::string error;
    bool valid = config.validate(error);

    if (args.has("output")) {
        config.to_json_file(args.require("output"));
        std::cout << "Configuration written to: " << args.require("output") << "\n";
    } else {
        std::cout << config.to_json().dump(2) << "\n";
    }

    if (!valid) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("lexigraph", "1.0.0");

    cli.add_global_arg({"config", "c", "Path to JSON config file (default: lexigraph.json if present)", "", false, false});
    cli.add_global_arg({"db", "", "Database path (overrides config)", "", false, false});
    cli.add_global_arg({"backend", "", "Backend: auto, relational, graph (overrides config)", "", false, false});
    cli.add_global_arg({"verbose", "V", "Verbose logging", "", false, true});

    // lexigraph assert
    cli.register_command({
        "assert",
        "Assert a confirmed relation between two terms",
        {
            {"source", "s", "Source term id", "", true, false},
            {"target", "t", "Target term id", "", true, false},
            {"type", "y", "Relation type (e.g. is_a, part_of, related_to)", "", true, false},
            {"confidence", "f", "Confidence in [0, 1]", "1.0", false, false},
            {"by", "b", "Author recorded as created_by", "", false, false}
        },
        cmd_assert
    });

    // lexigraph delete
    cli.register_command({
        "delete",
        "Delete a relation and re-evaluate inferences that used it",
        {
            {"id", "i", "Relation id", "", false, false},
            {"json", "j", "Print the invalidation report as JSON", "", false, true}
        },
        cmd_delete,
        "<relation_id>"
    });

    // lexigraph relations
    cli.register_command({
        "relations",
        "List confirmed relations of a term",
        {
            {"term", "t", "Term id", "", false, false},
            {"direction", "d", "outgoing, incoming or both", "both", false, false},
            {"type", "y", "Only this relation type", "", false, false},
            {"json", "j", "Print as JSON", "", false, true}
        },
        cmd_relations,
        "<term_id>"
    });

    // lexigraph infer
    cli.register_command({
        "infer",
        "Infer provisional relations reachable from a term",
        {
            {"term", "t", "Source term id", "", false, false},
            {"rules", "r", "Rules: transitive,symmetric,equivalence,inverse (default: config)", "", false, false},
            {"max-depth", "d", "Maximum number of stored edges per derivation", "", false, false},
            {"dry-run", "n", "Compute candidates without storing them", "", false, true},
            {"json", "j", "Print candidates and statistics as JSON", "", false, true}
        },
        cmd_infer,
        "<term_id>"
    });

    // lexigraph pending
    cli.register_command({
        "pending",
        "List provisional relations awaiting review, oldest first",
        {
            {"limit", "l", "Maximum number to list (0 = all)", "0", false, false},
            {"json", "j", "Print as JSON", "", false, true}
        },
        cmd_pending
    });

    // lexigraph resolve
    cli.register_command({
        "resolve",
        "Approve or reject a provisional relation",
        {
            {"id", "i", "Relation id", "", false, false},
            {"decision", "d", "approve or reject", "", true, false},
            {"confidence", "f", "Reviewer confidence override for approval", "", false, false},
            {"reviewer", "r", "Reviewer recorded on approval", "", false, false}
        },
        cmd_resolve,
        "<relation_id>"
    });

    // lexigraph reinfer
    cli.register_command({
        "reinfer",
        "Re-run inference over many terms with checkpointing",
        {
            {"terms", "t", "Comma-separated term ids (default: every term)", "", false, false},
            {"rules", "r", "Rules to apply (default: config)", "", false, false},
            {"max-depth", "d", "Maximum derivation length", "", false, false},
            {"chunk-size", "k", "Terms per checkpointed chunk", "", false, false},
            {"checkpoint", "p", "Checkpoint file (default: config)", "", false, false},
            {"resume", "", "Continue from the checkpoint file", "", false, true}
        },
        cmd_reinfer
    });

    // lexigraph stats
    cli.register_command({
        "stats",
        "Print statistics about the relation store",
        {
            {"json", "j", "Print as JSON", "", false, true}
        },
        cmd_stats
    });

    // lexigraph benchmark
    cli.register_command({
        "benchmark",
        "Compare neighborhood latency of the relational and graph backends",
        {
            {"samples", "n", "Terms sampled", "", false, false},
            {"depth", "d", "Neighborhood depth", "", false, false},
            {"json", "j", "Print the decision as JSON", "", false, true}
        },
        cmd_benchmark
    });

    // lexigraph export
    cli.register_command({
        "export",
        "Export every relation with its derivation to JSON",
        {
            {"output", "o", "Output JSON file", "", true, false}
        },
        cmd_export
    });

    // lexigraph import
    cli.register_command({
        "import",
        "Import relations from an exported JSON file",
        {
            {"input", "i", "Input JSON file", "", true, false}
        },
        cmd_import
    });

    // lexigraph config
    cli.register_command({
        "config",
        "Print or write the effective configuration",
        {
            {"output", "o", "Write configuration to this file instead of printing", "", false, false}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
