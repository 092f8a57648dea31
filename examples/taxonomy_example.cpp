#include "inference/inference_orchestrator.hpp"
#include "review/review_queue.hpp"
#include "service/relation_service.hpp"
#include "service/term_directory.hpp"
#include "store/memory_graph_store.hpp"
#include <iomanip>
#include <iostream>

using namespace lexigraph;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_relation(const Relation& r) {
    std::cout << "   " << r.source_id << " --" << r.relation_type << "--> " << r.target_id
              << "  [" << std::fixed << std::setprecision(2) << r.confidence << ", "
              << status_to_string(r.status) << "]\n";
}

int main() {
    print_separator("Taxonomy Example - Relations, Inference and Review");

    MemoryGraphStore store;
    InferenceOrchestrator orchestrator(store);
    AnyTermDirectory terms;
    RelationService service(store, orchestrator, terms);
    ReviewQueue queue(store);

    // Example 1: A small is_a hierarchy
    std::cout << "1. Asserting a taxonomy:\n";
    std::cout << "   Cat --is_a--> Mammal --is_a--> Animal --is_a--> Organism\n";
    PutResult cat_mammal = service.create_relation("Cat", "Mammal", "is_a");
    service.create_relation("Mammal", "Animal", "is_a");
    service.create_relation("Animal", "Organism", "is_a", 0.8);

    // Example 2: Symmetric and equivalence relations
    std::cout << "\n2. Asserting symmetric relations:\n";
    std::cout << "   Feline --equivalent_to--> Cat\n";
    std::cout << "   Cat --related_to--> Dog (0.6, then 0.9)\n";
    service.create_relation("Feline", "Cat", "equivalent_to");
    service.create_relation("Cat", "Dog", "related_to", 0.6);
    PutResult again = service.create_relation("Dog", "Cat", "related_to", 0.9);
    auto stored = store.find("Cat", "Dog", "related_to");
    std::cout << "   Re-assertion: " << relation_error_to_string(again.error)
              << ", stored confidence " << (stored ? stored->confidence : 0.0) << "\n";

    // Example 3: Inference
    print_separator("Inference from Cat (depth 3)");
    auto candidates = orchestrator.infer("Cat", all_rules(), 3);
    for (const auto& candidate : candidates) {
        std::cout << "   " << candidate.source_id << " --" << candidate.relation_type << "--> "
                  << candidate.target_id << "  " << std::fixed << std::setprecision(3)
                  << candidate.confidence << "  via ";
        auto path = candidate.derivation_path();
        for (size_t i = 0; i < path.size(); ++i) {
            if (i > 0) std::cout << " -> ";
            std::cout << path[i];
        }
        std::cout << "\n";
    }

    // Example 4: Review
    print_separator("Review Queue");
    auto pending = queue.get_pending();
    std::cout << pending.size() << " provisional relation(s)\n";
    for (size_t i = 0; i < pending.size(); ++i) {
        ReviewDecision decision = (i % 2 == 0) ? ReviewDecision::Approve : ReviewDecision::Reject;
        ResolveResult result = queue.resolve(pending[i].id, decision, std::nullopt, "example");
        std::cout << "   " << review_decision_to_string(decision) << ": ";
        if (result.relation) {
            print_relation(*result.relation);
        } else {
            std::cout << relation_error_to_string(result.error) << "\n";
        }
    }
    std::cout << "\nReview statistics: " << queue.statistics().to_json().dump() << "\n";

    // Example 5: Deletion cascades through inferred edges
    print_separator("Deleting Cat --is_a--> Mammal");
    InvalidationReport report = service.delete_relation(cat_mammal.id);
    std::cout << "Re-derived: " << report.rederived.size() << "\n";
    for (const auto& r : report.rederived) print_relation(r);
    std::cout << "Retracted: " << report.retracted.size() << "\n";
    for (const auto& r : report.retracted) print_relation(r);

    print_separator("Final Store");
    for (const auto& r : store.export_all()) {
        print_relation(r);
    }
    std::cout << "\n" << store.statistics().to_json().dump(2) << "\n";

    return 0;
}
