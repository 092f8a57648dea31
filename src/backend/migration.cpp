#include "backend/migration.hpp"
#include "backend/mirrored_relation_store.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <set>

namespace lexigraph {

namespace {

MigrationReport import_all(const std::vector<Relation>& relations, RelationStore& to, size_t batch_size) {
    MigrationReport report;
    report.exported = relations.size();

    if (batch_size == 0) {
        batch_size = relations.size() > 0 ? relations.size() : 1;
    }

    for (size_t begin = 0; begin < relations.size(); begin += batch_size) {
        size_t end = std::min(begin + batch_size, relations.size());
        std::vector<Relation> batch(relations.begin() + static_cast<std::ptrdiff_t>(begin),
                                    relations.begin() + static_cast<std::ptrdiff_t>(end));
        report.imported += to.import_relations(batch);
    }
    report.skipped = report.exported - report.imported;

    report.verified = std::all_of(relations.begin(), relations.end(), [&](const Relation& relation) {
        return to.exists(relation.source_id, relation.target_id, relation.relation_type);
    });
    return report;
}

} // namespace

void MigrationReport::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Migration Summary\n";
    std::cout << std::string(70, '=') << "\n\n";
    std::cout << "  Exported: " << exported << "\n";
    std::cout << "  Imported: " << imported << "\n";
    std::cout << "  Skipped (already present): " << skipped << "\n";
    if (stale > 0) {
        std::cout << "  Stale (not copied back): " << stale << "\n";
    }
    std::cout << "  Verified: " << (verified ? "yes" : "NO") << "\n";
    std::cout << "  Time: " << elapsed_ms << " ms\n";
    std::cout << std::string(70, '=') << "\n";
}

nlohmann::json MigrationReport::to_json() const {
    nlohmann::json j;
    j["exported"] = exported;
    j["imported"] = imported;
    j["skipped"] = skipped;
    j["stale"] = stale;
    j["verified"] = verified;
    j["elapsed_ms"] = elapsed_ms;
    return j;
}

MigrationReport migrate(const RelationStore& from, RelationStore& to, size_t batch_size) {
    auto start_time = std::chrono::steady_clock::now();

    MigrationReport report = import_all(from.export_all(), to, batch_size);

    auto end_time = std::chrono::steady_clock::now();
    report.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return report;
}

MigrationReport rollback_to_relational(MirroredRelationStore& mirrored) {
    auto start_time = std::chrono::steady_clock::now();

    // Reads keep flowing, from the primary, while edges are copied back
    mirrored.disable_secondary("rollback to relational backend");

    MigrationReport report;
    std::set<std::string> stale = mirrored.dirty_ids();
    std::unique_ptr<RelationStore> secondary = mirrored.release_secondary();
    if (secondary) {
        std::vector<Relation> exported = secondary->export_all();
        std::vector<Relation> in_sync;
        for (auto& relation : exported) {
            if (stale.count(relation.id) == 0) {
                in_sync.push_back(std::move(relation));
            }
        }

        report = import_all(in_sync, mirrored.primary(), 1000);
        report.stale = exported.size() - in_sync.size();
        report.exported += report.stale;
    } else {
        report.verified = true;
    }

    auto end_time = std::chrono::steady_clock::now();
    report.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return report;
}

void export_to_json_file(const RelationStore& store, const std::string& path) {
    nlohmann::json j;
    j["format"] = "lexigraph-relations";
    j["version"] = 1;
    j["backend"] = store.backend_name();
    j["exported_at"] = current_timestamp_utc();
    j["relation_types"] = store.types().to_json();

    nlohmann::json relations = nlohmann::json::array();
    for (const auto& relation : store.export_all()) {
        relations.push_back(relation.to_json());
    }
    j["relations"] = relations;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << j.dump(2);
}

MigrationReport import_from_json_file(RelationStore& store, const std::string& path) {
    auto start_time = std::chrono::steady_clock::now();

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    nlohmann::json j;
    file >> j;

    std::vector<Relation> relations;
    for (const auto& item : j.at("relations")) {
        relations.push_back(Relation::from_json(item));
    }

    MigrationReport report = import_all(relations, store, 1000);

    auto end_time = std::chrono::steady_clock::now();
    report.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return report;
}

} // namespace lexigraph
