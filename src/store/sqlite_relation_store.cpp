#include "store/sqlite_relation_store.hpp"
#include <sqlite3.h>
#include <set>
#include <sstream>

namespace lexigraph {

namespace {

void check_sql(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::ostringstream oss;
        oss << what << " failed: " << sqlite3_errmsg(db) << " (rc=" << rc << ")";
        throw StoreUnavailableError(oss.str());
    }
}

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StoreUnavailableError(std::string("SQL exec failed: ") + message);
    }
}

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        check_sql(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr), db_, "prepare");
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check_sql(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT), db_, "bind text");
        return *this;
    }

    Statement& bind(int index, double value) {
        check_sql(sqlite3_bind_double(stmt_, index, value), db_, "bind double");
        return *this;
    }

    Statement& bind(int index, sqlite3_int64 value) {
        check_sql(sqlite3_bind_int64(stmt_, index, value), db_, "bind int64");
        return *this;
    }

    // True while rows are available
    bool step() {
        int rc = sqlite3_step(stmt_);
        check_sql(rc, db_, "step");
        return rc == SQLITE_ROW;
    }

    void run() {
        while (step()) {}
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    double real(int column) const { return sqlite3_column_double(stmt_, column); }
    sqlite3_int64 integer(int column) const { return sqlite3_column_int64(stmt_, column); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_sql(db_, "BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!committed_) {
            // Failure here leaves SQLite to roll back when the connection closes
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS relations (
    id            TEXT PRIMARY KEY,
    source_id     TEXT NOT NULL,
    target_id     TEXT NOT NULL,
    relation_type TEXT NOT NULL,
    key_source    TEXT NOT NULL,
    key_target    TEXT NOT NULL,
    confidence    REAL NOT NULL CHECK (confidence >= 0.0 AND confidence <= 1.0),
    provenance    TEXT NOT NULL,
    status        TEXT NOT NULL,
    created_at    TEXT NOT NULL,
    created_by    TEXT NOT NULL DEFAULT '',
    metadata      TEXT NOT NULL DEFAULT '',
    UNIQUE (key_source, key_target, relation_type)
);
CREATE INDEX IF NOT EXISTS idx_relations_source ON relations (source_id, relation_type);
CREATE INDEX IF NOT EXISTS idx_relations_target ON relations (target_id, relation_type);
CREATE INDEX IF NOT EXISTS idx_relations_status ON relations (status, created_at);

CREATE TABLE IF NOT EXISTS derivation_steps (
    relation_id    TEXT NOT NULL REFERENCES relations (id) ON DELETE CASCADE,
    position       INTEGER NOT NULL,
    constituent_id TEXT NOT NULL,
    rule           TEXT NOT NULL,
    via            TEXT NOT NULL DEFAULT '',
    PRIMARY KEY (relation_id, position)
);
CREATE INDEX IF NOT EXISTS idx_derivation_constituent ON derivation_steps (constituent_id);
)SQL";

std::string relation_columns(const std::string& prefix = "") {
    const char* names[] = {
        "id", "source_id", "target_id", "relation_type", "confidence",
        "provenance", "status", "created_at", "created_by", "metadata"
    };
    std::string columns;
    for (const char* name : names) {
        if (!columns.empty()) columns += ", ";
        columns += prefix + name;
    }
    return columns;
}

Relation read_relation(const Statement& stmt) {
    Relation relation;
    relation.id = stmt.text(0);
    relation.source_id = stmt.text(1);
    relation.target_id = stmt.text(2);
    relation.relation_type = stmt.text(3);
    relation.confidence = stmt.real(4);
    relation.provenance = string_to_provenance(stmt.text(5));
    relation.status = string_to_status(stmt.text(6));
    relation.created_at = stmt.text(7);
    relation.created_by = stmt.text(8);
    relation.metadata = stmt.text(9);
    return relation;
}

std::vector<Relation> read_all(Statement& stmt) {
    std::vector<Relation> result;
    while (stmt.step()) {
        result.push_back(read_relation(stmt));
    }
    return result;
}

std::string status_clause(StatusFilter filter, const std::string& column = "status") {
    switch (filter) {
        case StatusFilter::Confirmed: return " AND " + column + " = 'confirmed'";
        case StatusFilter::Provisional: return " AND " + column + " = 'provisional'";
        default: return "";
    }
}

} // namespace

SqliteRelationStore::SqliteRelationStore(const std::string& path, RelationTypeRegistry types)
    : RelationStore(std::move(types)), path_(path) {
    int rc = sqlite3_open_v2(
        path_.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreUnavailableError("Cannot open database '" + path_ + "': " + message);
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        exec_sql(db_, "PRAGMA foreign_keys = ON;");
        if (path_ != ":memory:") {
            exec_sql(db_, "PRAGMA journal_mode = WAL;");
        }
        create_schema();
    } catch (const StoreUnavailableError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteRelationStore::~SqliteRelationStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteRelationStore::create_schema() {
    sqlite3_int64 current = 0;
    {
        Statement version(db_, "PRAGMA user_version;");
        if (version.step()) current = version.integer(0);
    }
    if (current > kSchemaVersion) {
        throw StoreUnavailableError(
            "Database schema version " + std::to_string(current) +
            " is newer than supported version " + std::to_string(kSchemaVersion));
    }

    Transaction tx(db_);
    exec_sql(db_, kSchema);
    exec_sql(db_, ("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";").c_str());
    tx.commit();
}

// ==========================================
// Writes
// ==========================================

PutResult SqliteRelationStore::put(const Relation& relation) {
    PutResult result;
    RelationError error = validate_relation(relation, types_, result.error_message);
    if (error != RelationError::None) {
        result.error = error;
        return result;
    }

    RelationKey key = canonical_key(relation, types_);

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    WritePlan plan = plan_put(find_locked(key), relation);

    if (plan.action == WriteAction::Insert) {
        insert_locked(plan.relation);
    } else if (plan.action == WriteAction::Update) {
        update_locked(plan.relation);
    }
    tx.commit();

    result.id = plan.relation.id;
    result.error = plan.error;
    result.promoted = plan.promoted;
    return result;
}

DeleteResult SqliteRelationStore::remove(const std::string& relation_id) {
    DeleteResult result;

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    result.deleted = get_locked(relation_id);
    if (!result.deleted) {
        result.error = RelationError::NotFound;
        return result;
    }
    result.affected = dependents_locked(relation_id);

    Statement steps(db_, "DELETE FROM derivation_steps WHERE relation_id = ?;");
    steps.bind(1, relation_id).run();

    Statement row(db_, "DELETE FROM relations WHERE id = ?;");
    row.bind(1, relation_id).run();

    tx.commit();
    return result;
}

std::vector<CommitOutcome> SqliteRelationStore::commit_provisional(const std::vector<Relation>& candidates) {
    for (const auto& candidate : candidates) {
        std::string message;
        if (validate_relation(candidate, types_, message) != RelationError::None) {
            throw std::invalid_argument("Cannot commit candidate: " + message);
        }
    }

    std::vector<CommitOutcome> outcomes;
    outcomes.reserve(candidates.size());

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    for (const auto& candidate : candidates) {
        WritePlan plan = plan_commit(find_locked(canonical_key(candidate, types_)), candidate);

        if (plan.action == WriteAction::Insert) {
            insert_locked(plan.relation);
        } else if (plan.action == WriteAction::Update) {
            update_locked(plan.relation);
        }

        outcomes.push_back({plan.relation, plan.kind});
    }
    tx.commit();
    return outcomes;
}

bool SqliteRelationStore::update(const Relation& relation) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto existing = get_locked(relation.id);
    if (!existing) {
        return false;
    }
    if (!(canonical_key(*existing, types_) == canonical_key(relation, types_))) {
        throw std::invalid_argument("Update would change the key of relation " + relation.id);
    }

    update_locked(relation);
    tx.commit();
    return true;
}

size_t SqliteRelationStore::import_relations(const std::vector<Relation>& relations) {
    for (const auto& relation : relations) {
        std::string message;
        if (relation.id.empty()) {
            throw std::invalid_argument("Imported relation has no id");
        }
        if (validate_relation(relation, types_, message) != RelationError::None) {
            throw std::invalid_argument("Cannot import " + relation.id + ": " + message);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    size_t inserted = 0;
    for (const auto& relation : relations) {
        if (get_locked(relation.id)) continue;
        if (find_locked(canonical_key(relation, types_))) continue;

        insert_locked(prepare_for_insert(relation));
        inserted++;
    }

    tx.commit();
    return inserted;
}

// ==========================================
// Reads
// ==========================================

std::optional<Relation> SqliteRelationStore::get(const std::string& relation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_locked(relation_id);
}

std::vector<Relation> SqliteRelationStore::get_outgoing(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacent_locked(term_id, relation_type, filter, true);
}

std::vector<Relation> SqliteRelationStore::get_incoming(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adjacent_locked(term_id, relation_type, filter, false);
}

std::optional<Relation> SqliteRelationStore::find(
    const std::string& source_id,
    const std::string& target_id,
    const std::string& relation_type
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(canonical_key(source_id, target_id, relation_type, types_));
}

std::vector<Relation> SqliteRelationStore::neighborhood(
    const std::string& term_id,
    int depth,
    StatusFilter filter
) const {
    if (depth <= 0) return {};

    // Terms at distance < depth, then every edge touching one of them
    std::string sql =
        "WITH RECURSIVE reach(term, depth) AS ("
        "  SELECT ?1, 0"
        "  UNION"
        "  SELECT CASE WHEN r.source_id = reach.term THEN r.target_id ELSE r.source_id END,"
        "         reach.depth + 1"
        "  FROM reach JOIN relations r"
        "    ON r.source_id = reach.term OR r.target_id = reach.term"
        "  WHERE reach.depth + 1 < ?2" + status_clause(filter, "r.status") +
        ") "
        "SELECT " + relation_columns("r.") + " FROM relations r"
        " WHERE (r.source_id IN (SELECT term FROM reach)"
        "     OR r.target_id IN (SELECT term FROM reach))" + status_clause(filter, "r.status") +
        " ORDER BY r.id;";

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, sql);
    stmt.bind(1, term_id).bind(2, static_cast<sqlite3_int64>(depth));

    std::vector<Relation> result = read_all(stmt);
    for (auto& relation : result) {
        load_derivation_locked(relation);
    }
    return result;
}

std::vector<Relation> SqliteRelationStore::list(
    StatusFilter filter,
    size_t limit,
    size_t offset
) const {
    std::string sql = "SELECT " + relation_columns() + " FROM relations WHERE 1 = 1" +
                      status_clause(filter) +
                      " ORDER BY created_at, id LIMIT ? OFFSET ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, sql);
    stmt.bind(1, limit == 0 ? sqlite3_int64(-1) : static_cast<sqlite3_int64>(limit));
    stmt.bind(2, static_cast<sqlite3_int64>(offset));

    std::vector<Relation> result = read_all(stmt);
    for (auto& relation : result) {
        load_derivation_locked(relation);
    }
    return result;
}

std::vector<Relation> SqliteRelationStore::dependents(const std::string& relation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dependents_locked(relation_id);
}

std::vector<std::string> SqliteRelationStore::terms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "SELECT source_id FROM relations UNION SELECT target_id FROM relations ORDER BY 1;");

    std::vector<std::string> result;
    while (stmt.step()) {
        result.push_back(stmt.text(0));
    }
    return result;
}

size_t SqliteRelationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM relations;");
    return stmt.step() ? static_cast<size_t>(stmt.integer(0)) : 0;
}

StoreStatistics SqliteRelationStore::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStatistics stats;
    Statement grouped(db_,
        "SELECT relation_type, status, provenance, COUNT(*) FROM relations "
        "GROUP BY relation_type, status, provenance;");
    while (grouped.step()) {
        size_t count = static_cast<size_t>(grouped.integer(3));
        stats.num_relations += count;
        stats.by_type[grouped.text(0)] += count;

        if (string_to_status(grouped.text(1)) == RelationStatus::Confirmed) stats.num_confirmed += count;
        else stats.num_provisional += count;

        if (string_to_provenance(grouped.text(2)) == Provenance::Inferred) stats.num_inferred += count;
        else stats.num_asserted += count;
    }

    Statement terms(db_,
        "SELECT COUNT(*) FROM (SELECT source_id FROM relations UNION SELECT target_id FROM relations);");
    if (terms.step()) {
        stats.num_terms = static_cast<size_t>(terms.integer(0));
    }
    return stats;
}

// ==========================================
// Helpers (caller holds mutex_)
// ==========================================

void SqliteRelationStore::insert_locked(const Relation& relation) {
    RelationKey key = canonical_key(relation, types_);

    Statement stmt(db_,
        "INSERT INTO relations (id, source_id, target_id, relation_type, key_source, key_target, "
        "confidence, provenance, status, created_at, created_by, metadata) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    stmt.bind(1, relation.id)
        .bind(2, relation.source_id)
        .bind(3, relation.target_id)
        .bind(4, relation.relation_type)
        .bind(5, key.source_id)
        .bind(6, key.target_id)
        .bind(7, relation.confidence)
        .bind(8, provenance_to_string(relation.provenance))
        .bind(9, status_to_string(relation.status))
        .bind(10, relation.created_at)
        .bind(11, relation.created_by)
        .bind(12, relation.metadata);
    stmt.run();

    write_steps_locked(relation);
}

void SqliteRelationStore::update_locked(const Relation& relation) {
    Statement stmt(db_,
        "UPDATE relations SET source_id = ?, target_id = ?, confidence = ?, provenance = ?, "
        "status = ?, created_by = ?, metadata = ? WHERE id = ?;");
    stmt.bind(1, relation.source_id)
        .bind(2, relation.target_id)
        .bind(3, relation.confidence)
        .bind(4, provenance_to_string(relation.provenance))
        .bind(5, status_to_string(relation.status))
        .bind(6, relation.created_by)
        .bind(7, relation.metadata)
        .bind(8, relation.id);
    stmt.run();

    Statement clear(db_, "DELETE FROM derivation_steps WHERE relation_id = ?;");
    clear.bind(1, relation.id).run();

    write_steps_locked(relation);
}

void SqliteRelationStore::write_steps_locked(const Relation& relation) {
    if (relation.derivation.empty()) return;

    Statement stmt(db_,
        "INSERT INTO derivation_steps (relation_id, position, constituent_id, rule, via) "
        "VALUES (?, ?, ?, ?, ?);");
    for (size_t i = 0; i < relation.derivation.size(); i++) {
        const auto& step = relation.derivation[i];
        stmt.bind(1, relation.id)
            .bind(2, static_cast<sqlite3_int64>(i))
            .bind(3, step.relation_id)
            .bind(4, step.rule)
            .bind(5, step.via);
        stmt.run();
        stmt.reset();
    }
}

std::optional<Relation> SqliteRelationStore::get_locked(const std::string& relation_id) const {
    Statement stmt(db_, "SELECT " + relation_columns() + " FROM relations WHERE id = ?;");
    stmt.bind(1, relation_id);
    if (!stmt.step()) return std::nullopt;

    Relation relation = read_relation(stmt);
    load_derivation_locked(relation);
    return relation;
}

std::optional<Relation> SqliteRelationStore::find_locked(const RelationKey& key) const {
    Statement stmt(db_,
        "SELECT " + relation_columns() + " FROM relations "
        "WHERE key_source = ? AND key_target = ? AND relation_type = ?;");
    stmt.bind(1, key.source_id).bind(2, key.target_id).bind(3, key.relation_type);
    if (!stmt.step()) return std::nullopt;

    Relation relation = read_relation(stmt);
    load_derivation_locked(relation);
    return relation;
}

std::vector<Relation> SqliteRelationStore::dependents_locked(const std::string& relation_id) const {
    Statement stmt(db_,
        "SELECT " + relation_columns() + " FROM relations WHERE id IN "
        "(SELECT relation_id FROM derivation_steps WHERE constituent_id = ?) ORDER BY id;");
    stmt.bind(1, relation_id);

    std::vector<Relation> result = read_all(stmt);
    for (auto& relation : result) {
        load_derivation_locked(relation);
    }
    return result;
}

std::vector<Relation> SqliteRelationStore::adjacent_locked(
    const std::string& term_id,
    const std::string& relation_type,
    StatusFilter filter,
    bool outgoing
) const {
    auto query = [&](const char* column) {
        std::string sql = "SELECT " + relation_columns() + " FROM relations WHERE " +
                          column + " = ?";
        if (!relation_type.empty()) sql += " AND relation_type = ?";
        sql += status_clause(filter) + " ORDER BY id;";

        Statement stmt(db_, sql);
        stmt.bind(1, term_id);
        if (!relation_type.empty()) stmt.bind(2, relation_type);
        return read_all(stmt);
    };

    std::vector<Relation> result = query(outgoing ? "source_id" : "target_id");
    std::set<std::string> seen;
    for (const auto& relation : result) {
        seen.insert(relation.id);
    }

    // Symmetric edges hold in both directions regardless of storage order
    for (auto& relation : query(outgoing ? "target_id" : "source_id")) {
        if (types_.is_symmetric(relation.relation_type) && seen.insert(relation.id).second) {
            result.push_back(std::move(relation));
        }
    }

    for (auto& relation : result) {
        load_derivation_locked(relation);
    }
    return result;
}

void SqliteRelationStore::load_derivation_locked(Relation& relation) const {
    Statement stmt(db_,
        "SELECT constituent_id, rule, via FROM derivation_steps "
        "WHERE relation_id = ? ORDER BY position;");
    stmt.bind(1, relation.id);

    relation.derivation.clear();
    while (stmt.step()) {
        relation.derivation.push_back({stmt.text(0), stmt.text(1), stmt.text(2)});
    }
}

} // namespace lexigraph
