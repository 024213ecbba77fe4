/**
 * pebble/database.hpp - RAII SQLite database wrapper with record operations
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * Example usage:
 *
 *   pebble::Database db;  // in-memory
 *   if (!db.is_open()) {
 *       fprintf(stderr, "Error: %s\n", db.open_status().message.c_str());
 *       return 1;
 *   }
 *
 *   db.create_table<User>();
 *   db.insert(User{1, "Alice", "alice@example.com"});
 *
 *   auto found = db.find_by_id<User>(1);
 *   if (!found.ok()) {
 *       fprintf(stderr, "Query error: %s\n", found.status().to_string().c_str());
 *       return 1;
 *   }
 *
 * Every call is a single synchronous statement. There is no internal
 * locking: use one Database per thread or guard it externally.
 */

#pragma once

#include "config.hpp"
#include "statement.hpp"
#include <memory>
#include <optional>
#include <utility>

namespace pebble {

// ============================================================================
// Execution Result
// ============================================================================

struct ExecResult {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    int64_t last_insert_rowid = 0;
    int changes = 0;  // rows inserted, updated or deleted by the statement

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const Row& operator[](size_t i) const { return rows[i]; }

    // Iterator support
    auto begin() { return rows.begin(); }
    auto end() { return rows.end(); }
    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

class QueryBuilder;

// ============================================================================
// Database Wrapper
// ============================================================================

class Database {
public:
    Database() { open_status_ = open(":memory:"); }

    /**
     * Constructor with explicit path
     */
    explicit Database(const char* path) { open_status_ = open(path); }

    explicit Database(const DatabaseConfig& config) { open_status_ = open(config); }

    ~Database() { close(); }

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&& other) noexcept
        : db_(other.db_),
          open_status_(std::move(other.open_status_)),
          on_statement_(std::move(other.on_statement_)) {
        other.db_ = nullptr;
    }

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            open_status_ = std::move(other.open_status_);
            on_statement_ = std::move(other.on_statement_);
            other.db_ = nullptr;
        }
        return *this;
    }

    // ========================================================================
    // Open/Close
    // ========================================================================

    Status open(const char* path = ":memory:") {
        DatabaseConfig config;
        config.path = path ? path : ":memory:";
        config.on_statement = on_statement_;
        return open(config);
    }

    Status open(const DatabaseConfig& config) {
        close();

        int flags = config.read_only ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE;
        if (!config.read_only && config.create_if_missing) {
            flags |= SQLITE_OPEN_CREATE;
        }

        int rc = sqlite3_open_v2(config.path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            open_status_ = Status::fail(ErrorCode::EngineError,
                db_ ? sqlite3_errmsg(db_) : "Failed to allocate database", rc);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return open_status_;
        }

        on_statement_ = config.on_statement;
        open_status_ = Status::success();

        if (config.foreign_keys) {
            Status st = exec("PRAGMA foreign_keys = ON");
            if (!st.ok()) {
                close();
                open_status_ = st;
                return st;
            }
        }
        return open_status_;
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }

    // Outcome of the most recent open()
    const Status& open_status() const { return open_status_; }

    void on_statement(statement_hook_t hook) { on_statement_ = std::move(hook); }

    // ========================================================================
    // Statement Execution
    // ========================================================================

    /**
     * Prepare, bind and run one statement, collecting every result row.
     * Any failure discards the rows read so far.
     */
    Result<ExecResult> execute(const Statement& stmt) {
        if (!db_) return not_open();

        if (on_statement_) on_statement_(stmt.sql);

        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db_, stmt.sql.c_str(), -1, &raw, nullptr);
        std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> guard(raw, &sqlite3_finalize);
        if (rc != SQLITE_OK) return engine_error(rc);
        if (!raw) {
            return Status::fail(ErrorCode::EngineError, "empty statement", SQLITE_MISUSE);
        }

        int expected = sqlite3_bind_parameter_count(raw);
        if (expected < 0 || static_cast<size_t>(expected) != stmt.params.size()) {
            return Status::fail(ErrorCode::InvalidQuery,
                "statement has " + std::to_string(expected) + " placeholders but " +
                std::to_string(stmt.params.size()) + " parameters");
        }

        for (size_t i = 0; i < stmt.params.size(); ++i) {
            rc = bind_value(raw, static_cast<int>(i + 1), stmt.params[i]);
            if (rc != SQLITE_OK) return engine_error(rc);
        }

        ExecResult result;
        int col_count = sqlite3_column_count(raw);
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(raw, i);
            result.columns.push_back(name ? name : "");
        }

        int total_before = sqlite3_total_changes(db_);
        while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
            Row row;
            row.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                row.push_back(column_value(raw, i));
            }
            result.rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) return engine_error(rc);

        result.changes = sqlite3_total_changes(db_) - total_before;
        result.last_insert_rowid = sqlite3_last_insert_rowid(db_);
        return result;
    }

    /**
     * Run raw SQL (possibly several statements) without parameters.
     */
    Status exec(const std::string& sql) {
        if (!db_) return not_open();

        if (on_statement_) on_statement_(sql);

        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            return Status::fail(ErrorCode::EngineError, msg, rc);
        }
        sqlite3_free(err);
        return Status::success();
    }

    // ========================================================================
    // Record Operations
    // ========================================================================

    template<typename R>
    Status create_table() {
        auto stmt = prepare<R>([](const ModelInfo& m) { return build_create_table(m); });
        if (!stmt.ok()) return stmt.status();
        return execute(*stmt).status();
    }

    /**
     * Insert a record. Returns the row id SQLite assigned, which equals
     * the record's key for INTEGER primary keys.
     */
    template<typename R>
    Result<int64_t> insert(const R& record) {
        auto stmt = prepare<R>([&](const ModelInfo& m) { return build_insert(m, record.to_row()); });
        if (!stmt.ok()) return stmt.status();
        auto result = execute(*stmt);
        if (!result.ok()) return result.status();
        return result->last_insert_rowid;
    }

    template<typename R>
    Result<std::vector<R>> select_all() {
        return select<R>(QuerySpec());
    }

    /**
     * Run a SELECT built from a QuerySpec and decode every row.
     */
    template<typename R>
    Result<std::vector<R>> select(const QuerySpec& spec) {
        auto stmt = prepare<R>([&](const ModelInfo& m) { return build_select(m, spec); });
        if (!stmt.ok()) return stmt.status();
        auto result = execute(*stmt);
        if (!result.ok()) return result.status();
        return hydrate<R>(*result);
    }

    template<typename R, typename Id>
    Result<std::optional<R>> find_by_id(const Id& id) {
        auto stmt = prepare<R>([&](const ModelInfo& m) { return build_find_by_id(m, from_native(id)); });
        if (!stmt.ok()) return stmt.status();
        auto result = execute(*stmt);
        if (!result.ok()) return result.status();
        auto records = hydrate<R>(*result);
        if (!records.ok()) return records.status();
        if (records->empty()) return std::optional<R>();
        return std::optional<R>(std::move(records->front()));
    }

    /**
     * Write every non-key field of record to the row with its key.
     * Returns the number of rows changed (0 when the key is absent).
     */
    template<typename R>
    Result<int> update(const R& record) {
        auto stmt = prepare<R>([&](const ModelInfo& m) { return build_update(m, record.to_row()); });
        if (!stmt.ok()) return stmt.status();
        auto result = execute(*stmt);
        if (!result.ok()) return result.status();
        return result->changes;
    }

    // Delete by primary key. A missing id changes 0 rows and is not an error.
    template<typename R, typename Id>
    Result<int> remove(const Id& id) {
        auto stmt = prepare<R>([&](const ModelInfo& m) { return build_delete(m, from_native(id)); });
        if (!stmt.ok()) return stmt.status();
        auto result = execute(*stmt);
        if (!result.ok()) return result.status();
        return result->changes;
    }

    template<typename R>
    Status drop_table() {
        auto stmt = prepare<R>([](const ModelInfo& m) { return build_drop_table(m); });
        if (!stmt.ok()) return stmt.status();
        return execute(*stmt).status();
    }

    /**
     * Start a filter/order/limit query. Defined in query.hpp.
     */
    QueryBuilder query();

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }

    // ========================================================================
    // Utility
    // ========================================================================

    int64_t last_insert_rowid() const {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

    int changes() const {
        return db_ ? sqlite3_changes(db_) : 0;
    }

private:
    sqlite3* db_ = nullptr;
    Status open_status_;
    statement_hook_t on_statement_;

    Status not_open() const {
        std::string msg = "Database not open";
        if (!open_status_.ok()) msg += ": " + open_status_.message;
        return Status::fail(ErrorCode::EngineError, msg, SQLITE_MISUSE);
    }

    Status engine_error(int rc) const {
        return Status::fail(ErrorCode::EngineError, sqlite3_errmsg(db_), rc);
    }

    template<typename R, typename Build>
    static Result<Statement> prepare(Build&& build) {
        static_assert(is_model_v<R>, "type does not satisfy the pebble record contract");
        auto info = ModelInfo::of<R>();
        if (!info.ok()) return info.status();
        return build(*info);
    }

    // All-or-nothing: the first row that fails to decode fails the call
    template<typename R>
    static Result<std::vector<R>> hydrate(const ExecResult& result) {
        std::vector<R> records;
        records.reserve(result.rows.size());
        for (size_t i = 0; i < result.rows.size(); ++i) {
            auto record = R::from_row(result.rows[i]);
            if (!record.ok()) {
                return Status::fail(ErrorCode::DecodeError,
                    "row " + std::to_string(i) + " of '" + std::string(R::table_name()) +
                    "': " + record.status().message);
            }
            records.push_back(std::move(*record));
        }
        return records;
    }
};

} // namespace pebble
