/**
 * test_database.cpp - Tests for the pebble::Database wrapper
 */

#include <gtest/gtest.h>
#include <pebble/pebble.hpp>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

using pebble::ErrorCode;
using pebble::Statement;
using pebble::Value;

class DatabaseTest : public ::testing::Test {
protected:
    pebble::Database db_;

    void SetUp() override {
        ASSERT_TRUE(db_.is_open()) << db_.open_status().to_string();
    }
};

TEST_F(DatabaseTest, OpenMemoryDatabase) {
    pebble::Database db;
    EXPECT_TRUE(db.is_open());
    EXPECT_TRUE(db.open_status().ok());
    EXPECT_NE(db.handle(), nullptr);
}

TEST_F(DatabaseTest, ReopenReplacesConnection) {
    pebble::Database db;
    ASSERT_TRUE(db.exec("CREATE TABLE t (x INTEGER)").ok());
    ASSERT_TRUE(db.open(":memory:").ok());
    auto result = db.execute(Statement{"SELECT COUNT(*) FROM sqlite_master", {}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ((*result)[0][0], Value::integer(0));
}

TEST_F(DatabaseTest, ExecuteSimpleSQL) {
    EXPECT_TRUE(db_.exec("CREATE TABLE test (id INTEGER, name TEXT)").ok());
    EXPECT_TRUE(db_.exec("INSERT INTO test VALUES (1, 'one')").ok());
    EXPECT_TRUE(db_.exec("INSERT INTO test VALUES (2, 'two'); INSERT INTO test VALUES (3, 'three')").ok());
}

TEST_F(DatabaseTest, ExecuteReturnsRowsAndColumns) {
    ASSERT_TRUE(db_.exec("CREATE TABLE test (id INTEGER, name TEXT)").ok());
    ASSERT_TRUE(db_.exec("INSERT INTO test VALUES (1, 'one'), (2, 'two')").ok());

    auto result = db_.execute(Statement{"SELECT id, name FROM test ORDER BY id", {}});
    ASSERT_TRUE(result.ok()) << result.status().to_string();
    ASSERT_EQ(result->columns.size(), 2u);
    EXPECT_EQ(result->columns[0], "id");
    EXPECT_EQ(result->columns[1], "name");
    ASSERT_EQ(result->size(), 2u);
    EXPECT_EQ((*result)[0][0], Value::integer(1));
    EXPECT_EQ((*result)[0][1], Value::text("one"));
    EXPECT_EQ((*result)[1][1], Value::text("two"));
}

TEST_F(DatabaseTest, EmptyQueryResult) {
    ASSERT_TRUE(db_.exec("CREATE TABLE test (id INTEGER)").ok());
    auto result = db_.execute(Statement{"SELECT id FROM test", {}});
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->empty());
    EXPECT_EQ(result->columns.size(), 1u);
}

TEST_F(DatabaseTest, BoundParameters) {
    auto result = db_.execute(Statement{"SELECT ? + 1, ?, ?", {
        Value::integer(41), Value::text("hello"), Value::null()}});
    ASSERT_TRUE(result.ok()) << result.status().to_string();
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ((*result)[0][0], Value::integer(42));
    EXPECT_EQ((*result)[0][1], Value::text("hello"));
    EXPECT_TRUE((*result)[0][2].is_null());
}

TEST_F(DatabaseTest, CellKinds) {
    auto result = db_.execute(Statement{"SELECT NULL, 7, 1.5, 'abc', X'6869'", {}});
    ASSERT_TRUE(result.ok());
    const pebble::Row& row = (*result)[0];
    EXPECT_TRUE(row[0].is_null());
    EXPECT_EQ(row[1], Value::integer(7));
    EXPECT_EQ(row[2], Value::real(1.5));
    EXPECT_EQ(row[3], Value::text("abc"));
    EXPECT_EQ(row[4], Value::text("hi"));
}

TEST_F(DatabaseTest, PlaceholderCountMismatch) {
    auto result = db_.execute(Statement{"SELECT ?, ?", {Value::integer(1)}});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code, ErrorCode::InvalidQuery);

    result = db_.execute(Statement{"SELECT 1", {Value::integer(1)}});
    EXPECT_EQ(result.status().code, ErrorCode::InvalidQuery);
}

TEST_F(DatabaseTest, InvalidSqlIsEngineError) {
    auto result = db_.execute(Statement{"SELEKT 1", {}});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code, ErrorCode::EngineError);
    EXPECT_EQ(result.status().engine_code, SQLITE_ERROR);
    EXPECT_FALSE(result.status().message.empty());

    pebble::Status st = db_.exec("CREATE TABLE (");
    EXPECT_EQ(st.code, ErrorCode::EngineError);
    EXPECT_NE(st.engine_code, 0);
}

TEST_F(DatabaseTest, EmptyStatement) {
    auto result = db_.execute(Statement{"", {}});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status().code, ErrorCode::EngineError);
}

TEST_F(DatabaseTest, MissingTableIsEngineError) {
    auto result = db_.execute(Statement{"SELECT * FROM nowhere", {}});
    EXPECT_EQ(result.status().code, ErrorCode::EngineError);
}

TEST_F(DatabaseTest, LastInsertRowid) {
    ASSERT_TRUE(db_.exec("CREATE TABLE test (id INTEGER PRIMARY KEY, name TEXT)").ok());
    auto result = db_.execute(Statement{"INSERT INTO test (name) VALUES (?)", {Value::text("a")}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->last_insert_rowid, 1);
    EXPECT_EQ(result->changes, 1);

    result = db_.execute(Statement{"INSERT INTO test (id, name) VALUES (?, ?)",
                                   {Value::integer(10), Value::text("b")}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->last_insert_rowid, 10);
    EXPECT_EQ(db_.last_insert_rowid(), 10);
}

TEST_F(DatabaseTest, ChangesCountsModifiedRowsOnly) {
    ASSERT_TRUE(db_.exec("CREATE TABLE test (x INTEGER)").ok());
    ASSERT_TRUE(db_.exec("INSERT INTO test VALUES (1), (2), (3)").ok());

    auto update = db_.execute(Statement{"UPDATE test SET x = 0", {}});
    ASSERT_TRUE(update.ok());
    EXPECT_EQ(update->changes, 3);

    auto select = db_.execute(Statement{"SELECT x FROM test", {}});
    ASSERT_TRUE(select.ok());
    EXPECT_EQ(select->changes, 0);

    auto remove = db_.execute(Statement{"DELETE FROM test WHERE x = ?", {Value::integer(5)}});
    ASSERT_TRUE(remove.ok());
    EXPECT_EQ(remove->changes, 0);
}

TEST_F(DatabaseTest, MoveConstruct) {
    ASSERT_TRUE(db_.exec("CREATE TABLE test (x INTEGER)").ok());
    pebble::Database moved(std::move(db_));
    EXPECT_TRUE(moved.is_open());
    EXPECT_FALSE(db_.is_open());
    EXPECT_TRUE(moved.exec("INSERT INTO test VALUES (1)").ok());
}

TEST_F(DatabaseTest, MoveAssign) {
    pebble::Database other;
    ASSERT_TRUE(other.exec("CREATE TABLE marker (x INTEGER)").ok());
    db_ = std::move(other);
    EXPECT_FALSE(other.is_open());
    EXPECT_TRUE(db_.exec("INSERT INTO marker VALUES (1)").ok());
}

TEST_F(DatabaseTest, ClosedDatabaseReportsEngineError) {
    db_.close();
    EXPECT_FALSE(db_.is_open());

    pebble::Status st = db_.exec("SELECT 1");
    EXPECT_EQ(st.code, ErrorCode::EngineError);

    auto result = db_.execute(Statement{"SELECT 1", {}});
    EXPECT_EQ(result.status().code, ErrorCode::EngineError);
    EXPECT_EQ(db_.last_insert_rowid(), 0);
    EXPECT_EQ(db_.changes(), 0);
}

TEST_F(DatabaseTest, OpenFailureIsReported) {
    pebble::Database db("/nonexistent-pebble-dir/sub/test.db");
    EXPECT_FALSE(db.is_open());
    EXPECT_EQ(db.open_status().code, ErrorCode::EngineError);
    EXPECT_NE(db.open_status().engine_code, 0);

    pebble::Status st = db.exec("SELECT 1");
    EXPECT_EQ(st.code, ErrorCode::EngineError);
    EXPECT_NE(st.message.find("Database not open"), std::string::npos);
}

TEST_F(DatabaseTest, ReadOnlyDoesNotCreate) {
    std::string path = (std::filesystem::temp_directory_path() / "pebble_readonly_missing.db").string();
    std::remove(path.c_str());

    pebble::DatabaseConfig config;
    config.path = path;
    config.read_only = true;
    pebble::Database db(config);
    EXPECT_FALSE(db.is_open());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(DatabaseTest, FileDatabasePersists) {
    std::string path = (std::filesystem::temp_directory_path() / "pebble_persist_test.db").string();
    std::remove(path.c_str());
    {
        pebble::Database db(path.c_str());
        ASSERT_TRUE(db.is_open()) << db.open_status().to_string();
        ASSERT_TRUE(db.exec("CREATE TABLE test (x INTEGER); INSERT INTO test VALUES (5)").ok());
    }
    {
        pebble::DatabaseConfig config;
        config.path = path;
        config.read_only = true;
        pebble::Database db(config);
        ASSERT_TRUE(db.is_open()) << db.open_status().to_string();
        auto result = db.execute(Statement{"SELECT x FROM test", {}});
        ASSERT_TRUE(result.ok());
        EXPECT_EQ((*result)[0][0], Value::integer(5));
        EXPECT_EQ(db.exec("INSERT INTO test VALUES (6)").code, ErrorCode::EngineError);
    }
    std::remove(path.c_str());
}

TEST_F(DatabaseTest, StatementHookSeesEverySql) {
    std::vector<std::string> seen;
    db_.on_statement([&](const std::string& sql) { seen.push_back(sql); });

    ASSERT_TRUE(db_.exec("CREATE TABLE test (x INTEGER)").ok());
    ASSERT_TRUE(db_.execute(Statement{"SELECT x FROM test", {}}).ok());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "CREATE TABLE test (x INTEGER)");
    EXPECT_EQ(seen[1], "SELECT x FROM test");
}

TEST_F(DatabaseTest, ForeignKeysPragma) {
    pebble::DatabaseConfig config;
    config.foreign_keys = true;
    pebble::Database db(config);
    ASSERT_TRUE(db.is_open());

    auto result = db.execute(Statement{"PRAGMA foreign_keys", {}});
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result->size(), 1u);
    EXPECT_EQ((*result)[0][0], Value::integer(1));
}
