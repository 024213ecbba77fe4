/**
 * pebble/statement.hpp - SQL statement rendering
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * Each builder turns a ModelInfo (plus a row, id or QuerySpec) into SQL
 * text with '?' placeholders and the ordered values to bind to them.
 * Builders never touch the database.
 *
 *   auto info = pebble::ModelInfo::of<User>();
 *   pebble::QuerySpec q;
 *   q.filters.push_back({pebble::FilterOp::Equal, "name", pebble::Value::text("Alice")});
 *   q.limit = 10;
 *   auto stmt = pebble::build_select(*info, q);
 *   // SELECT id, name, email FROM users WHERE name = ? LIMIT 10
 */

#pragma once

#include "model.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pebble {

// ============================================================================
// Statement
// ============================================================================

struct Statement {
    std::string sql;
    std::vector<Value> params;  // in placeholder order

    size_t placeholder_count() const {
        return static_cast<size_t>(std::count(sql.begin(), sql.end(), '?'));
    }
};

// ============================================================================
// Query Spec
// ============================================================================

enum class FilterOp {
    Equal,
    Like,
    Greater,
    Less
};

inline const char* filter_op_sql(FilterOp op) {
    switch (op) {
        case FilterOp::Equal:   return "=";
        case FilterOp::Like:    return "LIKE";
        case FilterOp::Greater: return ">";
        case FilterOp::Less:    return "<";
    }
    return "=";
}

struct FilterClause {
    FilterOp op;
    std::string column;
    Value value;
};

struct OrderBy {
    std::string column;
    bool ascending = true;
};

/**
 * Accumulated filter/order/limit state for one SELECT.
 * Filters combine with AND in insertion order.
 */
struct QuerySpec {
    std::vector<FilterClause> filters;
    std::optional<OrderBy> order;
    std::optional<int64_t> limit;

    bool empty() const { return filters.empty() && !order && !limit; }
};

// ============================================================================
// Builders
// ============================================================================

namespace detail {

inline Status check_model(const ModelInfo& m) {
    if (m.fields.empty()) {
        return Status::fail(ErrorCode::InvalidModel,
            "model '" + m.table + "' has no fields");
    }
    if (m.primary_key_index >= m.fields.size()) {
        return Status::fail(ErrorCode::InvalidModel,
            "primary key index out of range for '" + m.table + "'");
    }
    return Status::success();
}

inline Status check_arity(const ModelInfo& m, const Row& row) {
    if (row.size() != m.fields.size()) {
        return Status::fail(ErrorCode::InvalidModel,
            "row for '" + m.table + "' has " + std::to_string(row.size()) +
            " values, expected " + std::to_string(m.fields.size()));
    }
    return Status::success();
}

inline std::string column_list(const ModelInfo& m) {
    std::ostringstream ss;
    for (size_t i = 0; i < m.fields.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << m.fields[i];
    }
    return ss.str();
}

// Non-key columns are declared TEXT. Reals are written in their shortest
// exact text form so they read back unchanged.
inline Value stored_value(const ModelInfo& m, size_t index, const Value& v) {
    if (index != m.primary_key_index && v.kind() == ValueKind::Real) {
        return to_text(v);
    }
    return v;
}

} // namespace detail

inline Result<Statement> build_create_table(const ModelInfo& m) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;

    std::ostringstream ss;
    ss << "CREATE TABLE IF NOT EXISTS " << m.table << " (";
    for (size_t i = 0; i < m.fields.size(); ++i) {
        if (i > 0) ss << ", ";
        if (i == m.primary_key_index) {
            ss << m.fields[i] << " " << column_type_sql(m.primary_key_type) << " PRIMARY KEY";
        } else {
            ss << m.fields[i] << " TEXT";
        }
    }
    ss << ")";

    Statement stmt;
    stmt.sql = ss.str();
    return stmt;
}

inline Result<Statement> build_insert(const ModelInfo& m, const Row& row) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;
    st = detail::check_arity(m, row);
    if (!st.ok()) return st;

    Statement stmt;
    std::ostringstream ss;
    ss << "INSERT INTO " << m.table << " (" << detail::column_list(m) << ") VALUES (";
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << "?";
        stmt.params.push_back(detail::stored_value(m, i, row[i]));
    }
    ss << ")";
    stmt.sql = ss.str();
    return stmt;
}

inline Result<Statement> build_select(const ModelInfo& m, const QuerySpec& q) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;

    Statement stmt;
    std::ostringstream ss;
    ss << "SELECT " << detail::column_list(m) << " FROM " << m.table;

    for (size_t i = 0; i < q.filters.size(); ++i) {
        const FilterClause& clause = q.filters[i];
        if (!m.has_field(clause.column)) {
            return Status::fail(ErrorCode::InvalidQuery,
                "unknown filter column '" + clause.column + "' for '" + m.table + "'");
        }
        ss << (i == 0 ? " WHERE " : " AND ");
        ss << clause.column << " " << filter_op_sql(clause.op) << " ?";
        stmt.params.push_back(clause.value);
    }

    if (q.order) {
        if (!m.has_field(q.order->column)) {
            return Status::fail(ErrorCode::InvalidQuery,
                "unknown order column '" + q.order->column + "' for '" + m.table + "'");
        }
        ss << " ORDER BY " << q.order->column << (q.order->ascending ? " ASC" : " DESC");
    }

    if (q.limit) {
        if (*q.limit < 0) {
            return Status::fail(ErrorCode::InvalidQuery,
                "negative limit " + std::to_string(*q.limit));
        }
        ss << " LIMIT " << *q.limit;
    }

    stmt.sql = ss.str();
    return stmt;
}

inline Result<Statement> build_find_by_id(const ModelInfo& m, const Value& id) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;

    Statement stmt;
    stmt.sql = "SELECT " + detail::column_list(m) + " FROM " + m.table +
               " WHERE " + m.primary_key + " = ?";
    stmt.params.push_back(id);
    return stmt;
}

inline Result<Statement> build_update(const ModelInfo& m, const Row& row) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;
    st = detail::check_arity(m, row);
    if (!st.ok()) return st;
    if (m.fields.size() == 1) {
        return Status::fail(ErrorCode::InvalidModel,
            "model '" + m.table + "' has no columns besides its primary key");
    }

    Statement stmt;
    std::ostringstream ss;
    ss << "UPDATE " << m.table << " SET ";
    bool first = true;
    for (size_t i = 0; i < m.fields.size(); ++i) {
        if (i == m.primary_key_index) continue;
        if (!first) ss << ", ";
        first = false;
        ss << m.fields[i] << " = ?";
        stmt.params.push_back(detail::stored_value(m, i, row[i]));
    }
    ss << " WHERE " << m.primary_key << " = ?";
    stmt.params.push_back(row[m.primary_key_index]);

    stmt.sql = ss.str();
    return stmt;
}

inline Result<Statement> build_delete(const ModelInfo& m, const Value& id) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;

    Statement stmt;
    stmt.sql = "DELETE FROM " + m.table + " WHERE " + m.primary_key + " = ?";
    stmt.params.push_back(id);
    return stmt;
}

inline Result<Statement> build_drop_table(const ModelInfo& m) {
    auto st = detail::check_model(m);
    if (!st.ok()) return st;

    Statement stmt;
    stmt.sql = "DROP TABLE IF EXISTS " + m.table;
    return stmt;
}

} // namespace pebble
