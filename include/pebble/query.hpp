/**
 * pebble/query.hpp - Fluent filter/order/limit builder
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * Example usage:
 *
 *   auto cheap = db.query()
 *       .where_eq("category", "Basic")
 *       .where_lt("cost", 500)
 *       .order_by("name")
 *       .limit(10)
 *       .fetch<Item>();
 *
 * Filters combine with AND in the order they were added. order_by() and
 * limit() replace any earlier call. Comparison values are bound as text,
 * so where_gt()/where_lt() are numeric against an INTEGER primary key but
 * lexicographic against the other columns, which are declared TEXT:
 * where_gt("cost", 1000) matches a cost of 450. A terminal fetch()/fetch_one()
 * consumes the accumulated state and leaves the builder empty.
 */

#pragma once

#include "database.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pebble {

// ============================================================================
// Query Builder
// ============================================================================

class QueryBuilder {
public:
    explicit QueryBuilder(Database& db) : db_(db) {}

    template<typename T>
    QueryBuilder& where_eq(const std::string& column, const T& value) {
        return add(FilterOp::Equal, column, from_native(value));
    }

    template<typename T>
    QueryBuilder& where_like(const std::string& column, const T& pattern) {
        return add(FilterOp::Like, column, from_native(pattern));
    }

    template<typename T>
    QueryBuilder& where_gt(const std::string& column, const T& value) {
        return add(FilterOp::Greater, column, from_native(value));
    }

    template<typename T>
    QueryBuilder& where_lt(const std::string& column, const T& value) {
        return add(FilterOp::Less, column, from_native(value));
    }

    QueryBuilder& order_by(const std::string& column, bool ascending = true) {
        spec_.order = OrderBy{column, ascending};
        return *this;
    }

    /**
     * Cap the number of rows. A negative n is recorded as InvalidQuery and
     * reported by the next fetch, which then never reaches the database.
     */
    QueryBuilder& limit(int64_t n) {
        if (n < 0) {
            if (error_.ok()) {
                error_ = Status::fail(ErrorCode::InvalidQuery,
                    "negative limit " + std::to_string(n));
            }
            return *this;
        }
        spec_.limit = n;
        return *this;
    }

    const QuerySpec& spec() const { return spec_; }

    // First error recorded since the last terminal call
    const Status& status() const { return error_; }

    // ========================================================================
    // Terminal Operations
    // ========================================================================

    template<typename R>
    Result<std::vector<R>> fetch() {
        Status error = std::exchange(error_, Status());
        QuerySpec spec = std::exchange(spec_, QuerySpec());
        if (!error.ok()) return error;
        return db_.select<R>(spec);
    }

    /**
     * First matching record, if any. The statement is capped at LIMIT 1
     * unless the caller already asked for 0 or 1 rows.
     */
    template<typename R>
    Result<std::optional<R>> fetch_one() {
        Status error = std::exchange(error_, Status());
        QuerySpec spec = std::exchange(spec_, QuerySpec());
        if (!error.ok()) return error;

        if (!spec.limit || *spec.limit > 1) spec.limit = 1;

        auto records = db_.select<R>(spec);
        if (!records.ok()) return records.status();
        if (records->empty()) return std::optional<R>();
        return std::optional<R>(std::move(records->front()));
    }

private:
    Database& db_;
    QuerySpec spec_;
    Status error_;

    QueryBuilder& add(FilterOp op, const std::string& column, const Value& value) {
        spec_.filters.push_back(FilterClause{op, column, to_text(value)});
        return *this;
    }
};

inline QueryBuilder Database::query() {
    return QueryBuilder(*this);
}

} // namespace pebble
