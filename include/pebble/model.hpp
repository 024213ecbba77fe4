/**
 * pebble/model.hpp - Record contract and model metadata
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * Any type can be persisted by providing a few static members and a
 * pair of row conversions. No base class is involved.
 *
 *   struct User {
 *       int64_t id = 0;
 *       std::string name;
 *       std::string email;
 *
 *       static std::string table_name() { return "users"; }
 *       static std::vector<std::string> fields() { return {"id", "name", "email"}; }
 *
 *       pebble::Row to_row() const { return pebble::make_row(id, name, email); }
 *
 *       static pebble::Result<User> from_row(const pebble::Row& row) {
 *           User u;
 *           auto st = pebble::decode_row(row, u.id, u.name, u.email);
 *           if (!st.ok()) return st;
 *           return u;
 *       }
 *   };
 *
 * Optional members:
 *   static std::string primary_key();            // default "id", else first "*_id"
 *   static pebble::ColumnType primary_key_type(); // default taken from R{}.to_row()
 */

#pragma once

#include "value.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pebble {

// ============================================================================
// Contract Detection
// ============================================================================

namespace detail {

template<typename R, typename = void>
struct is_model : std::false_type {};

template<typename R>
struct is_model<R, std::void_t<
    decltype(std::string(R::table_name())),
    decltype(std::vector<std::string>(R::fields())),
    decltype(Row(std::declval<const R&>().to_row())),
    decltype(Result<R>(R::from_row(std::declval<const Row&>())))>>
    : std::true_type {};

template<typename R, typename = void>
struct has_primary_key : std::false_type {};

template<typename R>
struct has_primary_key<R, std::void_t<decltype(std::string(R::primary_key()))>>
    : std::true_type {};

template<typename R, typename = void>
struct has_primary_key_type : std::false_type {};

template<typename R>
struct has_primary_key_type<R, std::void_t<decltype(ColumnType(R::primary_key_type()))>>
    : std::true_type {};

} // namespace detail

template<typename R>
inline constexpr bool is_model_v = detail::is_model<R>::value;

// ============================================================================
// Row Helpers
// ============================================================================

template<typename... Fields>
Row make_row(const Fields&... fields) {
    return Row{from_native(fields)...};
}

namespace detail {

template<typename T>
Status decode_cell(const Row& row, size_t index, T& out) {
    auto v = to_native<T>(row[index]);
    if (!v.ok()) {
        return Status::fail(ErrorCode::DecodeError,
            "column " + std::to_string(index) + ": " + v.status().message);
    }
    out = std::move(*v);
    return Status::success();
}

} // namespace detail

/**
 * Decode row cells, in order, into the given fields.
 * Fails with DecodeError on arity mismatch or the first cell that does
 * not convert. Fields after a failing cell are left untouched.
 */
template<typename... Fields>
Status decode_row(const Row& row, Fields&... fields) {
    if (row.size() != sizeof...(Fields)) {
        return Status::fail(ErrorCode::DecodeError,
            "row has " + std::to_string(row.size()) + " cells, expected " +
            std::to_string(sizeof...(Fields)));
    }
    Status status;
    size_t index = 0;
    (void)(... && (status = detail::decode_cell(row, index++, fields)).ok());
    return status;
}

// ============================================================================
// Identifiers
// ============================================================================

// Table and column names are spliced into SQL text, so they are limited
// to plain identifiers.
inline bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    auto head = static_cast<unsigned char>(s[0]);
    if (!(std::isalpha(head) || head == '_')) return false;
    return std::all_of(s.begin() + 1, s.end(), [](char c) {
        auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '_';
    });
}

// ============================================================================
// Model Metadata
// ============================================================================

/**
 * Validated static shape of a record type: table, ordered columns and
 * primary key. Every statement is rendered from one of these.
 */
struct ModelInfo {
    std::string table;
    std::vector<std::string> fields;
    std::string primary_key;
    size_t primary_key_index = 0;
    ColumnType primary_key_type = ColumnType::Integer;

    bool has_field(const std::string& name) const {
        return std::find(fields.begin(), fields.end(), name) != fields.end();
    }

    /**
     * Validate a shape. An empty primary_key selects the default key:
     * "id" when present, otherwise the first field ending in "_id".
     */
    static Result<ModelInfo> make(std::string table,
                                  std::vector<std::string> fields,
                                  std::string primary_key = std::string(),
                                  ColumnType primary_key_type = ColumnType::Integer) {
        if (!is_identifier(table)) {
            return Status::fail(ErrorCode::InvalidModel,
                "invalid table name '" + table + "'");
        }
        if (fields.empty()) {
            return Status::fail(ErrorCode::InvalidModel,
                "model '" + table + "' has no fields");
        }
        for (size_t i = 0; i < fields.size(); ++i) {
            if (!is_identifier(fields[i])) {
                return Status::fail(ErrorCode::InvalidModel,
                    "invalid field name '" + fields[i] + "' in '" + table + "'");
            }
            if (std::find(fields.begin(), fields.begin() + i, fields[i]) != fields.begin() + i) {
                return Status::fail(ErrorCode::InvalidModel,
                    "duplicate field '" + fields[i] + "' in '" + table + "'");
            }
        }

        if (primary_key.empty()) {
            auto it = std::find(fields.begin(), fields.end(), "id");
            if (it == fields.end()) {
                it = std::find_if(fields.begin(), fields.end(), [](const std::string& f) {
                    return f.size() > 3 && f.compare(f.size() - 3, 3, "_id") == 0;
                });
            }
            if (it == fields.end()) {
                return Status::fail(ErrorCode::InvalidModel,
                    "model '" + table + "' has no id-like field for a primary key");
            }
            primary_key = *it;
        }

        auto pk = std::find(fields.begin(), fields.end(), primary_key);
        if (pk == fields.end()) {
            return Status::fail(ErrorCode::InvalidModel,
                "primary key '" + primary_key + "' is not a field of '" + table + "'");
        }

        ModelInfo info;
        info.primary_key_index = static_cast<size_t>(pk - fields.begin());
        info.table = std::move(table);
        info.fields = std::move(fields);
        info.primary_key = std::move(primary_key);
        info.primary_key_type = primary_key_type;
        return info;
    }

    template<typename R>
    static Result<ModelInfo> of() {
        static_assert(is_model_v<R>, "type does not satisfy the pebble record contract");

        std::string pk;
        if constexpr (detail::has_primary_key<R>::value) {
            pk = R::primary_key();
            if (pk.empty()) {
                return Status::fail(ErrorCode::InvalidModel, "empty primary key name");
            }
        }

        auto info = make(R::table_name(), R::fields(), std::move(pk));
        if (!info.ok()) return info;

        if constexpr (detail::has_primary_key_type<R>::value) {
            info->primary_key_type = R::primary_key_type();
        } else if constexpr (std::is_default_constructible_v<R>) {
            Row sample = R().to_row();
            if (sample.size() == info->fields.size()) {
                info->primary_key_type = column_type_for(sample[info->primary_key_index].kind());
            }
        }
        return info;
    }
};

} // namespace pebble
