/**
 * pebble/types.hpp - Column and value kinds
 *
 * Part of pebble - a minimal record mapper over SQLite.
 */

#pragma once

namespace pebble {

// ============================================================================
// Value Kinds
// ============================================================================

enum class ValueKind {
    Null,
    Integer,
    Real,
    Text
};

inline const char* value_kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::Null:    return "null";
        case ValueKind::Integer: return "integer";
        case ValueKind::Real:    return "real";
        case ValueKind::Text:    return "text";
    }
    return "unknown";
}

// ============================================================================
// Column Types
// ============================================================================

// Declared type of a column in CREATE TABLE. Only the primary key uses
// anything other than Text.
enum class ColumnType {
    Integer,
    Real,
    Text
};

inline const char* column_type_sql(ColumnType t) {
    switch (t) {
        case ColumnType::Integer: return "INTEGER";
        case ColumnType::Real:    return "REAL";
        case ColumnType::Text:    return "TEXT";
    }
    return "TEXT";
}

inline ColumnType column_type_for(ValueKind k) {
    switch (k) {
        case ValueKind::Real: return ColumnType::Real;
        case ValueKind::Text: return ColumnType::Text;
        case ValueKind::Integer:
        case ValueKind::Null:
            break;
    }
    return ColumnType::Integer;
}

} // namespace pebble
