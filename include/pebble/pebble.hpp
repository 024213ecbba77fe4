/**
 * pebble/pebble.hpp - Master include for pebble
 *
 * pebble - a minimal record mapper over SQLite
 *
 * Include this single header to get all pebble functionality:
 *   - Value, from_native, to_native - Cell values and field conversions
 *   - ModelInfo, make_row, decode_row - The record contract
 *   - build_* - SQL statement rendering
 *   - Database - RAII database wrapper with record operations
 *   - QueryBuilder - Fluent filter/order/limit queries
 *
 * Example:
 *
 *   #include <pebble/pebble.hpp>
 *
 *   pebble::Database db;
 *   db.create_table<User>();
 *   db.insert(User{1, "Alice", "alice@example.com"});
 *
 *   auto alice = db.query()
 *       .where_eq("name", "Alice")
 *       .fetch_one<User>();
 */

#pragma once

#include "error.hpp"
#include "types.hpp"
#include "value.hpp"
#include "model.hpp"
#include "statement.hpp"
#include "json.hpp"
#include "config.hpp"
#include "database.hpp"
#include "query.hpp"
