/**
 * pebble/config.hpp - Database configuration
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * A DatabaseConfig can be filled in directly or read from JSON:
 *
 *   {
 *     "path": "app.db",
 *     "read_only": false,
 *     "create_if_missing": true,
 *     "foreign_keys": true
 *   }
 *
 * Unknown keys are ignored.
 */

#pragma once

#include "error.hpp"
#include "json.hpp"
#include <fstream>
#include <functional>
#include <string>

namespace pebble {

// ============================================================================
// Configuration
// ============================================================================

/**
 * Statement hook.
 * Receives the SQL text of every statement right before it is sent to
 * SQLite. Statements rejected earlier never reach it.
 */
using statement_hook_t = std::function<void(const std::string& sql)>;

struct DatabaseConfig {
    std::string path = ":memory:";
    bool read_only = false;
    bool create_if_missing = true;
    bool foreign_keys = false;

    // Optional: tracing/logging of executed SQL
    statement_hook_t on_statement;
};

namespace detail {

inline Status read_bool(const json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return Status::success();
    if (!it->is_boolean()) {
        return Status::fail(ErrorCode::InvalidConfig,
            std::string("'") + key + "' must be a boolean");
    }
    out = it->get<bool>();
    return Status::success();
}

} // namespace detail

inline Result<DatabaseConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Status::fail(ErrorCode::InvalidConfig, "configuration must be a JSON object");
    }

    DatabaseConfig config;
    auto path = j.find("path");
    if (path != j.end()) {
        if (!path->is_string() || path->get<std::string>().empty()) {
            return Status::fail(ErrorCode::InvalidConfig, "'path' must be a non-empty string");
        }
        config.path = path->get<std::string>();
    }

    Status st = detail::read_bool(j, "read_only", config.read_only);
    if (st.ok()) st = detail::read_bool(j, "create_if_missing", config.create_if_missing);
    if (st.ok()) st = detail::read_bool(j, "foreign_keys", config.foreign_keys);
    if (!st.ok()) return st;

    return config;
}

inline Result<DatabaseConfig> load_config(const std::string& file) {
    std::ifstream in(file);
    if (!in) {
        return Status::fail(ErrorCode::InvalidConfig, "cannot open config file '" + file + "'");
    }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Status::fail(ErrorCode::InvalidConfig, "malformed JSON in '" + file + "'");
    }
    return config_from_json(j);
}

} // namespace pebble
