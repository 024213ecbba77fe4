#pragma once
/// @file json.hpp
/// @brief JSON library alias and Value/record export for pebble
///
/// Wraps nlohmann/json. Values map to their natural JSON types and a
/// record exports as an object keyed by its field names, in field order.

#include "model.hpp"
#include <nlohmann/json.hpp>

namespace pebble {

/// JSON type alias
using json = nlohmann::json;

/// Ordered JSON (preserves insertion order)
using ordered_json = nlohmann::ordered_json;

template<typename J>
J value_to_json(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Integer: return J(v.as_integer());
        case ValueKind::Real:    return J(v.as_real());
        case ValueKind::Text:    return J(v.as_text());
        case ValueKind::Null:
            break;
    }
    return J(nullptr);
}

/// nlohmann ADL hooks: `json j = value;`
inline void to_json(json& j, const Value& v) { j = value_to_json<json>(v); }
inline void to_json(ordered_json& j, const Value& v) { j = value_to_json<ordered_json>(v); }

/// Export a record as {"field": value, ...} in fields() order.
/// A record whose to_row() does not match fields() exports as null.
template<typename R>
ordered_json record_to_json(const R& record) {
    static_assert(is_model_v<R>, "type does not satisfy the pebble record contract");

    std::vector<std::string> fields = R::fields();
    Row row = record.to_row();
    if (row.size() != fields.size()) {
        return ordered_json(nullptr);
    }

    ordered_json out = ordered_json::object();
    for (size_t i = 0; i < fields.size(); ++i) {
        out[fields[i]] = value_to_json<ordered_json>(row[i]);
    }
    return out;
}

} // namespace pebble
