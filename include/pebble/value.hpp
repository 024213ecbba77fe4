/**
 * pebble/value.hpp - Column values and native conversions
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * A Value is one cell: null, integer, real or text. Record fields turn
 * into Values with from_native() (total) and come back with
 * to_native<T>() (partial, fails with TypeMismatch).
 *
 *   pebble::Value v = pebble::from_native(42);
 *   auto n = pebble::to_native<int>(v);          // ok, 42
 *   auto s = pebble::to_native<std::string>(v);  // TypeMismatch
 */

#pragma once

#include "types.hpp"
#include "error.hpp"
#include <sqlite3.h>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <locale>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace pebble {

// ============================================================================
// Value
// ============================================================================

class Value {
public:
    Value() = default;

    static Value null() { return Value(); }

    static Value integer(int64_t v) {
        Value r;
        r.data_ = v;
        return r;
    }

    static Value real(double v) {
        Value r;
        r.data_ = v;
        return r;
    }

    static Value text(std::string v) {
        Value r;
        r.data_ = std::move(v);
        return r;
    }

    ValueKind kind() const {
        switch (data_.index()) {
            case 1: return ValueKind::Integer;
            case 2: return ValueKind::Real;
            case 3: return ValueKind::Text;
        }
        return ValueKind::Null;
    }

    bool is_null() const { return kind() == ValueKind::Null; }

    // Accessors require the matching kind
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_real() const { return std::get<double>(data_); }
    const std::string& as_text() const { return std::get<std::string>(data_); }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, int64_t, double, std::string> data_;
};

using Row = std::vector<Value>;

namespace detail {

// Plain decimal or exponent notation, optional sign, locale independent.
// Hex, inf and nan spellings are not numbers here.
inline bool parse_double(const std::string& s, double& out) {
    const char* first = s.data();
    const char* last = first + s.size();
    if (first != last && *first == '+') {
        ++first;
        if (first == last || *first == '-') return false;
    }
    if (first == last || *first == '+') return false;
    double d = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec != std::errc() || ptr != last || !std::isfinite(d)) return false;
    out = d;
    return true;
}

// Shortest decimal form (15..17 significant digits) that reads back as
// the same double. 15 digits matches SQLite's own REAL-to-TEXT form.
inline std::string real_to_text(double d) {
    std::string out;
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss.precision(precision);
        ss << d;
        out = ss.str();
        double back = 0.0;
        if (parse_double(out, back) && back == d) break;
    }
    return out;
}

} // namespace detail

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null:    return os << "NULL";
        case ValueKind::Integer: return os << v.as_integer();
        case ValueKind::Real:    return os << detail::real_to_text(v.as_real());
        case ValueKind::Text:    return os << '\'' << v.as_text() << '\'';
    }
    return os;
}

// ============================================================================
// Native -> Value
// ============================================================================

namespace detail {

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

// uint64_t has no lossless integer representation, so it is not a native
template<typename T>
inline constexpr bool is_native_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> &&
    (std::is_signed_v<T> || sizeof(T) < sizeof(int64_t));

template<typename T>
inline constexpr bool dependent_false_v = false;

} // namespace detail

inline Value from_native(std::nullptr_t) { return Value(); }

inline Value from_native(bool v) { return Value::integer(v ? 1 : 0); }

template<typename T, std::enable_if_t<detail::is_native_integer_v<T>, int> = 0>
Value from_native(T v) {
    return Value::integer(static_cast<int64_t>(v));
}

inline Value from_native(float v) { return Value::real(static_cast<double>(v)); }
inline Value from_native(double v) { return Value::real(v); }

inline Value from_native(const std::string& v) { return Value::text(v); }
inline Value from_native(std::string_view v) { return Value::text(std::string(v)); }

inline Value from_native(const char* v) {
    return v ? Value::text(v) : Value();
}

inline Value from_native(const Value& v) { return v; }

template<typename T>
Value from_native(const std::optional<T>& v) {
    return v ? from_native(*v) : Value();
}

// ============================================================================
// Value -> Native
// ============================================================================

namespace detail {

inline Status mismatch(const Value& v, const char* target) {
    std::string msg = "cannot convert ";
    msg += value_kind_name(v.kind());
    if (v.kind() == ValueKind::Text) {
        msg += " '" + v.as_text() + "'";
    }
    msg += " to ";
    msg += target;
    return Status::fail(ErrorCode::TypeMismatch, std::move(msg));
}

inline bool parse_int64(const std::string& s, int64_t& out) {
    const char* first = s.data();
    const char* last = first + s.size();
    if (first != last && *first == '+') {
        ++first;
        if (first == last || *first == '-') return false;
    }
    if (first == last || *first == '+') return false;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

// Integers with magnitude up to 2^53 convert to double exactly
constexpr int64_t kMaxExactDouble = int64_t(1) << 53;

template<typename T>
Result<T> integer_from(const Value& v) {
    int64_t n = 0;
    switch (v.kind()) {
        case ValueKind::Integer:
            n = v.as_integer();
            break;
        case ValueKind::Text:
            if (!parse_int64(v.as_text(), n)) return mismatch(v, "integer");
            break;
        case ValueKind::Real: {
            double d = v.as_real();
            if (!std::isfinite(d) || std::trunc(d) != d ||
                d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                return mismatch(v, "integer");
            }
            n = static_cast<int64_t>(d);
            break;
        }
        case ValueKind::Null:
            return mismatch(v, "integer");
    }

    if constexpr (!std::is_same_v<T, int64_t>) {
        if (n < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
            n > static_cast<int64_t>(std::numeric_limits<T>::max())) {
            return Status::fail(ErrorCode::TypeMismatch,
                "integer " + std::to_string(n) + " out of range for target field");
        }
    }
    return static_cast<T>(n);
}

inline Result<bool> bool_from(const Value& v) {
    if (v.kind() == ValueKind::Text) {
        const std::string& s = v.as_text();
        if (s == "true") return true;
        if (s == "false") return false;
    }
    if (v.kind() == ValueKind::Real) return mismatch(v, "bool");

    auto n = integer_from<int64_t>(v);
    if (!n.ok()) return mismatch(v, "bool");
    if (*n != 0 && *n != 1) return mismatch(v, "bool");
    return *n == 1;
}

template<typename T>
Result<T> floating_from(const Value& v) {
    double d = 0.0;
    switch (v.kind()) {
        case ValueKind::Real:
            d = v.as_real();
            break;
        case ValueKind::Integer: {
            int64_t n = v.as_integer();
            if (n > kMaxExactDouble || n < -kMaxExactDouble) return mismatch(v, "real");
            d = static_cast<double>(n);
            break;
        }
        case ValueKind::Text:
            if (!parse_double(v.as_text(), d)) return mismatch(v, "real");
            break;
        case ValueKind::Null:
            return mismatch(v, "real");
    }

    if constexpr (std::is_same_v<T, float>) {
        if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max()) {
            return mismatch(v, "float");
        }
        if (!std::isnan(d) && static_cast<double>(static_cast<float>(d)) != d) {
            return mismatch(v, "float");
        }
    }
    return static_cast<T>(d);
}

} // namespace detail

/**
 * Convert a Value into a record field type.
 *
 * Text cells holding a whole number convert to numeric fields, since
 * non-key columns are declared TEXT and SQLite stores numbers in them
 * as text. Null only converts into std::optional. Conversions never
 * round: a float field only accepts values a float holds exactly.
 */
template<typename T>
Result<T> to_native(const Value& v) {
    if constexpr (std::is_same_v<T, Value>) {
        return v;
    } else if constexpr (detail::is_optional_v<T>) {
        using Inner = typename T::value_type;
        if (v.is_null()) return T();
        auto inner = to_native<Inner>(v);
        if (!inner.ok()) return inner.status();
        return T(std::move(*inner));
    } else if constexpr (std::is_same_v<T, bool>) {
        return detail::bool_from(v);
    } else if constexpr (detail::is_native_integer_v<T>) {
        return detail::integer_from<T>(v);
    } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
        return detail::floating_from<T>(v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (v.kind() != ValueKind::Text) return detail::mismatch(v, "text");
        return v.as_text();
    } else {
        static_assert(detail::dependent_false_v<T>, "unsupported native type");
    }
}

/**
 * Text form used for filter comparison values. Null stays null.
 */
inline Value to_text(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Integer: return Value::text(std::to_string(v.as_integer()));
        case ValueKind::Real:    return Value::text(detail::real_to_text(v.as_real()));
        case ValueKind::Text:
        case ValueKind::Null:
            break;
    }
    return v;
}

// ============================================================================
// Engine Conversion
// ============================================================================

// Bind v to 1-based parameter index. Returns the SQLite result code.
inline int bind_value(sqlite3_stmt* stmt, int index, const Value& v) {
    switch (v.kind()) {
        case ValueKind::Null:
            return sqlite3_bind_null(stmt, index);
        case ValueKind::Integer:
            return sqlite3_bind_int64(stmt, index, v.as_integer());
        case ValueKind::Real:
            return sqlite3_bind_double(stmt, index, v.as_real());
        case ValueKind::Text: {
            const std::string& s = v.as_text();
            return sqlite3_bind_text(stmt, index, s.data(),
                                     static_cast<int>(s.size()), SQLITE_TRANSIENT);
        }
    }
    return SQLITE_MISUSE;
}

// Read the current row's column col. BLOB cells come back as text.
inline Value column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return Value::integer(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return Value::real(sqlite3_column_double(stmt, col));
        case SQLITE_NULL:
            return Value();
        default: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int bytes = sqlite3_column_bytes(stmt, col);
            return Value::text(text ? std::string(text, static_cast<size_t>(bytes)) : std::string());
        }
    }
}

} // namespace pebble
