/// @file value.hpp
/// @brief The value tree: Null, Value, Array, Object and comparison helpers.

#pragma once

#include <jsonmanip-cpp/decimal.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmanip_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

class Value;
class Object;

/// An ordered, 0-indexed, mutable sequence of values.
using Array = std::vector<Value>;

/// The kinds of value a Value can hold.
enum class ValueType : std::uint8_t {
    null,     ///< Null.
    boolean,  ///< bool.
    integer,  ///< 64-bit signed integer.
    number,   ///< double.
    decimal,  ///< Arbitrary-precision Decimal.
    string,   ///< UTF-8 string.
    array,    ///< Sequence of values.
    object,   ///< Insertion-ordered string-keyed mapping.
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:    return "null";
        case ValueType::boolean: return "boolean";
        case ValueType::integer: return "integer";
        case ValueType::number:  return "number";
        case ValueType::decimal: return "decimal";
        case ValueType::string:  return "string";
        case ValueType::array:   return "array";
        case ValueType::object:  return "object";
    }
    return "unknown";
}

/// A node of a JSON-like value tree.
///
/// Containers are boxed: an Array or Object keeps its address while the
/// Value holding it is moved (for example when a parent array grows), which
/// is what lets a Node refer to a container by identity. Copying a Value
/// copies the whole subtree.
///
/// @code
/// auto doc = Value{Object{{"items", Array{1, 2, 3}}, {"name", "list"}}};
/// doc.as_object().at("items").as_array().push_back(4);
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        Decimal,
        std::string,
        std::unique_ptr<Array>,
        std::unique_ptr<Object>
    >;

    Value() noexcept = default;
    Value(Null) noexcept {}
    Value(std::nullptr_t) noexcept {}
    Value(bool b) noexcept : data_{b} {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) noexcept : data_{static_cast<std::int64_t>(i)} {}

    template <std::floating_point T>
    Value(T d) noexcept : data_{static_cast<double>(d)} {}

    Value(Decimal d) : data_{std::move(d)} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(Array a);
    Value(Object o);

    ~Value();
    Value(const Value& other);
    Value(Value&& other) noexcept;
    auto operator=(const Value& other) -> Value&;
    auto operator=(Value&& other) noexcept -> Value&;

    // -- Inspection ----------------------------------------------------------

    auto type() const noexcept -> ValueType;

    auto is_null() const noexcept -> bool { return std::holds_alternative<Null>(data_); }
    auto is_bool() const noexcept -> bool { return std::holds_alternative<bool>(data_); }
    auto is_int() const noexcept -> bool { return std::holds_alternative<std::int64_t>(data_); }
    auto is_double() const noexcept -> bool { return std::holds_alternative<double>(data_); }
    auto is_decimal() const noexcept -> bool { return std::holds_alternative<Decimal>(data_); }
    auto is_number() const noexcept -> bool { return is_int() || is_double() || is_decimal(); }
    auto is_string() const noexcept -> bool { return std::holds_alternative<std::string>(data_); }
    auto is_array() const noexcept -> bool {
        return std::holds_alternative<std::unique_ptr<Array>>(data_);
    }
    auto is_object() const noexcept -> bool {
        return std::holds_alternative<std::unique_ptr<Object>>(data_);
    }
    auto is_container() const noexcept -> bool { return is_array() || is_object(); }

    // -- Typed access (throw a type_error Error on mismatch) -----------------

    auto as_bool() const -> bool;
    auto as_int() const -> std::int64_t;
    auto as_double() const -> double;
    auto as_decimal() const -> const Decimal&;
    auto as_string() const -> const std::string&;
    auto as_array() -> Array&;
    auto as_array() const -> const Array&;
    auto as_object() -> Object&;
    auto as_object() const -> const Object&;

    /// Direct access to the underlying variant.
    auto storage() const noexcept -> const Storage& { return data_; }

    /// Deep equality; see deep_equal().
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage data_;
};

/// An insertion-ordered mapping from strings to values.
///
/// Assigning an existing key keeps its position, new keys are appended and
/// erasing a key keeps the order of the remaining entries. Lookups are
/// linear in the number of entries.
class Object {
public:
    using value_type = std::pair<std::string, Value>;
    using iterator = std::vector<value_type>::iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    Object() = default;
    Object(std::initializer_list<value_type> entries);

    auto size() const noexcept -> std::size_t { return entries_.size(); }
    auto empty() const noexcept -> bool { return entries_.empty(); }

    auto begin() noexcept -> iterator { return entries_.begin(); }
    auto end() noexcept -> iterator { return entries_.end(); }
    auto begin() const noexcept -> const_iterator { return entries_.begin(); }
    auto end() const noexcept -> const_iterator { return entries_.end(); }

    auto find(std::string_view key) -> iterator;
    auto find(std::string_view key) const -> const_iterator;
    auto contains(std::string_view key) const -> bool { return find(key) != end(); }

    /// Value at `key`; throws a key_error Error when absent.
    auto at(std::string_view key) -> Value&;
    auto at(std::string_view key) const -> const Value&;

    /// Value at `key`, inserting null at the end when absent.
    auto operator[](std::string_view key) -> Value&;

    /// Assign `value` to `key`, keeping the key's position if it exists.
    auto insert_or_assign(std::string key, Value value) -> Value&;

    /// Remove `key`; returns false when it was absent.
    auto erase(std::string_view key) -> bool;

    void clear() noexcept { entries_.clear(); }

    /// The keys in insertion order.
    auto keys() const -> std::vector<std::string>;

    /// Deep equality; key order is not significant.
    friend auto operator==(const Object& a, const Object& b) -> bool;

private:
    std::vector<value_type> entries_;
};

// =============================================================================
// Equality and ordering
// =============================================================================

/// Structural equality used by the diff engine and by Value::operator==.
///
/// Type-strict (a boolean never equals an integer, an integer never equals a
/// double), recursive over arrays (positional) and objects (same key set,
/// equal values, order ignored), and NaN-tolerant: two NaN numbers of the
/// same type are equal.
auto deep_equal(const Value& a, const Value& b) -> bool;

/// Equality used by query comparisons (`==` and `!=` in filters).
///
/// Integers, doubles and decimals compare numerically with each other; NaN
/// is unequal to everything; values of different kinds are unequal; arrays
/// and objects compare element-wise with these same rules.
auto query_equal(const Value& a, const Value& b) -> bool;

/// Ordering used by query comparisons and by the `sort` operation.
///
/// Defined for numbers (numerically, unordered when NaN is involved),
/// strings (code-point order), booleans (false < true) and arrays
/// (lexicographic). Any other pairing throws a type_error Error.
auto query_compare(const Value& a, const Value& b) -> std::partial_ordering;

/// Helper for std::visit with multiple lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// The name of a value's type, for error messages.
inline auto type_name(const Value& v) noexcept -> std::string_view {
    return to_string_view(v.type());
}

}  // namespace jsonmanip_cpp
