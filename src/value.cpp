#include <jsonmanip-cpp/value.hpp>

#include <jsonmanip-cpp/error.hpp>

#include <algorithm>
#include <cmath>
#include <compare>
#include <string>
#include <utility>
#include <vector>

namespace jsonmanip_cpp {

namespace {

[[noreturn]] void throw_type_mismatch(ValueType expected, const Value& actual) {
    throw Error{ErrorKind::type_error,
                "Expected " + std::string{to_string_view(expected)} + ", not " +
                    std::string{type_name(actual)}};
}

auto to_decimal(const Value& v) -> Decimal {
    if (v.is_int()) return Decimal::from_int(v.as_int());
    if (v.is_double()) return Decimal::from_double(v.as_double());
    return v.as_decimal();
}

auto numeric_compare(const Value& a, const Value& b) -> std::partial_ordering {
    if (a.is_int() && b.is_int()) return a.as_int() <=> b.as_int();
    if (a.is_decimal() || b.is_decimal()) return to_decimal(a).compare(to_decimal(b));
    if (a.is_double() && b.is_double()) return a.as_double() <=> b.as_double();
    // int vs double: long double holds every int64 exactly on the targets we build for
    const auto x = a.is_int() ? static_cast<long double>(a.as_int()) : static_cast<long double>(a.as_double());
    const auto y = b.is_int() ? static_cast<long double>(b.as_int()) : static_cast<long double>(b.as_double());
    return x <=> y;
}

auto nan_value(const Value& v) -> bool {
    if (v.is_double()) return std::isnan(v.as_double());
    if (v.is_decimal()) return v.as_decimal().is_nan();
    return false;
}

}  // anonymous namespace

// =============================================================================
// Value
// =============================================================================

Value::Value(Array a) : data_{std::make_unique<Array>(std::move(a))} {}

Value::Value(Object o) : data_{std::make_unique<Object>(std::move(o))} {}

Value::~Value() = default;

Value::Value(const Value& other)
    : data_{std::visit(overload{
          [](const std::unique_ptr<Array>& a) -> Storage { return std::make_unique<Array>(*a); },
          [](const std::unique_ptr<Object>& o) -> Storage { return std::make_unique<Object>(*o); },
          [](const auto& scalar) -> Storage { return scalar; },
      }, other.data_)} {}

Value::Value(Value&& other) noexcept : data_{std::move(other.data_)} {
    other.data_ = Null{};
}

auto Value::operator=(const Value& other) -> Value& {
    if (this != &other) {
        auto copy = Value{other};
        data_ = std::move(copy.data_);
    }
    return *this;
}

auto Value::operator=(Value&& other) noexcept -> Value& {
    if (this != &other) {
        // Keep the old subtree alive until the assignment is done: `other`
        // may live inside it.
        auto old = std::move(data_);
        data_ = std::move(other.data_);
        other.data_ = Null{};
    }
    return *this;
}

auto Value::type() const noexcept -> ValueType {
    return static_cast<ValueType>(data_.index());
}

auto Value::as_bool() const -> bool {
    if (!is_bool()) throw_type_mismatch(ValueType::boolean, *this);
    return std::get<bool>(data_);
}

auto Value::as_int() const -> std::int64_t {
    if (!is_int()) throw_type_mismatch(ValueType::integer, *this);
    return std::get<std::int64_t>(data_);
}

auto Value::as_double() const -> double {
    if (!is_double()) throw_type_mismatch(ValueType::number, *this);
    return std::get<double>(data_);
}

auto Value::as_decimal() const -> const Decimal& {
    if (!is_decimal()) throw_type_mismatch(ValueType::decimal, *this);
    return std::get<Decimal>(data_);
}

auto Value::as_string() const -> const std::string& {
    if (!is_string()) throw_type_mismatch(ValueType::string, *this);
    return std::get<std::string>(data_);
}

auto Value::as_array() -> Array& {
    if (!is_array()) throw_type_mismatch(ValueType::array, *this);
    return *std::get<std::unique_ptr<Array>>(data_);
}

auto Value::as_array() const -> const Array& {
    if (!is_array()) throw_type_mismatch(ValueType::array, *this);
    return *std::get<std::unique_ptr<Array>>(data_);
}

auto Value::as_object() -> Object& {
    if (!is_object()) throw_type_mismatch(ValueType::object, *this);
    return *std::get<std::unique_ptr<Object>>(data_);
}

auto Value::as_object() const -> const Object& {
    if (!is_object()) throw_type_mismatch(ValueType::object, *this);
    return *std::get<std::unique_ptr<Object>>(data_);
}

auto operator==(const Value& a, const Value& b) -> bool {
    return deep_equal(a, b);
}

// =============================================================================
// Object
// =============================================================================

Object::Object(std::initializer_list<value_type> entries) {
    entries_.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        insert_or_assign(key, value);
    }
}

auto Object::find(std::string_view key) -> iterator {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const value_type& e) { return e.first == key; });
}

auto Object::find(std::string_view key) const -> const_iterator {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const value_type& e) { return e.first == key; });
}

auto Object::at(std::string_view key) -> Value& {
    auto it = find(key);
    if (it == end()) throw Error{ErrorKind::key_error, "Key not found: '" + std::string{key} + "'"};
    return it->second;
}

auto Object::at(std::string_view key) const -> const Value& {
    auto it = find(key);
    if (it == end()) throw Error{ErrorKind::key_error, "Key not found: '" + std::string{key} + "'"};
    return it->second;
}

auto Object::operator[](std::string_view key) -> Value& {
    auto it = find(key);
    if (it != end()) return it->second;
    return entries_.emplace_back(std::string{key}, Value{}).second;
}

auto Object::insert_or_assign(std::string key, Value value) -> Value& {
    auto it = find(key);
    if (it != end()) {
        it->second = std::move(value);
        return it->second;
    }
    return entries_.emplace_back(std::move(key), std::move(value)).second;
}

auto Object::erase(std::string_view key) -> bool {
    auto it = find(key);
    if (it == end()) return false;
    entries_.erase(it);
    return true;
}

auto Object::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(entries_.size());
    for (const auto& [key, value] : entries_) result.push_back(key);
    return result;
}

auto operator==(const Object& a, const Object& b) -> bool {
    return deep_equal(Value{a}, Value{b});
}

// =============================================================================
// Equality and ordering
// =============================================================================

auto deep_equal(const Value& a, const Value& b) -> bool {
    auto pending = std::vector<std::pair<const Value*, const Value*>>{{&a, &b}};
    while (!pending.empty()) {
        auto [x, y] = pending.back();
        pending.pop_back();
        if (x->type() != y->type()) return false;

        switch (x->type()) {
            case ValueType::null:
                break;
            case ValueType::boolean:
                if (x->as_bool() != y->as_bool()) return false;
                break;
            case ValueType::integer:
                if (x->as_int() != y->as_int()) return false;
                break;
            case ValueType::number:
            case ValueType::decimal:
                // NaN equals NaN here, unlike everywhere else
                if (nan_value(*x) || nan_value(*y)) {
                    if (nan_value(*x) != nan_value(*y)) return false;
                } else if (numeric_compare(*x, *y) != std::partial_ordering::equivalent) {
                    return false;
                }
                break;
            case ValueType::string:
                if (x->as_string() != y->as_string()) return false;
                break;
            case ValueType::array: {
                const auto& xs = x->as_array();
                const auto& ys = y->as_array();
                if (xs.size() != ys.size()) return false;
                for (std::size_t i = 0; i < xs.size(); ++i) pending.emplace_back(&xs[i], &ys[i]);
                break;
            }
            case ValueType::object: {
                const auto& xo = x->as_object();
                const auto& yo = y->as_object();
                if (xo.size() != yo.size()) return false;
                for (const auto& [key, value] : xo) {
                    auto it = yo.find(key);
                    if (it == yo.end()) return false;
                    pending.emplace_back(&value, &it->second);
                }
                break;
            }
        }
    }
    return true;
}

auto query_equal(const Value& a, const Value& b) -> bool {
    auto pending = std::vector<std::pair<const Value*, const Value*>>{{&a, &b}};
    while (!pending.empty()) {
        auto [x, y] = pending.back();
        pending.pop_back();
        if (x->is_number() && y->is_number()) {
            if (numeric_compare(*x, *y) != std::partial_ordering::equivalent) return false;
            continue;
        }
        if (x->type() != y->type()) return false;

        switch (x->type()) {
            case ValueType::null:
                break;
            case ValueType::boolean:
                if (x->as_bool() != y->as_bool()) return false;
                break;
            case ValueType::string:
                if (x->as_string() != y->as_string()) return false;
                break;
            case ValueType::array: {
                const auto& xs = x->as_array();
                const auto& ys = y->as_array();
                if (xs.size() != ys.size()) return false;
                for (std::size_t i = 0; i < xs.size(); ++i) pending.emplace_back(&xs[i], &ys[i]);
                break;
            }
            case ValueType::object: {
                const auto& xo = x->as_object();
                const auto& yo = y->as_object();
                if (xo.size() != yo.size()) return false;
                for (const auto& [key, value] : xo) {
                    auto it = yo.find(key);
                    if (it == yo.end()) return false;
                    pending.emplace_back(&value, &it->second);
                }
                break;
            }
            default:
                break;
        }
    }
    return true;
}

auto query_compare(const Value& a, const Value& b) -> std::partial_ordering {
    const auto* x = &a;
    const auto* y = &b;
    while (true) {
        if (x->is_number() && y->is_number()) return numeric_compare(*x, *y);
        if (x->is_string() && y->is_string()) return x->as_string().compare(y->as_string()) <=> 0;
        if (x->is_bool() && y->is_bool()) return x->as_bool() <=> y->as_bool();
        if (!x->is_array() || !y->is_array()) {
            throw Error{ErrorKind::type_error,
                        "Ordering not supported between " + std::string{type_name(*x)} +
                            " and " + std::string{type_name(*y)}};
        }

        // Lexicographic: the first unequal pair decides, then the length
        const auto& xs = x->as_array();
        const auto& ys = y->as_array();
        auto i = std::size_t{0};
        while (i < xs.size() && i < ys.size() && query_equal(xs[i], ys[i])) ++i;
        if (i == xs.size() || i == ys.size()) return xs.size() <=> ys.size();
        x = &xs[i];
        y = &ys[i];
    }
}

}  // namespace jsonmanip_cpp
