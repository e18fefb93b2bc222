#include <jsonmanip-cpp/json.hpp>

#include <jsonmanip-cpp/decimal.hpp>
#include <jsonmanip-cpp/error.hpp>
#include <jsonmanip-cpp/node.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmanip_cpp {

namespace {

using json = nlohmann::ordered_json;

/// SAX handler that builds a Value while nlohmann parses.
///
/// Open containers are tracked by their boxed Array/Object, which keeps its
/// address while the parent grows.
class ValueBuilder {
public:
    ValueBuilder(std::string_view text, std::string_view filename, bool use_decimal)
        : text_{text}, filename_{filename}, use_decimal_{use_decimal} {}

    auto result() -> Value& { return root_; }

    auto null() -> bool { return add(Value{}); }
    auto boolean(bool val) -> bool { return add(Value{val}); }
    auto number_integer(json::number_integer_t val) -> bool { return add(Value{val}); }

    auto number_unsigned(json::number_unsigned_t val) -> bool {
        if (val <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return add(Value{static_cast<std::int64_t>(val)});
        }
        if (use_decimal_) return add(Value{*Decimal::parse(std::to_string(val))});
        return add(Value{static_cast<double>(val)});
    }

    auto number_float(json::number_float_t val, const json::string_t& s) -> bool {
        if (!use_decimal_) return add(Value{val});
        auto decimal = Decimal::parse(s);
        if (!decimal) throw Error{ErrorKind::value_error, "Number out of range: " + s};
        return add(Value{std::move(*decimal)});
    }

    auto string(json::string_t& val) -> bool { return add(Value{std::move(val)}); }

    auto binary(json::binary_t&) -> bool {
        throw Error{ErrorKind::type_error, "Binary values are not supported"};
    }

    auto start_object(std::size_t) -> bool {
        auto& value = insert(Value{Object{}});
        open_.push_back(&value.as_object());
        return true;
    }

    auto key(json::string_t& val) -> bool {
        key_ = std::move(val);
        return true;
    }

    auto end_object() -> bool {
        open_.pop_back();
        return true;
    }

    auto start_array(std::size_t) -> bool {
        auto& value = insert(Value{Array{}});
        open_.push_back(&value.as_array());
        return true;
    }

    auto end_array() -> bool {
        open_.pop_back();
        return true;
    }

    auto parse_error(std::size_t position, const std::string&,
                     const nlohmann::detail::exception& ex) -> bool {
        // Keep only the description after "parse error at line L, column C: "
        auto msg = std::string{ex.what()};
        auto pos = msg.find("column");
        pos = pos == std::string::npos ? pos : msg.find(": ", pos);
        if (pos != std::string::npos) msg = msg.substr(pos + 2);
        throw SyntaxError{msg, std::string{filename_}, std::string{text_},
                          position > 0 ? position - 1 : 0};
    }

private:
    auto add(Value value) -> bool {
        insert(std::move(value));
        return true;
    }

    auto insert(Value value) -> Value& {
        if (open_.empty()) {
            root_ = std::move(value);
            return root_;
        }
        return std::visit(overload{
            [&](Array* array) -> Value& { return array->emplace_back(std::move(value)); },
            [&](Object* object) -> Value& { return object->insert_or_assign(key_, std::move(value)); },
        }, open_.back());
    }

    std::string_view text_;
    std::string_view filename_;
    bool use_decimal_;
    Value root_;
    std::vector<Target> open_;
    std::string key_;
};

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::ordered_json& j, const Value& value) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const Decimal& d) { j = d.to_double(); },
        [&](const std::string& s) { j = s; },
        [&](const std::unique_ptr<Array>& array) {
            j = nlohmann::ordered_json::array();
            for (const auto& item : *array) j.push_back(json(item));
        },
        [&](const std::unique_ptr<Object>& object) {
            j = nlohmann::ordered_json::object();
            for (const auto& [key, item] : *object) j[key] = json(item);
        },
    }, value.storage());
}

void from_json(const nlohmann::ordered_json& j, Value& value) {
    switch (j.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            value = Value{};
            return;
        case json::value_t::boolean:
            value = j.get<bool>();
            return;
        case json::value_t::number_integer:
            value = j.get<std::int64_t>();
            return;
        case json::value_t::number_unsigned: {
            const auto u = j.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                value = static_cast<std::int64_t>(u);
            } else {
                value = static_cast<double>(u);
            }
            return;
        }
        case json::value_t::number_float:
            value = j.get<double>();
            return;
        case json::value_t::string:
            value = j.get<std::string>();
            return;
        case json::value_t::array: {
            auto array = Array{};
            array.reserve(j.size());
            for (const auto& item : j) array.push_back(item.get<Value>());
            value = std::move(array);
            return;
        }
        case json::value_t::object: {
            auto object = Object{};
            for (const auto& [key, item] : j.items()) object.insert_or_assign(key, item.get<Value>());
            value = std::move(object);
            return;
        }
        case json::value_t::binary:
            break;
    }
    throw Error{ErrorKind::type_error, "Binary values are not supported"};
}

// =============================================================================
// Text
// =============================================================================

auto parse_json(std::string_view text, std::string_view filename, bool use_decimal) -> Value {
    auto builder = ValueBuilder{text, filename, use_decimal};
    if (!json::sax_parse(text.begin(), text.end(), &builder)) {
        throw SyntaxError{"Invalid JSON", std::string{filename}, std::string{text}, 0};
    }
    return std::move(builder.result());
}

auto dump_json(const Value& value, int indent) -> std::string {
    return json(value).dump(indent);
}

auto operator<<(std::ostream& os, const Value& value) -> std::ostream& {
    return os << dump_json(value);
}

}  // namespace jsonmanip_cpp
