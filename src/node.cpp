#include <jsonmanip-cpp/node.hpp>

#include <jsonmanip-cpp/error.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace jsonmanip_cpp {

namespace {

auto clamp_bound(std::int64_t bound, std::int64_t length, bool descending) -> std::int64_t {
    if (bound < 0) {
        bound += length;
        if (bound < 0) bound = descending ? -1 : 0;
    } else if (bound >= length) {
        bound = descending ? length - 1 : length;
    }
    return bound;
}

// Position of an integer key in `array`, counting negative keys from the end.
auto normalize_index(const Array& array, std::int64_t index) -> std::size_t {
    const auto length = static_cast<std::int64_t>(array.size());
    if (index < 0) index += length;
    if (index < 0 || index >= length) {
        throw Error{ErrorKind::index_error, "Array index out of range"};
    }
    return static_cast<std::size_t>(index);
}

[[noreturn]] void throw_missing_key(const std::string& key) {
    throw Error{ErrorKind::key_error, "Key not found: '" + key + "'"};
}

auto slice_of(const Array& array, const Slice& slice) -> Array {
    const auto range = slice.indices(array.size());
    auto result = Array{};
    result.reserve(range.length);
    for (std::size_t i = 0; i < range.length; ++i) result.push_back(array[range.at(i)]);
    return result;
}

void assign_slice(Array& array, const Slice& slice, Value value) {
    if (!value.is_array()) {
        throw Error{ErrorKind::type_error,
                    "Can only assign an array to a slice, not " + std::string{type_name(value)}};
    }
    auto items = std::move(value.as_array());
    const auto range = slice.indices(array.size());

    if (range.step == 1) {
        const auto first = static_cast<std::size_t>(range.start);
        const auto last = first + range.length;
        array.erase(array.begin() + static_cast<std::ptrdiff_t>(first),
                    array.begin() + static_cast<std::ptrdiff_t>(last));
        array.insert(array.begin() + static_cast<std::ptrdiff_t>(first),
                     std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
        return;
    }

    if (items.size() != range.length) {
        throw Error{ErrorKind::value_error,
                    "Attempt to assign array of size " + std::to_string(items.size()) +
                        " to extended slice of size " + std::to_string(range.length)};
    }
    for (std::size_t i = 0; i < range.length; ++i) array[range.at(i)] = std::move(items[i]);
}

void erase_slice(Array& array, const Slice& slice) {
    const auto range = slice.indices(array.size());
    auto positions = std::vector<std::size_t>{};
    positions.reserve(range.length);
    for (std::size_t i = 0; i < range.length; ++i) positions.push_back(range.at(i));
    // Highest position first so the remaining positions stay valid
    std::sort(positions.begin(), positions.end(), std::greater<>{});
    for (auto pos : positions) array.erase(array.begin() + static_cast<std::ptrdiff_t>(pos));
}

}  // anonymous namespace

// =============================================================================
// Slice
// =============================================================================

auto Slice::indices(std::size_t length) const -> SliceIndices {
    auto result = SliceIndices{};
    result.step = step.value_or(1);
    if (result.step == 0) {
        throw Error{ErrorKind::value_error, "Slice step cannot be zero"};
    }
    // Keep the step negatable
    if (result.step < -end_index) result.step = -end_index;

    const auto descending = result.step < 0;
    const auto size = static_cast<std::int64_t>(length);
    result.start = start ? clamp_bound(*start, size, descending) : (descending ? size - 1 : 0);
    result.stop = stop ? clamp_bound(*stop, size, descending) : (descending ? -1 : size);

    if (descending) {
        result.length = result.stop < result.start
            ? static_cast<std::size_t>((result.start - result.stop - 1) / -result.step + 1)
            : 0;
    } else {
        result.length = result.start < result.stop
            ? static_cast<std::size_t>((result.stop - result.start - 1) / result.step + 1)
            : 0;
    }
    return result;
}

// =============================================================================
// Node operations
// =============================================================================

auto key_type_name(const Key& key) noexcept -> std::string_view {
    return std::visit(overload{
        [](std::int64_t) -> std::string_view { return "integer"; },
        [](const Slice&) -> std::string_view { return "slice"; },
        [](const std::string&) -> std::string_view { return "string"; },
    }, key);
}

auto as_target(Value& value) -> Target {
    if (value.is_array()) return &value.as_array();
    if (value.is_object()) return &value.as_object();
    throw Error{ErrorKind::type_error,
                "Target must be array or object, not " + std::string{type_name(value)}};
}

void check_key(const Node& node, bool allow_slice) {
    if (std::holds_alternative<Object*>(node.target)) {
        if (!std::holds_alternative<std::string>(node.key)) {
            throw Error{ErrorKind::type_error,
                        "Object key must be string, not " + std::string{key_type_name(node.key)}};
        }
    } else if (allow_slice) {
        if (std::holds_alternative<std::string>(node.key)) {
            throw Error{ErrorKind::type_error,
                        "Array index must be integer or slice, not string"};
        }
    } else if (!std::holds_alternative<std::int64_t>(node.key)) {
        throw Error{ErrorKind::type_error,
                    "Array index must be integer, not " + std::string{key_type_name(node.key)}};
    }
}

auto has_key(const Node& node) -> bool {
    check_key(node, false);
    if (auto* object = std::get_if<Object*>(&node.target)) {
        return (*object)->contains(std::get<std::string>(node.key));
    }
    const auto length = static_cast<std::int64_t>(std::get<Array*>(node.target)->size());
    const auto index = std::get<std::int64_t>(node.key);
    return -length <= index && index < length;
}

auto at(const Node& node) -> Value& {
    check_key(node, false);
    if (auto* object = std::get_if<Object*>(&node.target)) {
        const auto& key = std::get<std::string>(node.key);
        auto it = (*object)->find(key);
        if (it == (*object)->end()) throw_missing_key(key);
        return it->second;
    }
    auto& array = *std::get<Array*>(node.target);
    return array[normalize_index(array, std::get<std::int64_t>(node.key))];
}

auto read(const Node& node) -> Value {
    check_key(node, true);
    if (const auto* slice = std::get_if<Slice>(&node.key)) {
        return slice_of(*std::get<Array*>(node.target), *slice);
    }
    return at(node);
}

void write(const Node& node, Value value) {
    check_key(node, true);
    std::visit(overload{
        [&](Object* object) {
            object->insert_or_assign(std::get<std::string>(node.key), std::move(value));
        },
        [&](Array* array) {
            if (const auto* slice = std::get_if<Slice>(&node.key)) {
                assign_slice(*array, *slice, std::move(value));
            } else {
                (*array)[normalize_index(*array, std::get<std::int64_t>(node.key))] = std::move(value);
            }
        },
    }, node.target);
}

void remove(const Node& node) {
    check_key(node, true);
    std::visit(overload{
        [&](Object* object) {
            const auto& key = std::get<std::string>(node.key);
            if (!object->erase(key)) throw_missing_key(key);
        },
        [&](Array* array) {
            if (const auto* slice = std::get_if<Slice>(&node.key)) {
                erase_slice(*array, *slice);
            } else {
                const auto pos = normalize_index(*array, std::get<std::int64_t>(node.key));
                array->erase(array->begin() + static_cast<std::ptrdiff_t>(pos));
            }
        },
    }, node.target);
}

auto take(const Node& node) -> Value {
    check_key(node, true);
    auto value = std::holds_alternative<Slice>(node.key) ? read(node) : std::move(at(node));
    remove(node);
    return value;
}

void insert(const Node& node, Value value) {
    auto* array = std::get_if<Array*>(&node.target);
    if (array == nullptr) {
        throw Error{ErrorKind::type_error, "Can only insert into an array, not object"};
    }
    check_key(node, false);

    const auto length = static_cast<std::int64_t>((*array)->size());
    auto index = std::get<std::int64_t>(node.key);
    if (index < 0) index = std::max<std::int64_t>(index + length, 0);
    index = std::min(index, length);
    (*array)->insert((*array)->begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
}

auto get_targets(const Node& node, bool allow_slice) -> std::vector<Target> {
    check_key(node, allow_slice);
    auto targets = std::vector<Target>{};
    if (const auto* slice = std::get_if<Slice>(&node.key)) {
        auto& array = *std::get<Array*>(node.target);
        const auto range = slice->indices(array.size());
        targets.reserve(range.length);
        for (std::size_t i = 0; i < range.length; ++i) targets.push_back(as_target(array[range.at(i)]));
    } else {
        targets.push_back(as_target(at(node)));
    }
    return targets;
}

auto children(const Target& target) -> NodeList {
    auto nodes = NodeList{};
    std::visit(overload{
        [&](Object* object) {
            nodes.reserve(object->size());
            for (const auto& [key, value] : *object) nodes.push_back(Node{object, key});
        },
        [&](Array* array) {
            nodes.reserve(array->size());
            for (std::size_t i = 0; i < array->size(); ++i) {
                nodes.push_back(Node{array, static_cast<std::int64_t>(i)});
            }
        },
    }, target);
    return nodes;
}

}  // namespace jsonmanip_cpp
