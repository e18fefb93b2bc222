#include <jsonmanip-cpp/manipulator.hpp>

#include <jsonmanip-cpp/error.hpp>

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonmanip_cpp {

namespace {

constexpr auto select_slice_query = QueryOptions{.allow_slice = true};
constexpr auto source_query = QueryOptions{.allow_slice = true, .relative = true};

// =============================================================================
// Operation fields
// =============================================================================

auto required_field(const Object& operation, std::string_view name) -> const Value& {
    auto it = operation.find(name);
    if (it == operation.end()) {
        throw Error{ErrorKind::key_error, "Operation is missing '" + std::string{name} + "'"};
    }
    return it->second;
}

auto string_value(const Value& value, std::string_view name) -> const std::string& {
    if (!value.is_string()) {
        throw Error{ErrorKind::type_error,
                    "'" + std::string{name} + "' must be string, not " + std::string{type_name(value)}};
    }
    return value.as_string();
}

auto required_string(const Object& operation, std::string_view name) -> std::string {
    return string_value(required_field(operation, name), name);
}

auto optional_string(const Object& operation, std::string_view name, std::string_view fallback)
    -> std::string {
    auto it = operation.find(name);
    if (it == operation.end()) return std::string{fallback};
    return string_value(it->second, name);
}

auto optional_bool(const Object& operation, std::string_view name, bool fallback) -> bool {
    auto it = operation.find(name);
    if (it == operation.end()) return fallback;
    if (!it->second.is_bool()) {
        throw Error{ErrorKind::type_error,
                    "'" + std::string{name} + "' must be boolean, not " + std::string{type_name(it->second)}};
    }
    return it->second.as_bool();
}

auto as_operation(const Value& value) -> const Object& {
    if (!value.is_object()) {
        throw Error{ErrorKind::type_error,
                    "Operation must be object, not " + std::string{type_name(value)}};
    }
    return value.as_object();
}

auto is_root(const Node& node, const Array& root) -> bool {
    const auto* array = std::get_if<Array*>(&node.target);
    return array != nullptr && *array == &root;
}

// =============================================================================
// Container mutations
// =============================================================================

void clear_container(Value& value) {
    std::visit(overload{
        [](Array* array) { array->clear(); },
        [](Object* object) { object->clear(); },
    }, as_target(value));
}

void extend_array(Array& array, const Value& values) {
    for (const auto& value : values.as_array()) array.push_back(value);
}

void update_object(Object& object, const Value& properties) {
    for (const auto& [key, value] : properties.as_object()) object.insert_or_assign(key, value);
}

// Stable sort by query ordering. The array is only touched once every
// comparison has succeeded; unordered pairs such as NaN are rejected.
void sort_array(Array& array, bool reverse) {
    auto order = std::vector<std::size_t>(array.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    auto less = [&](std::size_t a, std::size_t b) {
        const auto ordering = reverse ? query_compare(array[b], array[a])
                                      : query_compare(array[a], array[b]);
        if (ordering == std::partial_ordering::unordered) {
            throw Error{ErrorKind::type_error, "Can not sort unordered values"};
        }
        return ordering < 0;
    };
    std::stable_sort(order.begin(), order.end(), less);

    auto sorted = Array{};
    sorted.reserve(array.size());
    for (auto i : order) sorted.push_back(std::move(array[i]));
    array = std::move(sorted);
}

// =============================================================================
// Pasting
// =============================================================================

/// Where and how copy/move pastes its values.
struct Destination {
    std::string mode;
    Query to;
    bool absolute;
};

// Validate `mode` and compile `to` before anything is read or removed.
auto compile_destination(const Object& fields, bool has_root, const ManipulatorOptions& options)
    -> Destination {
    auto mode = optional_string(fields, "mode", "set");
    if (mode != "append" && mode != "extend" && mode != "insert" && mode != "set" &&
        mode != "update") {
        throw Error{ErrorKind::value_error, "Unknown mode: " + mode};
    }

    const auto to = mode == "insert" ? required_string(fields, "to") : optional_string(fields, "to", "@");
    const auto absolute = has_root && to.starts_with("$");
    auto query = compile_query(to, QueryOptions{
        .allow_slice = mode == "set", .mapping = true, .relative = !absolute}, options);
    return Destination{std::move(mode), std::move(query), absolute};
}

void paste(const NodeList& current_nodes, Array values, const Destination& destination,
           Array* root) {
    auto dst_nodes = NodeList{};
    if (destination.absolute) {
        // One destination, shared by every current node
        const auto matches = destination.to.evaluate(Node{root, std::int64_t{0}});
        if (!matches.empty()) dst_nodes.assign(current_nodes.size(), matches.front());
    } else {
        dst_nodes = destination.to.evaluate(current_nodes);
    }

    const auto& mode = destination.mode;
    const auto count = std::min(dst_nodes.size(), values.size());
    if (mode == "append") {
        for (std::size_t i = 0; i < count; ++i) at(dst_nodes[i]).as_array().push_back(std::move(values[i]));
    } else if (mode == "extend") {
        for (std::size_t i = 0; i < count; ++i) extend_array(at(dst_nodes[i]).as_array(), values[i]);
    } else if (mode == "insert") {
        for (std::size_t i = 0; i < count; ++i) {
            if (dst_nodes[i].target == current_nodes[i].target) {
                throw Error{ErrorKind::value_error, "Can not insert at the current object"};
            }
            if (root != nullptr && is_root(dst_nodes[i], *root)) {
                throw Error{ErrorKind::value_error, "Can not insert at the root"};
            }
        }
        for (auto i = count; i-- > 0;) insert(dst_nodes[i], std::move(values[i]));
    } else if (mode == "set") {
        for (std::size_t i = 0; i < count; ++i) write(dst_nodes[i], std::move(values[i]));
    } else {
        for (std::size_t i = 0; i < count; ++i) update_object(at(dst_nodes[i]).as_object(), values[i]);
    }
}

}  // anonymous namespace

// =============================================================================
// Compilation and selection
// =============================================================================

auto Manipulator::compile_query(std::string_view query, QueryOptions options) const -> Query {
    return jsonmanip_cpp::compile_query(query, options, options_);
}

auto Manipulator::compile_filter(std::string_view filter) const -> Filter {
    return jsonmanip_cpp::compile_filter(filter, options_);
}

auto Manipulator::select_nodes(const NodeList& nodes, std::string_view query,
                               QueryOptions options) const -> NodeList {
    return compile_query(query, options).evaluate(nodes);
}

auto Manipulator::select_nodes(const Node& node, std::string_view query,
                               QueryOptions options) const -> NodeList {
    return select_nodes(NodeList{node}, query, options);
}

auto Manipulator::apply_filter(const NodeList& nodes, std::string_view filter) const -> NodeList {
    return compile_filter(filter).apply(nodes);
}

auto Manipulator::apply_filter(const Node& node, std::string_view filter) const -> NodeList {
    return apply_filter(NodeList{node}, filter);
}

auto Manipulator::load_query_value(std::string_view text) const -> Value {
    return parse_query_value(text, options_);
}

// =============================================================================
// Patching
// =============================================================================

auto Manipulator::apply_patch(Value obj, const Value& patch) const -> Value {
    apply_patch_in_place(obj, patch);
    return obj;
}

void Manipulator::apply_patch_in_place(Value& obj, const Value& patch) const {
    // The root holder lets `$` address the whole document. The guard hands
    // the document back on every exit so partial effects stay visible.
    struct RootHolder {
        Value& obj;
        Array root;

        explicit RootHolder(Value& o) : obj{o} { root.push_back(std::move(o)); }
        ~RootHolder() { obj = std::move(root.front()); }
        RootHolder(const RootHolder&) = delete;
        auto operator=(const RootHolder&) -> RootHolder& = delete;
    };

    if (!patch.is_object() && !patch.is_array()) {
        throw Error{ErrorKind::type_error,
                    "Patch must be array or object, not " + std::string{type_name(patch)}};
    }

    auto holder = RootHolder{obj};
    if (patch.is_object()) {
        apply_operation(holder.root, patch.as_object());
        return;
    }
    for (const auto& operation : patch.as_array()) {
        apply_operation(holder.root, as_operation(operation));
    }
}

void Manipulator::apply_operation(Array& root, const Object& operation) const {
    const auto node = Node{&root, std::int64_t{0}};
    const auto op = required_string(operation, "op");

    if (op == "append") {
        const auto& value = required_field(operation, "value");
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"))) {
            at(target).as_array().push_back(value);
        }
    } else if (op == "assert") {
        const auto path = optional_string(operation, "path", "$");
        const auto expr = required_string(operation, "expr");
        const auto msg = optional_string(operation, "msg", "Path " + path + ": " + expr);
        const auto current_nodes = select_nodes(node, path);
        if (apply_filter(current_nodes, expr).size() != current_nodes.size()) {
            throw Error{ErrorKind::assertion_error, msg};
        }
    } else if (op == "clear") {
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"))) {
            clear_container(at(target));
        }
    } else if (op == "copy") {
        const auto current_nodes = select_nodes(node, optional_string(operation, "path", "$"));
        const auto destination = compile_destination(operation, true, options_);
        auto values = Array{};
        for (const auto& source : select_nodes(current_nodes, required_string(operation, "from"), source_query)) {
            values.push_back(read(source));
        }
        paste(current_nodes, std::move(values), destination, &root);
    } else if (op == "del") {
        auto targets = select_nodes(node, required_string(operation, "path"), select_slice_query);
        // Last match first, so earlier indices stay valid
        for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
            if (is_root(*it, root)) throw Error{ErrorKind::value_error, "Can not delete the root"};
            remove(*it);
        }
    } else if (op == "extend") {
        const auto& values = required_field(operation, "values");
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"))) {
            extend_array(at(target).as_array(), values);
        }
    } else if (op == "insert") {
        auto targets = select_nodes(node, required_string(operation, "path"));
        const auto& value = required_field(operation, "value");
        for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
            if (is_root(*it, root)) throw Error{ErrorKind::value_error, "Can not insert at the root"};
            insert(*it, value);
        }
    } else if (op == "move") {
        const auto current_nodes = select_nodes(node, optional_string(operation, "path", "$"));
        const auto destination = compile_destination(operation, true, options_);
        const auto sources = select_nodes(current_nodes, required_string(operation, "from"), source_query);
        const auto count = std::min(current_nodes.size(), sources.size());
        for (std::size_t i = 0; i < count; ++i) {
            if (sources[i].target == current_nodes[i].target) {
                throw Error{ErrorKind::value_error, "Can not move the current object"};
            }
        }

        auto values = Array{};
        values.reserve(count);
        for (auto i = count; i-- > 0;) values.push_back(take(sources[i]));
        std::reverse(values.begin(), values.end());
        paste(current_nodes, std::move(values), destination, &root);
    } else if (op == "reverse") {
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"))) {
            auto& array = at(target).as_array();
            std::reverse(array.begin(), array.end());
        }
    } else if (op == "set") {
        const auto& value = required_field(operation, "value");
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"), select_slice_query)) {
            write(target, value);
        }
    } else if (op == "sort") {
        const auto reverse = optional_bool(operation, "reverse", false);
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"))) {
            sort_array(at(target).as_array(), reverse);
        }
    } else if (op == "update") {
        const auto& properties = required_field(operation, "properties");
        for (const auto& target : select_nodes(node, optional_string(operation, "path", "$"))) {
            update_object(at(target).as_object(), properties);
        }
    } else {
        throw Error{ErrorKind::value_error, "Unknown operation: " + op};
    }
}

void Manipulator::paste_values(const NodeList& current_nodes, Array values,
                               const Value& operation, Array* root) const {
    const auto destination = compile_destination(as_operation(operation), root != nullptr, options_);
    paste(current_nodes, std::move(values), destination, root);
}

void Manipulator::paste_values(const Node& current_node, Value value, const Value& operation) const {
    auto values = Array{};
    values.push_back(std::move(value));
    paste_values(NodeList{current_node}, std::move(values), operation);
}

// =============================================================================
// Free functions
// =============================================================================

auto select_nodes(const NodeList& nodes, std::string_view query, QueryOptions options) -> NodeList {
    return Manipulator{}.select_nodes(nodes, query, options);
}

auto select_nodes(const Node& node, std::string_view query, QueryOptions options) -> NodeList {
    return Manipulator{}.select_nodes(node, query, options);
}

auto apply_filter(const NodeList& nodes, std::string_view filter) -> NodeList {
    return Manipulator{}.apply_filter(nodes, filter);
}

auto apply_filter(const Node& node, std::string_view filter) -> NodeList {
    return Manipulator{}.apply_filter(node, filter);
}

auto load_query_value(std::string_view text) -> Value {
    return Manipulator{}.load_query_value(text);
}

auto apply_patch(Value obj, const Value& patch) -> Value {
    return Manipulator{}.apply_patch(std::move(obj), patch);
}

void paste_values(const NodeList& current_nodes, Array values, const Value& operation, Array* root) {
    Manipulator{}.paste_values(current_nodes, std::move(values), operation, root);
}

}  // namespace jsonmanip_cpp
