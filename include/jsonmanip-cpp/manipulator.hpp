/// @file manipulator.hpp
/// @brief The Manipulator: query selection, filtering and patch application.

#pragma once

#include <jsonmanip-cpp/node.hpp>
#include <jsonmanip-cpp/query.hpp>
#include <jsonmanip-cpp/value.hpp>

#include <string_view>

namespace jsonmanip_cpp {

/// Selects, filters and patches value trees.
///
/// A Manipulator only holds its options, so one instance can serve any
/// number of threads as long as each works on its own tree. A tree must
/// not be patched from two threads at once.
///
/// A patch is an operation object or an array of them. Operations are
/// applied in order and are not rolled back: when one fails, the ones
/// before it stay applied.
///
/// @code
/// auto manipulator = Manipulator{};
/// auto patched = manipulator.apply_patch(
///     Value{Array{1, 0, 2, 0, 3}},
///     Value{Object{{"op", "del"}, {"path", "$[@ == 0]"}}});
/// // patched == [1, 2, 3]
/// @endcode
class Manipulator {
public:
    Manipulator() = default;
    explicit Manipulator(ManipulatorOptions options) : options_{options} {}

    auto options() const noexcept -> const ManipulatorOptions& { return options_; }

    // -- Compilation ---------------------------------------------------------

    /// Compile a query with this manipulator's literal settings.
    auto compile_query(std::string_view query, QueryOptions options = {}) const -> Query;

    /// Compile a filter with this manipulator's literal settings.
    auto compile_filter(std::string_view filter) const -> Filter;

    // -- Selection -----------------------------------------------------------

    /// Select the nodes `query` addresses, starting from `nodes`.
    /// @throws SyntaxError if the query is malformed.
    /// @throws Error on a failed lookup, or when an absolute query without
    ///   optional marker matches nothing.
    auto select_nodes(const NodeList& nodes, std::string_view query,
                      QueryOptions options = {}) const -> NodeList;
    auto select_nodes(const Node& node, std::string_view query,
                      QueryOptions options = {}) const -> NodeList;

    /// Keep the nodes that satisfy `filter`.
    auto apply_filter(const NodeList& nodes, std::string_view filter) const -> NodeList;
    auto apply_filter(const Node& node, std::string_view filter) const -> NodeList;

    /// Parse a query literal.
    auto load_query_value(std::string_view text) const -> Value;

    // -- Patching ------------------------------------------------------------

    /// Apply `patch` to a copy of `obj` and return the result.
    auto apply_patch(Value obj, const Value& patch) const -> Value;

    /// Apply `patch` to `obj` in place. On failure `obj` keeps the effect of
    /// the operations applied before the failing one.
    /// @throws Error (assertion_error) if an `assert` operation fails.
    /// @throws Error (value_error) on an unknown operation or mode, or an
    ///   attempt to delete, insert at or move the root.
    void apply_patch_in_place(Value& obj, const Value& patch) const;

    /// Paste one value per node, as a `copy` or `move` operation does.
    ///
    /// `operation` supplies `mode` (append, extend, insert, set or update;
    /// default set) and `to` (default `@`, required for insert). `to` is a
    /// relative query evaluated from each node, or, when `root` is given, may
    /// be an absolute query evaluated once from the root holder.
    void paste_values(const NodeList& current_nodes, Array values, const Value& operation,
                      Array* root = nullptr) const;
    void paste_values(const Node& current_node, Value value, const Value& operation) const;

private:
    void apply_operation(Array& root, const Object& operation) const;

    ManipulatorOptions options_;
};

// =============================================================================
// Free functions (default options)
// =============================================================================

auto select_nodes(const NodeList& nodes, std::string_view query, QueryOptions options = {})
    -> NodeList;
auto select_nodes(const Node& node, std::string_view query, QueryOptions options = {})
    -> NodeList;
auto apply_filter(const NodeList& nodes, std::string_view filter) -> NodeList;
auto apply_filter(const Node& node, std::string_view filter) -> NodeList;
auto load_query_value(std::string_view text) -> Value;
auto apply_patch(Value obj, const Value& patch) -> Value;
void paste_values(const NodeList& current_nodes, Array values, const Value& operation,
                  Array* root = nullptr);

}  // namespace jsonmanip_cpp
