/// @file node.hpp
/// @brief Node references: addressable locations inside a value tree.

#pragma once

#include <jsonmanip-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonmanip_cpp {

/// Sentinel index written `start` in a query: the most negative index.
inline constexpr auto start_index = std::numeric_limits<std::int64_t>::min();

/// Sentinel index written `end` in a query: the most positive index.
inline constexpr auto end_index = std::numeric_limits<std::int64_t>::max();

/// The resolved bounds of a Slice against a sequence of a given length.
struct SliceIndices {
    std::int64_t start;
    std::int64_t stop;
    std::int64_t step;
    std::size_t length;  ///< Number of selected elements.

    /// Position in the sequence of the `i`-th selected element.
    constexpr auto at(std::size_t i) const noexcept -> std::size_t {
        return static_cast<std::size_t>(start + static_cast<std::int64_t>(i) * step);
    }
};

/// A `start:stop:step` range over a sequence. Missing bounds take the
/// usual defaults; negative bounds count from the end.
struct Slice {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;
    std::optional<std::int64_t> step;

    /// Clamp the bounds to a sequence of `length` elements.
    /// @throws Error (value_error) if the step is zero.
    auto indices(std::size_t length) const -> SliceIndices;

    auto operator==(const Slice&) const -> bool = default;
};

/// The key half of a node reference.
using Key = std::variant<std::int64_t, Slice, std::string>;

/// The container half of a node reference. Never owning.
using Target = std::variant<Array*, Object*>;

/// A location in a value tree: a container and a key into it.
///
/// A Node does not own its target. It stays valid as long as the container
/// is alive and is not moved out of its owning Value.
struct Node {
    Target target;
    Key key;

    auto operator==(const Node&) const -> bool = default;
};

using NodeList = std::vector<Node>;

/// The name of a key's type, for error messages.
auto key_type_name(const Key& key) noexcept -> std::string_view;

/// View a container value as a Target.
/// @throws Error (type_error) if `value` is not an array or an object.
auto as_target(Value& value) -> Target;

/// Check that the key kind fits the target kind: string keys for objects,
/// integer keys (or slices when `allow_slice`) for arrays.
/// @throws Error (type_error) on mismatch.
void check_key(const Node& node, bool allow_slice);

/// Whether the key exists: a present object key or an in-range array index.
auto has_key(const Node& node) -> bool;

/// The value a non-slice node addresses.
/// @throws Error (index_error/key_error) if it does not exist.
auto at(const Node& node) -> Value&;

/// A copy of the addressed value; a slice node reads a new array.
auto read(const Node& node) -> Value;

/// Store `value` at the node, adding a missing object key. A slice node
/// replaces the selected elements with the elements of an array value.
void write(const Node& node, Value value);

/// Remove the addressed value (or all elements selected by a slice).
void remove(const Node& node);

/// Remove the addressed value and return it.
auto take(const Node& node) -> Value;

/// Insert `value` before the node's index. Out-of-range indices are
/// clamped to the sequence bounds.
/// @throws Error (type_error) unless the target is an array and the key an integer.
void insert(const Node& node, Value value);

/// The containers a node addresses: one for a plain key, one per selected
/// element for a slice.
/// @throws Error (type_error) if any of them is not an array or an object.
auto get_targets(const Node& node, bool allow_slice) -> std::vector<Target>;

/// One node per child of the target, in iteration order.
auto children(const Target& target) -> NodeList;

}  // namespace jsonmanip_cpp
