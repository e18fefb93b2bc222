/// @file diff.hpp
/// @brief Patch generation: the operations that turn one tree into another.

#pragma once

#include <jsonmanip-cpp/value.hpp>

#include <string>
#include <string_view>

namespace jsonmanip_cpp {

/// Compute a patch that transforms `old_value` into `new_value`.
///
/// Objects are compared key by key: `del` for keys only in `old_value`
/// (in its order), recursion for shared keys, then `set` for keys only in
/// `new_value` (in its order). Arrays are aligned by their longest common
/// subsequence under deep_equal(); unmatched elements become `del` and
/// `insert` operations, an element replaced in place is diffed
/// recursively, and indices refer to the array as already patched. Any
/// other difference is a `set` of the new value.
///
/// Applying the result with apply_patch() to `old_value` yields a value
/// deep-equal to `new_value`, and equal inputs give an empty patch.
///
/// @code
/// auto patch = make_patch(Value{Array{1, 2, 3, 5}}, Value{Array{1, 3, 4, 5}});
/// // [{"op": "del", "path": "$[1]"},
/// //  {"op": "insert", "path": "$[2]", "value": 4}]
/// @endcode
///
/// Time and memory are O(n * m) for each pair of aligned arrays.
auto make_patch(const Value& old_value, const Value& new_value) -> Array;

/// The query segment for an object key: `.key` for an ASCII identifier,
/// `['key']` (with `'` and `~` escaped by `~`) otherwise.
auto encode_query_key(std::string_view key) -> std::string;

}  // namespace jsonmanip_cpp
