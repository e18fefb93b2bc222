/// @file query.hpp
/// @brief Compiled path queries and filters, and the query literal parser.
///
/// Query grammar:
/// @code
/// query      := anchor segment*
/// anchor     := '$' | '@'
/// segment    := '?' | '.' property | '[' bracket ']'
/// bracket    := index | slice | quoted-string | filter
/// index      := '-'? digits | 'start' | 'end'
/// slice      := index? ':' index? (':' index?)?
/// filter     := '!'? relative-query (op (value | relative-query))? ('&&' filter)?
/// op         := '<' | '<=' | '==' | '!=' | '>=' | '>'
/// value      := 'null' | 'true' | 'false' | number | 'NaN' | 'Infinity'
///             | '-Infinity' | quoted-string
/// @endcode

#pragma once

#include <jsonmanip-cpp/node.hpp>
#include <jsonmanip-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonmanip_cpp {

/// Settings shared by every query, filter and literal a Manipulator parses.
struct ManipulatorOptions {
    bool allow_nan_and_infinity{false};  ///< Accept `NaN`, `Infinity` and `-Infinity` literals.
    bool use_decimal{false};             ///< Parse fractional literals as Decimal, not double.
};

/// How a query is compiled and evaluated.
struct QueryOptions {
    bool allow_slice{false};  ///< The final keys may be slices.
    bool mapping{false};      ///< Exactly one output node per input node: no
                              ///< filters, conditions, optional markers or slices
                              ///< before the final key.
    bool relative{false};     ///< Starts with `@` instead of `$`.
};

/// Filter comparison operators.
enum class Operator : std::uint8_t {
    less,
    less_equal,
    equal,
    not_equal,
    greater_equal,
    greater,
};

/// Convert an Operator to its query spelling.
constexpr auto to_string_view(Operator op) noexcept -> std::string_view {
    switch (op) {
        case Operator::less:          return "<";
        case Operator::less_equal:    return "<=";
        case Operator::equal:         return "==";
        case Operator::not_equal:     return "!=";
        case Operator::greater_equal: return ">=";
        case Operator::greater:       return ">";
    }
    return "?";
}

/// Apply a filter operator with query comparison semantics.
/// @throws Error (type_error) when ordering values that do not order.
auto compare(const Value& left, Operator op, const Value& right) -> bool;

class Query;
class QueryParser;

/// One `&&`-separated term of a filter.
///
/// Without an operator the term tests whether the key `left` selects exists
/// (negated by `!`). With an operator it compares the selected value with a
/// literal or with the value selected by a second relative query.
struct Condition {
    bool negate{false};
    std::shared_ptr<const Query> left;
    std::optional<Operator> op;
    std::variant<Value, std::shared_ptr<const Query>> right;
};

// =============================================================================
// Filter
// =============================================================================

/// A compiled filter: a conjunction of conditions.
///
/// Applying a filter keeps or drops each input node, preserving order; the
/// result is never longer than the input.
class Filter {
public:
    auto text() const noexcept -> const std::string& { return text_; }
    auto conditions() const noexcept -> const std::vector<Condition>& { return conditions_; }

    /// The nodes that satisfy every condition.
    auto apply(NodeList nodes) const -> NodeList;

private:
    friend class QueryParser;

    std::string text_;
    std::vector<Condition> conditions_;
};

// =============================================================================
// Segments
// =============================================================================

/// `?`: drop nodes whose key does not exist, and allow an empty result.
struct OptionalMarker {};

/// `.property`, `[index]`, `[slice]` or `['key']`.
struct KeySegment {
    Key key;
};

/// `[filter]`: fan out over the children of each target and filter them.
struct FilterSegment {
    Filter filter;
};

/// `{filter}`: filter the current nodes in place. A slice key is first
/// expanded into its indices, in ascending order.
struct ConditionSegment {
    Filter filter;
};

using Segment = std::variant<OptionalMarker, KeySegment, FilterSegment, ConditionSegment>;

// =============================================================================
// Query
// =============================================================================

/// A compiled path query.
///
/// Queries are immutable after compilation and may be evaluated any number
/// of times, from any number of threads, against independent trees.
///
/// @code
/// auto root = Array{Value{Array{1, 2, 3}}};
/// auto query = compile_query("$[@ > 1]");
/// for (const auto& node : query.evaluate(Node{&root, std::int64_t{0}})) {
///     write(node, 0);
/// }
/// // root[0] is now [1, 0, 0]
/// @endcode
class Query {
public:
    auto text() const noexcept -> const std::string& { return text_; }
    auto options() const noexcept -> const QueryOptions& { return options_; }
    auto segments() const noexcept -> const std::vector<Segment>& { return segments_; }

    /// Whether the query contains an optional marker.
    auto is_optional() const noexcept -> bool { return optional_; }

    /// Evaluate against a list of nodes.
    /// @throws Error (type_error, index_error, key_error) on a failed lookup,
    ///   or value_error when an absolute query without optional marker
    ///   has no matches.
    auto evaluate(NodeList nodes) const -> NodeList;

    /// Evaluate against a single node.
    auto evaluate(const Node& node) const -> NodeList { return evaluate(NodeList{node}); }

private:
    friend class QueryParser;

    std::string text_;
    QueryOptions options_;
    std::vector<Segment> segments_;
    bool optional_{false};
};

// =============================================================================
// Compilation
// =============================================================================

/// Compile a query.
/// @throws SyntaxError if `text` is not a complete query.
auto compile_query(std::string_view text, QueryOptions options = {},
                   ManipulatorOptions manipulator = {}) -> Query;

/// Compile a filter expression such as `@.price < 10 && @.stock`.
/// @throws SyntaxError if `text` is not a complete filter.
auto compile_filter(std::string_view text, ManipulatorOptions manipulator = {}) -> Filter;

/// Parse a query literal such as `'text'`, `12`, `1.5e3` or `null`.
/// @throws SyntaxError if `text` is not exactly one literal.
auto parse_query_value(std::string_view text, ManipulatorOptions manipulator = {}) -> Value;

}  // namespace jsonmanip_cpp
