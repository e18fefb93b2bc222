#include <jsonmanip-cpp/query.hpp>

#include <jsonmanip-cpp/decimal.hpp>
#include <jsonmanip-cpp/error.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace jsonmanip_cpp {

namespace {

constexpr auto reserved_chars = std::string_view{"!&.<=>?[]{}~"};

constexpr auto is_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

constexpr auto is_space(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

constexpr auto is_reserved(char c) noexcept -> bool {
    return reserved_chars.find(c) != std::string_view::npos;
}

/// A scanned index token; `value` is empty when the digits overflow.
struct IndexToken {
    std::size_t start;
    std::size_t end;
    std::optional<std::int64_t> value;
};

/// A scanned number literal.
struct NumberToken {
    std::size_t end;
    bool is_integer;
};

}  // anonymous namespace

// =============================================================================
// QueryParser
// =============================================================================

/// Recursive-descent scanner over one query, filter or literal text.
///
/// Every method takes the offset to start at and returns what it parsed
/// together with the offset just past it. Nesting is bounded: filters only
/// hold relative queries, which cannot hold filters.
class QueryParser {
public:
    QueryParser(std::string_view text, ManipulatorOptions options)
        : text_{text}, options_{options} {}

    auto parse_query(std::size_t pos, QueryOptions options) -> std::pair<Query, std::size_t> {
        auto query = Query{};
        query.options_ = options;
        const auto start = pos;

        if (options.relative) {
            if (!looking_at(pos, "@")) throw error("Expecting a relative query", pos);
        } else if (!looking_at(pos, "$")) {
            throw error("Expecting an absolute query", pos);
        }
        ++pos;

        while (true) {
            if (looking_at(pos, "?")) {
                if (options.relative) {
                    throw error("Optional markers are not allowed in relative query", pos, pos + 1);
                }
                if (options.mapping) throw error("Unexpected optional marker", pos, pos + 1);
                ++pos;
                query.optional_ = true;
                query.segments_.emplace_back(OptionalMarker{});
            }

            if (looking_at(pos, ".")) {
                auto [name, end] = parse_property(pos + 1);
                query.segments_.emplace_back(KeySegment{Key{std::move(name)}});
                pos = end;
            } else if (looking_at(pos, "[")) {
                ++pos;
                if (auto key = parse_bracket_key(pos)) {
                    query.segments_.emplace_back(KeySegment{std::move(key->first)});
                    pos = key->second;
                } else if (options.relative) {
                    throw error("Filters are not allowed in relative query", pos);
                } else if (options.mapping) {
                    throw error("Expecting key", pos);
                } else {
                    auto [filter, end] = parse_filter(pos);
                    query.segments_.emplace_back(FilterSegment{std::move(filter)});
                    pos = end;
                }

                if (!looking_at(pos, "]")) throw error("Expecting a closing bracket", pos);
                ++pos;
            } else if (looking_at(pos, "{")) {
                if (options.mapping && !options.relative) throw error("Unexpected condition", pos, pos + 1);
                ++pos;
                if (options.relative) throw error("Conditions are not allowed in relative query", pos);

                auto [filter, end] = parse_filter(pos);
                query.segments_.emplace_back(ConditionSegment{std::move(filter)});
                pos = end;
                if (!looking_at(pos, "}")) throw error("Expecting a closing bracket", pos);
                ++pos;
            } else {
                break;
            }
        }

        query.text_ = std::string{text_.substr(start, pos - start)};
        return {std::move(query), pos};
    }

    auto parse_filter(std::size_t pos) -> std::pair<Filter, std::size_t> {
        auto filter = Filter{};
        const auto start = pos;
        while (true) {
            auto condition = Condition{};
            if (looking_at(pos, "!")) {
                condition.negate = true;
                ++pos;
            }

            auto [left, left_end] = parse_query(pos, QueryOptions{.relative = true});
            condition.left = std::make_shared<const Query>(std::move(left));
            pos = left_end;

            // Trailing spaces only belong to the filter when more follows
            auto end = pos;
            pos = skip_spaces(pos);
            const auto op_pos = pos;
            auto [op, op_end] = parse_operator(pos);
            if (op) {
                if (condition.negate) throw error("Unexpected operator", op_pos, op_end);
                pos = skip_spaces(op_end);
                if (looking_at(pos, "@")) {
                    auto [right, right_end] = parse_query(pos, QueryOptions{.relative = true});
                    condition.right = std::make_shared<const Query>(std::move(right));
                    pos = right_end;
                } else {
                    auto [value, value_end] = parse_value(pos);
                    condition.right = std::move(value);
                    pos = value_end;
                }
                condition.op = op;
                end = pos;
                pos = skip_spaces(pos);
            }
            filter.conditions_.push_back(std::move(condition));

            if (!looking_at(pos, "&&")) {
                filter.text_ = std::string{text_.substr(start, end - start)};
                return {std::move(filter), end};
            }
            pos = skip_spaces(pos + 2);
        }
    }

    auto parse_value(std::size_t pos) -> std::pair<Value, std::size_t> {
        if (pos >= text_.size()) throw error("Expecting value", pos);

        if (text_[pos] == '\'') {
            auto [str, end] = parse_string(pos + 1);
            return {Value{std::move(str)}, end};
        }
        if (looking_at(pos, "null")) return {Value{}, pos + 4};
        if (looking_at(pos, "true")) return {Value{true}, pos + 4};
        if (looking_at(pos, "false")) return {Value{false}, pos + 5};
        if (auto number = match_number(pos)) return {parse_number(pos, *number), number->end};
        if (looking_at(pos, "NaN")) return {special_float("NaN", pos), pos + 3};
        if (looking_at(pos, "Infinity")) return {special_float("Infinity", pos), pos + 8};
        if (looking_at(pos, "-Infinity")) return {special_float("-Infinity", pos), pos + 9};
        throw error("Expecting value", pos);
    }

    void expect_end(std::size_t pos) const {
        if (pos < text_.size()) throw error("Expecting end of file", pos);
    }

private:
    auto error(std::string msg, std::size_t start, std::ptrdiff_t end = 0) const -> SyntaxError {
        return SyntaxError{std::move(msg), "<query>", std::string{text_}, start, end};
    }

    auto error(std::string msg, std::size_t start, std::size_t end) const -> SyntaxError {
        return error(std::move(msg), start, static_cast<std::ptrdiff_t>(end));
    }

    auto looking_at(std::size_t pos, std::string_view literal) const -> bool {
        return pos <= text_.size() && text_.substr(pos).starts_with(literal);
    }

    auto skip_spaces(std::size_t pos) const -> std::size_t {
        while (pos < text_.size() && text_[pos] == ' ') ++pos;
        return pos;
    }

    auto parse_property(std::size_t pos) -> std::pair<std::string, std::size_t> {
        const auto start = pos;
        auto name = std::string{};
        while (pos < text_.size()) {
            const auto c = text_[pos];
            if (c == '~') {
                if (pos + 1 >= text_.size()) throw error("Expecting escaped character", pos + 1);
                const auto esc = text_[pos + 1];
                if (!is_reserved(esc)) throw error("Invalid tilde escape", pos, pos + 2);
                name.push_back(esc);
                pos += 2;
                continue;
            }
            if (is_space(c) || is_reserved(c)) break;
            name.push_back(c);
            ++pos;
        }
        if (name.empty()) throw error("Expecting property", start);
        return {std::move(name), pos};
    }

    // `pos` is just past the opening quote
    auto parse_string(std::size_t pos) -> std::pair<std::string, std::size_t> {
        const auto quote = pos - 1;
        auto result = std::string{};
        while (true) {
            if (pos >= text_.size()) throw error("Unterminated string", quote, pos);
            const auto c = text_[pos];
            if (c == '\'') return {std::move(result), pos + 1};
            if (c == '~') {
                if (pos + 1 >= text_.size()) throw error("Expecting escaped character", pos + 1);
                const auto esc = text_[pos + 1];
                if (esc != '\'' && esc != '~') throw error("Invalid tilde escape", pos, pos + 2);
                result.push_back(esc);
                pos += 2;
                continue;
            }
            result.push_back(c);
            ++pos;
        }
    }

    auto match_index(std::size_t pos) const -> std::optional<IndexToken> {
        if (looking_at(pos, "start")) return IndexToken{pos, pos + 5, start_index};
        if (looking_at(pos, "end")) return IndexToken{pos, pos + 3, end_index};

        auto end = pos;
        if (looking_at(end, "-")) ++end;
        if (end >= text_.size() || !is_digit(text_[end])) return std::nullopt;
        if (text_[end] == '0') {
            ++end;
        } else {
            while (end < text_.size() && is_digit(text_[end])) ++end;
        }

        auto token = IndexToken{pos, end, std::nullopt};
        auto value = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(text_.data() + pos, text_.data() + end, value);
        if (ec == std::errc{}) token.value = value;
        return token;
    }

    auto slice_bound(const std::optional<IndexToken>& token, const char* overflow_msg) const
        -> std::optional<std::int64_t> {
        if (!token) return std::nullopt;
        if (!token->value) throw error(overflow_msg, token->start, token->end);
        return token->value;
    }

    auto parse_bracket_key(std::size_t pos) -> std::optional<std::pair<Key, std::size_t>> {
        const auto first = match_index(pos);
        auto end = first ? first->end : pos;

        if (looking_at(end, ":")) {
            const auto second = match_index(end + 1);
            end = second ? second->end : end + 1;
            auto third = std::optional<IndexToken>{};
            if (looking_at(end, ":")) {
                third = match_index(end + 1);
                end = third ? third->end : end + 1;
            }
            auto slice = Slice{};
            slice.start = slice_bound(first, "Start is too big");
            slice.stop = slice_bound(second, "Stop is too big");
            slice.step = slice_bound(third, "Step is too big");
            return std::pair{Key{slice}, end};
        }

        if (first) {
            if (!first->value) throw error("Index is too big", first->start, first->end);
            return std::pair{Key{*first->value}, first->end};
        }

        if (looking_at(pos, "'")) {
            auto [key, key_end] = parse_string(pos + 1);
            return std::pair{Key{std::move(key)}, key_end};
        }
        return std::nullopt;
    }

    auto parse_operator(std::size_t pos) const -> std::pair<std::optional<Operator>, std::size_t> {
        if (looking_at(pos, "<=")) return {Operator::less_equal, pos + 2};
        if (looking_at(pos, "<")) return {Operator::less, pos + 1};
        if (looking_at(pos, "==")) return {Operator::equal, pos + 2};
        if (looking_at(pos, "!=")) return {Operator::not_equal, pos + 2};
        if (looking_at(pos, ">=")) return {Operator::greater_equal, pos + 2};
        if (looking_at(pos, ">")) return {Operator::greater, pos + 1};
        return {std::nullopt, pos};
    }

    auto match_number(std::size_t pos) const -> std::optional<NumberToken> {
        auto end = pos;
        if (looking_at(end, "-")) ++end;
        if (end >= text_.size() || !is_digit(text_[end])) return std::nullopt;
        if (text_[end] == '0') {
            ++end;
        } else {
            while (end < text_.size() && is_digit(text_[end])) ++end;
        }

        auto token = NumberToken{end, true};
        if (looking_at(end, ".") && end + 1 < text_.size() && is_digit(text_[end + 1])) {
            end += 1;
            while (end < text_.size() && is_digit(text_[end])) ++end;
            token = NumberToken{end, false};
        }
        if (end < text_.size() && (text_[end] == 'e' || text_[end] == 'E')) {
            auto exp = end + 1;
            if (exp < text_.size() && (text_[exp] == '+' || text_[exp] == '-')) ++exp;
            if (exp < text_.size() && is_digit(text_[exp])) {
                while (exp < text_.size() && is_digit(text_[exp])) ++exp;
                token = NumberToken{exp, false};
            }
        }
        return token;
    }

    auto parse_number(std::size_t pos, const NumberToken& token) const -> Value {
        const auto literal = text_.substr(pos, token.end - pos);
        if (token.is_integer) {
            auto value = std::int64_t{0};
            auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
            if (ec != std::errc{}) throw error("Invalid number", pos, token.end);
            return value;
        }
        if (options_.use_decimal) {
            auto value = Decimal::parse(literal);
            if (!value) throw error("Invalid number", pos, token.end);
            return *value;
        }
        // Out-of-range literals become infinity or zero
        return std::strtod(std::string{literal}.c_str(), nullptr);
    }

    auto special_float(std::string_view literal, std::size_t pos) const -> Value {
        if (!options_.allow_nan_and_infinity) {
            throw error(std::string{literal} + " is not allowed", pos, pos + literal.size());
        }
        if (options_.use_decimal) return *Decimal::parse(literal);
        if (literal == "NaN") return std::numeric_limits<double>::quiet_NaN();
        return literal.front() == '-' ? -std::numeric_limits<double>::infinity()
                                      : std::numeric_limits<double>::infinity();
    }

    std::string_view text_;
    ManipulatorOptions options_;
};

// =============================================================================
// Compilation
// =============================================================================

auto compile_query(std::string_view text, QueryOptions options, ManipulatorOptions manipulator)
    -> Query {
    auto parser = QueryParser{text, manipulator};
    auto result = parser.parse_query(0, options);
    parser.expect_end(result.second);
    return std::move(result.first);
}

auto compile_filter(std::string_view text, ManipulatorOptions manipulator) -> Filter {
    auto parser = QueryParser{text, manipulator};
    auto result = parser.parse_filter(0);
    parser.expect_end(result.second);
    return std::move(result.first);
}

auto parse_query_value(std::string_view text, ManipulatorOptions manipulator) -> Value {
    auto parser = QueryParser{text, manipulator};
    auto result = parser.parse_value(0);
    parser.expect_end(result.second);
    return std::move(result.first);
}

}  // namespace jsonmanip_cpp
