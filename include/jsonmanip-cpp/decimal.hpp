/// @file decimal.hpp
/// @brief Arbitrary-precision decimal numbers for exact numeric literals.

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jsonmanip_cpp {

/// An arbitrary-precision decimal number.
///
/// A finite Decimal is `coefficient * 10^exponent` where the coefficient is
/// kept as a decimal digit string, so literals such as `1.10` keep their
/// trailing zeros when printed. NaN and the two infinities are supported.
/// Comparison is numeric and exact: `1.0` and `1.00` are equal, NaN is
/// unordered with everything (including itself).
class Decimal {
public:
    /// Zero.
    Decimal() = default;

    /// Parse a JSON-style number (`-?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][-+]?[0-9]+)?`),
    /// `NaN`, `Infinity` or `-Infinity`.
    /// @return nullopt on malformed text or an exponent beyond the supported range.
    static auto parse(std::string_view text) -> std::optional<Decimal>;

    /// Exact conversion from an integer.
    static auto from_int(std::int64_t value) -> Decimal;

    /// Exact conversion from a double: 0.1 becomes
    /// 0.1000000000000000055511151231257827021181583404541015625.
    static auto from_double(double value) -> Decimal;

    auto is_nan() const noexcept -> bool { return kind_ == Kind::nan; }
    auto is_infinite() const noexcept -> bool { return kind_ == Kind::infinity; }
    auto is_finite() const noexcept -> bool { return kind_ == Kind::finite; }
    auto is_negative() const noexcept -> bool { return negative_; }
    auto is_zero() const noexcept -> bool { return kind_ == Kind::finite && digits_ == "0"; }

    /// Nearest double (may overflow to infinity or underflow to zero).
    auto to_double() const -> double;

    /// Scientific-or-plain notation, e.g. `1.10`, `0.001`, `1E+1`, `-Infinity`, `NaN`.
    auto to_string() const -> std::string;

    /// Numeric three-way comparison; unordered when either side is NaN.
    auto compare(const Decimal& other) const -> std::partial_ordering;

    friend auto operator==(const Decimal& a, const Decimal& b) -> bool {
        return a.compare(b) == std::partial_ordering::equivalent;
    }
    friend auto operator<=>(const Decimal& a, const Decimal& b) -> std::partial_ordering {
        return a.compare(b);
    }

private:
    enum class Kind : std::uint8_t { finite, nan, infinity };

    Kind kind_{Kind::finite};
    bool negative_{false};
    std::string digits_{"0"};   // coefficient, no leading zeros
    std::int64_t exponent_{0};
};

}  // namespace jsonmanip_cpp
