#include <jsonmanip-cpp/decimal.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace jsonmanip_cpp {

namespace {

// Largest adjusted exponent accepted, matching a 64-bit decimal context.
constexpr auto max_adjusted_exponent = std::int64_t{999'999'999'999'999'999};

constexpr auto is_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }

auto sign_of(bool negative, bool zero) -> int {
    if (zero) return 0;
    return negative ? -1 : 1;
}

// Multiply a decimal digit string in place by a small factor.
void multiply_digits(std::string& digits, int factor) {
    auto carry = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        const auto product = (*it - '0') * factor + carry;
        *it = static_cast<char>('0' + product % 10);
        carry = product / 10;
    }
    if (carry != 0) digits.insert(digits.begin(), static_cast<char>('0' + carry));
}

}  // anonymous namespace

auto Decimal::parse(std::string_view text) -> std::optional<Decimal> {
    auto result = Decimal{};
    if (text == "NaN") {
        result.kind_ = Kind::nan;
        return result;
    }
    if (text == "Infinity" || text == "-Infinity") {
        result.kind_ = Kind::infinity;
        result.negative_ = text.front() == '-';
        return result;
    }

    auto pos = std::size_t{0};
    if (pos < text.size() && text[pos] == '-') {
        result.negative_ = true;
        ++pos;
    }

    const auto int_start = pos;
    if (pos < text.size() && text[pos] == '0') {
        ++pos;
    } else if (pos < text.size() && is_digit(text[pos])) {
        while (pos < text.size() && is_digit(text[pos])) ++pos;
    } else {
        return std::nullopt;
    }
    auto coefficient = std::string{text.substr(int_start, pos - int_start)};

    auto frac_len = std::int64_t{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const auto frac_start = pos;
        while (pos < text.size() && is_digit(text[pos])) ++pos;
        if (pos == frac_start) return std::nullopt;
        coefficient.append(text.substr(frac_start, pos - frac_start));
        frac_len = static_cast<std::int64_t>(pos - frac_start);
    }

    auto exponent = std::int64_t{0};
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        auto exp_negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            exp_negative = text[pos] == '-';
            ++pos;
        }
        const auto exp_start = pos;
        while (pos < text.size() && text[pos] == '0') ++pos;
        const auto significant_start = pos;
        while (pos < text.size() && is_digit(text[pos])) ++pos;
        if (pos == exp_start) return std::nullopt;
        if (pos - significant_start > 18) return std::nullopt;
        if (pos > significant_start) {
            auto [ptr, ec] = std::from_chars(text.data() + significant_start, text.data() + pos, exponent);
            if (ec != std::errc{}) return std::nullopt;
        }
        if (exp_negative) exponent = -exponent;
    }
    if (pos != text.size()) return std::nullopt;

    const auto first_nonzero = coefficient.find_first_not_of('0');
    result.digits_ = first_nonzero == std::string::npos ? "0" : coefficient.substr(first_nonzero);
    result.exponent_ = exponent - frac_len;

    const auto adjusted = result.exponent_ + static_cast<std::int64_t>(result.digits_.size()) - 1;
    if (adjusted > max_adjusted_exponent || adjusted < -max_adjusted_exponent) {
        return std::nullopt;
    }
    return result;
}

auto Decimal::from_int(std::int64_t value) -> Decimal {
    auto result = Decimal{};
    result.negative_ = value < 0;
    // Work on the unsigned magnitude so INT64_MIN is representable.
    auto magnitude = result.negative_ ? ~static_cast<std::uint64_t>(value) + 1 : static_cast<std::uint64_t>(value);
    result.digits_ = std::to_string(magnitude);
    return result;
}

auto Decimal::from_double(double value) -> Decimal {
    auto result = Decimal{};
    if (std::isnan(value)) {
        result.kind_ = Kind::nan;
        return result;
    }
    if (std::isinf(value)) {
        result.kind_ = Kind::infinity;
        result.negative_ = value < 0;
        return result;
    }
    result.negative_ = std::signbit(value);
    if (value == 0.0) return result;

    // value == mantissa * 2^exp2 with a 53-bit integer mantissa
    auto exp2 = 0;
    const auto fraction = std::frexp(std::fabs(value), &exp2);
    auto mantissa = static_cast<std::uint64_t>(std::ldexp(fraction, 53));
    exp2 -= 53;
    while ((mantissa & 1u) == 0) {
        mantissa >>= 1;
        ++exp2;
    }

    result.digits_ = std::to_string(mantissa);
    if (exp2 < 0) {
        // m / 2^k == m * 5^k / 10^k
        for (auto i = 0; i < -exp2; ++i) multiply_digits(result.digits_, 5);
        result.exponent_ = exp2;
    } else {
        for (auto i = 0; i < exp2; ++i) multiply_digits(result.digits_, 2);
    }
    return result;
}

auto Decimal::to_double() const -> double {
    const auto text = to_string();
    return std::strtod(text.c_str(), nullptr);
}

auto Decimal::to_string() const -> std::string {
    const auto sign = std::string{negative_ ? "-" : ""};
    if (kind_ == Kind::nan) return "NaN";
    if (kind_ == Kind::infinity) return sign + "Infinity";

    const auto length = static_cast<std::int64_t>(digits_.size());
    const auto left_digits = exponent_ + length;
    auto dot_place = std::int64_t{1};
    if (exponent_ <= 0 && left_digits > -6) {
        dot_place = left_digits;
    }

    auto int_part = std::string{};
    auto frac_part = std::string{};
    if (dot_place <= 0) {
        int_part = "0";
        frac_part = "." + std::string(static_cast<std::size_t>(-dot_place), '0') + digits_;
    } else if (dot_place >= length) {
        int_part = digits_ + std::string(static_cast<std::size_t>(dot_place - length), '0');
    } else {
        int_part = digits_.substr(0, static_cast<std::size_t>(dot_place));
        frac_part = "." + digits_.substr(static_cast<std::size_t>(dot_place));
    }

    auto exp_part = std::string{};
    if (left_digits != dot_place) {
        const auto shown = left_digits - dot_place;
        exp_part = std::string{"E"} + (shown >= 0 ? "+" : "") + std::to_string(shown);
    }
    return sign + int_part + frac_part + exp_part;
}

auto Decimal::compare(const Decimal& other) const -> std::partial_ordering {
    if (is_nan() || other.is_nan()) return std::partial_ordering::unordered;

    if (is_infinite() || other.is_infinite()) {
        // Rank: -inf < finite < +inf
        auto rank = [](const Decimal& d) {
            if (!d.is_infinite()) return 0;
            return d.negative_ ? -1 : 1;
        };
        auto a = rank(*this);
        auto b = rank(other);
        if (a != b) return a <=> b;
        return std::partial_ordering::equivalent;
    }

    const auto sa = sign_of(negative_, is_zero());
    const auto sb = sign_of(other.negative_, other.is_zero());
    if (sa != sb) return sa <=> sb;
    if (sa == 0) return std::partial_ordering::equivalent;

    auto magnitude = std::strong_ordering::equal;
    const auto adjusted_a = exponent_ + static_cast<std::int64_t>(digits_.size());
    const auto adjusted_b = other.exponent_ + static_cast<std::int64_t>(other.digits_.size());
    if (adjusted_a != adjusted_b) {
        magnitude = adjusted_a <=> adjusted_b;
    } else {
        auto a = digits_;
        auto b = other.digits_;
        if (a.size() < b.size()) a.append(b.size() - a.size(), '0');
        if (b.size() < a.size()) b.append(a.size() - b.size(), '0');
        magnitude = a.compare(b) <=> 0;
    }
    if (sa < 0) return 0 <=> magnitude;
    return magnitude;
}

}  // namespace jsonmanip_cpp
