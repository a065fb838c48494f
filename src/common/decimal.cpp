#include "rynamo/common/decimal.hpp"

#include "rynamo/common/error.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace rynamo {

namespace {

constexpr std::int64_t kExponentClamp = 1'000'000'000LL;

bool is_digit(char c) noexcept
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::strong_ordering compare_magnitude(const std::string& lhs_digits,
                                       std::int64_t lhs_adjusted,
                                       const std::string& rhs_digits,
                                       std::int64_t rhs_adjusted) noexcept
{
    if (lhs_digits.empty() || rhs_digits.empty()) {
        return !lhs_digits.empty() <=> !rhs_digits.empty();
    }
    if (lhs_adjusted != rhs_adjusted) {
        return lhs_adjusted <=> rhs_adjusted;
    }
    const auto common = std::min(lhs_digits.size(), rhs_digits.size());
    for (std::size_t index = 0; index < common; ++index) {
        if (lhs_digits[index] != rhs_digits[index]) {
            return lhs_digits[index] <=> rhs_digits[index];
        }
    }
    return lhs_digits.size() <=> rhs_digits.size();
}

// Both inputs are aligned digit strings of equal length.
std::string add_aligned(const std::string& lhs, const std::string& rhs)
{
    std::string result(lhs.size() + 1U, '0');
    int carry = 0;
    for (std::size_t offset = 0; offset < lhs.size(); ++offset) {
        const auto index = lhs.size() - 1U - offset;
        const int sum = (lhs[index] - '0') + (rhs[index] - '0') + carry;
        result[result.size() - 1U - offset] = static_cast<char>('0' + (sum % 10));
        carry = sum / 10;
    }
    result[0] = static_cast<char>('0' + carry);
    return result;
}

// Requires lhs >= rhs, both aligned to equal length.
std::string subtract_aligned(const std::string& lhs, const std::string& rhs)
{
    std::string result(lhs.size(), '0');
    int borrow = 0;
    for (std::size_t offset = 0; offset < lhs.size(); ++offset) {
        const auto index = lhs.size() - 1U - offset;
        int difference = (lhs[index] - '0') - (rhs[index] - '0') - borrow;
        borrow = 0;
        if (difference < 0) {
            difference += 10;
            borrow = 1;
        }
        result[index] = static_cast<char>('0' + difference);
    }
    return result;
}

}  // namespace

Decimal::Decimal(bool negative, std::string digits, std::int64_t exponent)
    : negative_{negative}
    , digits_{std::move(digits)}
    , exponent_{exponent}
{
}

std::error_code Decimal::parse(std::string_view text, Decimal& out, std::string& message)
{
    const auto invalid = [&]() {
        message = "The parameter cannot be converted to a numeric value: " + std::string{text};
        return make_error_code(Errc::ValidationError);
    };

    std::size_t pos = 0U;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    std::size_t integer_digits = 0U;
    std::size_t fraction_digits = 0U;
    while (pos < text.size() && is_digit(text[pos])) {
        digits.push_back(text[pos++]);
        ++integer_digits;
    }
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && is_digit(text[pos])) {
            digits.push_back(text[pos++]);
            ++fraction_digits;
        }
    }
    if (integer_digits + fraction_digits == 0U) {
        return invalid();
    }

    std::int64_t exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exponent_negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            exponent_negative = text[pos] == '-';
            ++pos;
        }
        if (pos >= text.size() || !is_digit(text[pos])) {
            return invalid();
        }
        while (pos < text.size() && is_digit(text[pos])) {
            exponent = std::min(exponent * 10 + (text[pos] - '0'), kExponentClamp);
            ++pos;
        }
        if (exponent_negative) {
            exponent = -exponent;
        }
    }
    if (pos != text.size()) {
        return invalid();
    }

    return finish(negative, std::move(digits), exponent - static_cast<std::int64_t>(fraction_digits), out, message);
}

std::error_code Decimal::finish(bool negative, std::string digits, std::int64_t exponent, Decimal& out, std::string& message)
{
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        out = Decimal{};
        return {};
    }
    digits.erase(0U, first);
    const auto last = digits.find_last_not_of('0');
    exponent += static_cast<std::int64_t>(digits.size() - 1U - last);
    digits.erase(last + 1U);

    Decimal candidate{negative, std::move(digits), exponent};
    if (candidate.digits_.size() > kMaxSignificantDigits) {
        message = "Attempting to store more than 38 significant digits in a Number";
        return make_error_code(Errc::ValidationError);
    }
    if (candidate.adjusted_exponent() > kMaxAdjustedExponent) {
        message = "Number overflow. Attempting to store a number with magnitude larger than supported range";
        return make_error_code(Errc::ValidationError);
    }
    if (candidate.adjusted_exponent() < kMinAdjustedExponent) {
        message = "Number underflow. Attempting to store a number with magnitude smaller than supported range";
        return make_error_code(Errc::ValidationError);
    }
    out = std::move(candidate);
    return {};
}

Decimal Decimal::from_integer(std::int64_t value)
{
    if (value == 0) {
        return Decimal{};
    }
    const bool negative = value < 0;
    auto magnitude = negative ? static_cast<std::uint64_t>(-(value + 1)) + 1U : static_cast<std::uint64_t>(value);
    std::string digits = std::to_string(magnitude);
    std::int64_t exponent = 0;
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
        ++exponent;
    }
    return Decimal{negative, std::move(digits), exponent};
}

std::string Decimal::to_string() const
{
    if (digits_.empty()) {
        return "0";
    }

    std::string text;
    if (negative_) {
        text.push_back('-');
    }
    if (exponent_ >= 0) {
        text += digits_;
        text.append(static_cast<std::size_t>(exponent_), '0');
        return text;
    }

    const auto fraction = static_cast<std::size_t>(-exponent_);
    if (fraction >= digits_.size()) {
        text += "0.";
        text.append(fraction - digits_.size(), '0');
        text += digits_;
    } else {
        text.append(digits_, 0U, digits_.size() - fraction);
        text.push_back('.');
        text.append(digits_, digits_.size() - fraction, std::string::npos);
    }
    return text;
}

bool Decimal::is_zero() const noexcept
{
    return digits_.empty();
}

bool Decimal::is_negative() const noexcept
{
    return negative_;
}

std::size_t Decimal::significant_digits() const noexcept
{
    return digits_.size();
}

std::int64_t Decimal::adjusted_exponent() const noexcept
{
    return exponent_ + static_cast<std::int64_t>(digits_.size()) - 1;
}

Decimal Decimal::negated() const
{
    if (digits_.empty()) {
        return *this;
    }
    return Decimal{!negative_, digits_, exponent_};
}

std::error_code Decimal::add(const Decimal& other, Decimal& out, std::string& message) const
{
    if (digits_.empty()) {
        out = other;
        return {};
    }
    if (other.digits_.empty()) {
        out = *this;
        return {};
    }

    const auto exponent = std::min(exponent_, other.exponent_);
    auto lhs = digits_ + std::string(static_cast<std::size_t>(exponent_ - exponent), '0');
    auto rhs = other.digits_ + std::string(static_cast<std::size_t>(other.exponent_ - exponent), '0');
    const auto width = std::max(lhs.size(), rhs.size());
    lhs.insert(0U, width - lhs.size(), '0');
    rhs.insert(0U, width - rhs.size(), '0');

    if (negative_ == other.negative_) {
        return finish(negative_, add_aligned(lhs, rhs), exponent, out, message);
    }
    if (lhs >= rhs) {
        return finish(negative_, subtract_aligned(lhs, rhs), exponent, out, message);
    }
    return finish(other.negative_, subtract_aligned(rhs, lhs), exponent, out, message);
}

std::error_code Decimal::subtract(const Decimal& other, Decimal& out, std::string& message) const
{
    return add(other.negated(), out, message);
}

std::strong_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept
{
    const bool lhs_negative = lhs.negative_ && !lhs.digits_.empty();
    const bool rhs_negative = rhs.negative_ && !rhs.digits_.empty();
    if (lhs_negative != rhs_negative) {
        return lhs_negative ? std::strong_ordering::less : std::strong_ordering::greater;
    }

    const auto magnitude = compare_magnitude(lhs.digits_, lhs.adjusted_exponent(), rhs.digits_, rhs.adjusted_exponent());
    if (lhs_negative) {
        return 0 <=> magnitude;
    }
    return magnitude;
}

}  // namespace rynamo
