#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace rynamo {

// Exact base-10 number with the precision and range limits of the Number type:
// at most 38 significant digits and a magnitude of zero or within [1e-130, 1e126).
class Decimal final {
public:
    static constexpr std::size_t kMaxSignificantDigits = 38U;
    static constexpr std::int32_t kMaxAdjustedExponent = 125;
    static constexpr std::int32_t kMinAdjustedExponent = -130;

    Decimal() = default;

    static std::error_code parse(std::string_view text, Decimal& out, std::string& message);
    static Decimal from_integer(std::int64_t value);

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] bool is_zero() const noexcept;
    [[nodiscard]] bool is_negative() const noexcept;
    [[nodiscard]] std::size_t significant_digits() const noexcept;

    std::error_code add(const Decimal& other, Decimal& out, std::string& message) const;
    std::error_code subtract(const Decimal& other, Decimal& out, std::string& message) const;
    [[nodiscard]] Decimal negated() const;

    friend std::strong_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept;
    friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept = default;

private:
    Decimal(bool negative, std::string digits, std::int64_t exponent);

    static std::error_code finish(bool negative, std::string digits, std::int64_t exponent, Decimal& out, std::string& message);
    [[nodiscard]] std::int64_t adjusted_exponent() const noexcept;

    bool negative_ = false;
    std::string digits_{};
    std::int64_t exponent_ = 0;
};

}  // namespace rynamo
