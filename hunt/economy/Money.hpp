#pragma once

#include <cstdint>
#include <string>

namespace hunt::economy
{
/// Fixed-point currency amount in whole cents.
class Money
{
public:
    constexpr Money() = default;

    [[nodiscard]] static constexpr Money FromCents(std::int64_t cents) { return Money(cents); }

    /// Rounds half away from zero to the nearest cent. Non-finite input yields zero.
    [[nodiscard]] static Money FromDecimal(double amount);

    [[nodiscard]] constexpr std::int64_t Cents() const { return m_cents; }
    [[nodiscard]] double ToDecimal() const { return static_cast<double>(m_cents) / 100.0; }
    [[nodiscard]] constexpr bool IsNegative() const { return m_cents < 0; }

    /// "$10.01", "-$0.50"
    [[nodiscard]] std::string ToString() const;

    constexpr Money& operator+=(Money other)
    {
        m_cents += other.m_cents;
        return *this;
    }

    [[nodiscard]] friend constexpr Money operator+(Money a, Money b) { return Money(a.m_cents + b.m_cents); }
    [[nodiscard]] friend constexpr Money operator-(Money a, Money b) { return Money(a.m_cents - b.m_cents); }
    [[nodiscard]] friend constexpr auto operator<=>(Money a, Money b) = default;
    [[nodiscard]] friend constexpr bool operator==(Money a, Money b) = default;

private:
    constexpr explicit Money(std::int64_t cents) : m_cents(cents) {}

    std::int64_t m_cents = 0;
};
} // namespace hunt::economy
