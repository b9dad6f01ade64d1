#include "hunt/economy/Money.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>

namespace hunt::economy
{
Money Money::FromDecimal(double amount)
{
    if (!std::isfinite(amount))
    {
        return Money{};
    }
    return Money(static_cast<std::int64_t>(std::llround(amount * 100.0)));
}

std::string Money::ToString() const
{
    const std::int64_t magnitude = m_cents < 0 ? -m_cents : m_cents;
    char buffer[48];
    std::snprintf(
        buffer,
        sizeof(buffer),
        "%s$%" PRId64 ".%02" PRId64,
        m_cents < 0 ? "-" : "",
        magnitude / 100,
        magnitude % 100
    );
    return buffer;
}
} // namespace hunt::economy
