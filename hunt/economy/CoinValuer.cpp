#include "hunt/economy/CoinValuer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

namespace hunt::economy
{
CoinValuer::CoinValuer()
    : m_randomEngine(static_cast<unsigned>(std::chrono::steady_clock::now().time_since_epoch().count()))
{
}

CoinValuer::CoinValuer(std::uint32_t seed)
    : m_randomEngine(seed)
{
}

CoinValuer::CoinValuer(RollSource source)
    : m_source(std::move(source))
{
}

Money CoinValuer::Determine(const coins::Coin& coin)
{
    if (coin.type != coins::CoinType::Pool)
    {
        return coin.value;
    }

    const Money base = coin.poolContribution > Money{} ? coin.poolContribution : coin.value;
    return PoolValue(base, NextRoll());
}

float CoinValuer::PoolMultiplier(float roll)
{
    const float r = std::isfinite(roll) ? std::clamp(roll, 0.0F, 1.0F) : 0.0F;
    if (r < 0.50F)
    {
        return 0.2F + r * 1.2F;
    }
    if (r < 0.85F)
    {
        return 0.8F + (r - 0.5F) * 2.0F;
    }
    if (r < 0.98F)
    {
        return 1.5F + (r - 0.85F) * 10.0F;
    }
    return 3.0F + (r - 0.98F) * 100.0F;
}

Money CoinValuer::PoolValue(Money baseValue, float roll)
{
    const double rolled = static_cast<double>(baseValue.Cents()) * static_cast<double>(PoolMultiplier(roll));
    std::int64_t cents = std::max<std::int64_t>(kPoolMinValue.Cents(), std::llround(rolled));
    // Ceiling applied last, so a zero base credits nothing.
    cents = std::min(cents, baseValue.Cents() * kPoolMaxMultiplier);
    return Money::FromCents(cents);
}

float CoinValuer::NextRoll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_source)
    {
        return m_source();
    }
    return m_distribution(m_randomEngine);
}
} // namespace hunt::economy
