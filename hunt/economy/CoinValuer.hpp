#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

#include "hunt/coins/Coin.hpp"
#include "hunt/economy/Money.hpp"

namespace hunt::economy
{
/// Decides what a coin credits when it is collected.
///
/// Fixed coins credit their face value. Pool coins roll a multiplier weighted towards
/// low payouts over their pool contribution, clamped to [kPoolMinValue, 5 x base].
class CoinValuer
{
public:
    /// Uniform roll in [0, 1).
    using RollSource = std::function<float()>;

    static constexpr Money kPoolMinValue = Money::FromCents(5);
    static constexpr std::int64_t kPoolMaxMultiplier = 5;

    /// Seeded from the clock.
    CoinValuer();
    explicit CoinValuer(std::uint32_t seed);
    explicit CoinValuer(RollSource source);

    CoinValuer(const CoinValuer&) = delete;
    CoinValuer& operator=(const CoinValuer&) = delete;

    [[nodiscard]] Money Determine(const coins::Coin& coin);

    /// 50%: 0.2x-0.8x, 35%: 0.8x-1.5x, 13%: 1.5x-2.8x, 2%: 3x-5x.
    [[nodiscard]] static float PoolMultiplier(float roll);
    [[nodiscard]] static Money PoolValue(Money baseValue, float roll);

private:
    [[nodiscard]] float NextRoll();

    std::mutex m_mutex;
    std::mt19937 m_randomEngine;
    std::uniform_real_distribution<float> m_distribution{0.0F, 1.0F};
    RollSource m_source;
};
} // namespace hunt::economy
