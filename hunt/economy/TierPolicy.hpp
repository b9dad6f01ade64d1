#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <glm/vec3.hpp>

#include "hunt/economy/Money.hpp"

namespace hunt::economy
{
/// Player find-limit tiers, ascending.
enum class FindLimitTier : std::uint8_t
{
    CabinBoy = 0,    ///< $1.00, default for new players
    DeckHand,        ///< $5.00
    TreasureHunter,  ///< $10.00
    Captain,         ///< $25.00
    PirateLegend,    ///< $50.00
    KingOfPirates,   ///< $100.00 and up
    Count
};

/// Visual class of a single coin by its own value.
enum class CoinValueClass : std::uint8_t
{
    Bronze = 0,  ///< below $1
    Silver,      ///< below $5
    Gold,        ///< below $25
    Platinum,    ///< below $100
    Diamond,
    Count
};

struct TierInfo
{
    FindLimitTier tier = FindLimitTier::CabinBoy;
    Money threshold;
    const char* id = "";
    const char* name = "";
    glm::vec3 color{1.0F};
};

/// Maps find limits to tiers and decides collection eligibility.
/// Stateless; every function is a pure lookup.
class TierPolicy
{
public:
    static constexpr Money kDefaultFindLimit = Money::FromCents(100);

    /// Highest tier whose threshold does not exceed the limit. Limits below $1 map to CabinBoy.
    [[nodiscard]] static FindLimitTier TierFor(Money findLimit);

    /// coinValue <= findLimit, boundary inclusive, no tolerance.
    [[nodiscard]] static bool IsCollectible(Money coinValue, Money findLimit) { return coinValue <= findLimit; }

    /// Out-of-range values, Count included, get an "unknown" entry with a zero limit.
    [[nodiscard]] static const TierInfo& InfoFor(FindLimitTier tier);
    [[nodiscard]] static Money LimitFor(FindLimitTier tier) { return InfoFor(tier).threshold; }
    [[nodiscard]] static const char* NameFor(FindLimitTier tier) { return InfoFor(tier).name; }
    [[nodiscard]] static const char* IdFor(FindLimitTier tier) { return InfoFor(tier).id; }
    [[nodiscard]] static glm::vec3 ColorFor(FindLimitTier tier) { return InfoFor(tier).color; }
    [[nodiscard]] static std::optional<FindLimitTier> ParseTier(const std::string& id);

    /// Next tier above the limit, or nullopt at the top tier.
    [[nodiscard]] static std::optional<FindLimitTier> NextTier(Money findLimit);

    /// 0..1 progress from the current tier threshold to the next one; 1 at the top tier.
    [[nodiscard]] static float ProgressToNextTier(Money findLimit);

    [[nodiscard]] static CoinValueClass ClassifyCoinValue(Money coinValue);
    [[nodiscard]] static const char* ValueClassName(CoinValueClass valueClass);
};
} // namespace hunt::economy
