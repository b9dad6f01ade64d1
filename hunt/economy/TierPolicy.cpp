#include "hunt/economy/TierPolicy.hpp"

#include <algorithm>
#include <array>

namespace hunt::economy
{
namespace
{
constexpr std::size_t kTierCount = static_cast<std::size_t>(FindLimitTier::Count);

const std::array<TierInfo, kTierCount> kTiers{{
    {FindLimitTier::CabinBoy, Money::FromCents(100), "cabin_boy", "Cabin Boy", glm::vec3{0.8F, 0.5F, 0.2F}},
    {FindLimitTier::DeckHand, Money::FromCents(500), "deck_hand", "Deck Hand", glm::vec3{0.75F, 0.75F, 0.75F}},
    {FindLimitTier::TreasureHunter, Money::FromCents(1000), "treasure_hunter", "Treasure Hunter", glm::vec3{1.0F, 0.84F, 0.0F}},
    {FindLimitTier::Captain, Money::FromCents(2500), "captain", "Captain", glm::vec3{0.9F, 0.9F, 1.0F}},
    {FindLimitTier::PirateLegend, Money::FromCents(5000), "pirate_legend", "Pirate Legend", glm::vec3{0.7F, 0.9F, 1.0F}},
    {FindLimitTier::KingOfPirates, Money::FromCents(10000), "king_of_pirates", "King of Pirates", glm::vec3{1.0F, 0.5F, 0.8F}},
}};

const TierInfo kUnknownTier{FindLimitTier::Count, Money{}, "unknown", "Unknown", glm::vec3{0.5F}};
} // namespace

FindLimitTier TierPolicy::TierFor(Money findLimit)
{
    for (std::size_t i = kTiers.size(); i-- > 0;)
    {
        if (findLimit >= kTiers[i].threshold)
        {
            return kTiers[i].tier;
        }
    }
    return FindLimitTier::CabinBoy;
}

const TierInfo& TierPolicy::InfoFor(FindLimitTier tier)
{
    const auto index = static_cast<std::size_t>(tier);
    if (index >= kTiers.size())
    {
        return kUnknownTier;
    }
    return kTiers[index];
}

std::optional<FindLimitTier> TierPolicy::ParseTier(const std::string& id)
{
    const auto it = std::find_if(kTiers.begin(), kTiers.end(), [&id](const TierInfo& info) {
        return id == info.id;
    });
    if (it == kTiers.end())
    {
        return std::nullopt;
    }
    return it->tier;
}

std::optional<FindLimitTier> TierPolicy::NextTier(Money findLimit)
{
    for (const TierInfo& info : kTiers)
    {
        if (info.threshold > findLimit)
        {
            return info.tier;
        }
    }
    return std::nullopt;
}

float TierPolicy::ProgressToNextTier(Money findLimit)
{
    const std::optional<FindLimitTier> next = NextTier(findLimit);
    if (!next.has_value())
    {
        return 1.0F;
    }

    // Below the first threshold there is no current tier floor; measure from zero.
    const Money floor = findLimit < kTiers.front().threshold ? Money{} : LimitFor(TierFor(findLimit));
    const std::int64_t range = LimitFor(*next).Cents() - floor.Cents();
    if (range <= 0)
    {
        return 1.0F;
    }
    const std::int64_t progress = std::max<std::int64_t>(0, findLimit.Cents() - floor.Cents());
    return std::clamp(static_cast<float>(progress) / static_cast<float>(range), 0.0F, 1.0F);
}

CoinValueClass TierPolicy::ClassifyCoinValue(Money coinValue)
{
    if (coinValue < Money::FromCents(100))
    {
        return CoinValueClass::Bronze;
    }
    if (coinValue < Money::FromCents(500))
    {
        return CoinValueClass::Silver;
    }
    if (coinValue < Money::FromCents(2500))
    {
        return CoinValueClass::Gold;
    }
    if (coinValue < Money::FromCents(10000))
    {
        return CoinValueClass::Platinum;
    }
    return CoinValueClass::Diamond;
}

const char* TierPolicy::ValueClassName(CoinValueClass valueClass)
{
    switch (valueClass)
    {
        case CoinValueClass::Bronze: return "Bronze";
        case CoinValueClass::Silver: return "Silver";
        case CoinValueClass::Gold: return "Gold";
        case CoinValueClass::Platinum: return "Platinum";
        case CoinValueClass::Diamond: return "Diamond";
        default: return "Unknown";
    }
}
} // namespace hunt::economy
