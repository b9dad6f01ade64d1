#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "engine/geo/GeoMath.hpp"
#include "hunt/economy/Money.hpp"

namespace hunt::coins
{
using CoinId = std::uint64_t;

enum class CoinType : std::uint8_t
{
    Fixed = 0, ///< Credited at face value.
    Pool       ///< Credited value is rolled at collection time.
};

[[nodiscard]] inline const char* CoinTypeId(CoinType type)
{
    switch (type)
    {
        case CoinType::Fixed: return "fixed";
        case CoinType::Pool: return "pool";
        default: return "unknown";
    }
}

[[nodiscard]] inline std::optional<CoinType> ParseCoinType(const std::string& id)
{
    if (id == "fixed")
    {
        return CoinType::Fixed;
    }
    if (id == "pool")
    {
        return CoinType::Pool;
    }
    return std::nullopt;
}

/// One placed treasure item. Immutable once it enters a pool; whether it is locked
/// for the player is derived from the find limit on demand and never stored here.
struct Coin
{
    CoinId id = 0;
    engine::geo::GeoPoint position;
    economy::Money value;
    CoinType type = CoinType::Fixed;
    economy::Money poolContribution; ///< Base for the pool roll; zero falls back to value.
    std::string label; ///< Hider or sponsor name, display only.

    /// "$10.00 #42"
    [[nodiscard]] std::string DisplayName() const
    {
        return value.ToString() + " #" + std::to_string(id);
    }
};
} // namespace hunt::coins
