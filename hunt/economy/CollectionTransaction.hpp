#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <variant>

#include "hunt/coins/CoinPool.hpp"
#include "hunt/economy/CoinValuer.hpp"
#include "hunt/economy/Money.hpp"

namespace hunt::proximity
{
class ProximityEngine;
struct ProximitySnapshot;
}

namespace hunt::economy
{
enum class CollectionDenialReason : std::uint8_t
{
    NotTargeted = 0,
    OutOfRange,
    Locked,
    AlreadyCollected
};

struct CoinCollected
{
    coins::Coin coin;
    Money creditedValue;
};

struct CollectionDenied
{
    CollectionDenialReason reason = CollectionDenialReason::NotTargeted;
};

using CollectionResult = std::variant<CoinCollected, CollectionDenied>;

[[nodiscard]] inline bool IsCollected(const CollectionResult& result)
{
    return std::holds_alternative<CoinCollected>(result);
}

[[nodiscard]] const char* DenialReasonName(CollectionDenialReason reason);
[[nodiscard]] const char* DenialMessage(CollectionDenialReason reason);

/// Turns the engine's current target into a credit, at most once per coin.
///
/// Gates run against a single engine snapshot, then the coin is taken from the pool
/// before anything is credited. The lock check and the credit use the coin the pool
/// hands back, not the snapshot copy; a pool entry whose position no longer matches the
/// snapshot counts as AlreadyCollected. Pool removal is the only point of truth:
/// concurrent attempts on one coin produce one CoinCollected and AlreadyCollected for
/// everyone else.
class CollectionTransaction
{
public:
    CollectionTransaction(proximity::ProximityEngine& engine, coins::CoinPool& pool);

    /// Gates against the engine's current state.
    [[nodiscard]] CollectionResult Attempt(Money findLimit);

    /// Gates against a state captured earlier, e.g. when the user pressed collect.
    [[nodiscard]] CollectionResult Attempt(const proximity::ProximitySnapshot& engineState, Money findLimit);

    /// Replaces the value roller, e.g. with a seeded one for replays.
    void SetValuer(std::unique_ptr<CoinValuer> valuer);

    [[nodiscard]] std::uint64_t CollectedCount() const { return m_collectedCount.load(std::memory_order_acquire); }
    [[nodiscard]] Money TotalCredited() const { return Money::FromCents(m_creditedCents.load(std::memory_order_acquire)); }

private:
    proximity::ProximityEngine& m_engine;
    coins::CoinPool& m_pool;
    std::unique_ptr<CoinValuer> m_valuer = std::make_unique<CoinValuer>();

    std::atomic<std::uint64_t> m_collectedCount{0};
    std::atomic<std::int64_t> m_creditedCents{0};
};
} // namespace hunt::economy
