#include "hunt/economy/CollectionTransaction.hpp"

#include <iostream>
#include <optional>
#include <utility>

#include "hunt/economy/TierPolicy.hpp"
#include "hunt/proximity/ProximityEngine.hpp"

namespace hunt::economy
{
const char* DenialReasonName(CollectionDenialReason reason)
{
    switch (reason)
    {
        case CollectionDenialReason::NotTargeted: return "NotTargeted";
        case CollectionDenialReason::OutOfRange: return "OutOfRange";
        case CollectionDenialReason::Locked: return "Locked";
        case CollectionDenialReason::AlreadyCollected: return "AlreadyCollected";
        default: return "Unknown";
    }
}

const char* DenialMessage(CollectionDenialReason reason)
{
    switch (reason)
    {
        case CollectionDenialReason::NotTargeted: return "No treasure in sight.";
        case CollectionDenialReason::OutOfRange: return "Get closer to collect this treasure.";
        case CollectionDenialReason::Locked: return "This treasure be above yer limit, matey!";
        case CollectionDenialReason::AlreadyCollected: return "This coin is no longer available.";
        default: return "";
    }
}

CollectionTransaction::CollectionTransaction(proximity::ProximityEngine& engine, coins::CoinPool& pool)
    : m_engine(engine)
    , m_pool(pool)
{
}

void CollectionTransaction::SetValuer(std::unique_ptr<CoinValuer> valuer)
{
    if (valuer)
    {
        m_valuer = std::move(valuer);
    }
}

CollectionResult CollectionTransaction::Attempt(Money findLimit)
{
    return Attempt(m_engine.Snapshot(), findLimit);
}

CollectionResult CollectionTransaction::Attempt(const proximity::ProximitySnapshot& snapshot, Money findLimit)
{
    if (!snapshot.target.has_value())
    {
        return CollectionDenied{CollectionDenialReason::NotTargeted};
    }
    if (snapshot.zone != proximity::ProximityZone::Collectible)
    {
        return CollectionDenied{CollectionDenialReason::OutOfRange};
    }

    const coins::Coin& expected = *snapshot.target;
    CollectionDenialReason denial = CollectionDenialReason::AlreadyCollected;

    m_engine.BeginCollection(expected.id);
    std::optional<coins::Coin> taken = m_pool.TakeIf(expected.id, [&](const coins::Coin& stored) {
        if (stored.position.latitude != expected.position.latitude ||
            stored.position.longitude != expected.position.longitude)
        {
            // Same id, different coin: the pool was repopulated since the snapshot.
            denial = CollectionDenialReason::AlreadyCollected;
            return false;
        }
        // The limit passed in wins over the engine's cached lock flag, which may be a tick old.
        if (!TierPolicy::IsCollectible(stored.value, findLimit))
        {
            denial = CollectionDenialReason::Locked;
            return false;
        }
        return true;
    });

    if (!taken.has_value())
    {
        m_engine.AbortCollection(expected.id);
        return CollectionDenied{denial};
    }

    const Money credited = m_valuer->Determine(*taken);
    m_collectedCount.fetch_add(1, std::memory_order_acq_rel);
    m_creditedCents.fetch_add(credited.Cents(), std::memory_order_acq_rel);

    m_engine.NotifyTargetCollected(*taken, credited);

    std::cout << "CollectionTransaction: Collected coin " << taken->id << " (" << coins::CoinTypeId(taken->type)
              << ") for " << credited.ToString() << "\n";
    return CoinCollected{*taken, credited};
}
} // namespace hunt::economy
