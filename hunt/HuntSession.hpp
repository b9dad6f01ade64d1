#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "hunt/coins/CoinPool.hpp"
#include "hunt/economy/CollectionTransaction.hpp"
#include "hunt/proximity/ProximityEngine.hpp"

namespace hunt
{
/// Wires the pool, the engine and the collector for one hunt.
///
/// The find limit and the wallet live outside the hunt core; they are reached
/// through the two hooks below. Without a provider the default limit applies.
class HuntSession
{
public:
    using FindLimitProvider = std::function<economy::Money()>;
    using CreditSink = std::function<void(const economy::CoinCollected&)>;

    HuntSession();
    HuntSession(const HuntSession&) = delete;
    HuntSession& operator=(const HuntSession&) = delete;

    [[nodiscard]] bool Configure(const proximity::ProximityTuning& tuning, std::string* outError = nullptr);

    void SetFindLimitProvider(FindLimitProvider provider) { m_findLimitProvider = std::move(provider); }
    void SetCreditSink(CreditSink sink) { m_creditSink = std::move(sink); }

    /// Replaces the pool contents and clears any previous target. Returns the number of coins accepted.
    std::size_t Begin(const std::vector<coins::Coin>& coins);
    void End();
    [[nodiscard]] bool IsActive() const { return m_active; }

    /// Feeds one location fix to the engine. Rejected fixes are logged and reported as false.
    bool OnLocationFix(double latitude, double longitude, std::optional<double> headingDegrees = std::nullopt);

    [[nodiscard]] economy::CollectionResult AttemptCollect();

    [[nodiscard]] economy::Money CurrentFindLimit() const;

    [[nodiscard]] coins::CoinPool& Pool() { return m_pool; }
    [[nodiscard]] const coins::CoinPool& Pool() const { return m_pool; }
    [[nodiscard]] proximity::ProximityEngine& Engine() { return m_engine; }
    [[nodiscard]] const proximity::ProximityEngine& Engine() const { return m_engine; }
    [[nodiscard]] economy::CollectionTransaction& Collector() { return m_collector; }

private:
    coins::CoinPool m_pool;
    proximity::ProximityEngine m_engine;
    economy::CollectionTransaction m_collector;

    FindLimitProvider m_findLimitProvider;
    CreditSink m_creditSink;
    bool m_active = false;
};
} // namespace hunt
