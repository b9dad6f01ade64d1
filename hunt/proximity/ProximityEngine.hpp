#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/geo/GeoMath.hpp"
#include "hunt/coins/CoinPool.hpp"
#include "hunt/economy/Money.hpp"
#include "hunt/proximity/ProximityTuning.hpp"

namespace hunt::proximity
{
/// Ordered from loosest to tightest.
enum class ProximityZone : std::uint8_t
{
    OutOfRange = 0,
    Near,
    Collectible
};

[[nodiscard]] const char* ZoneName(ProximityZone zone);
[[nodiscard]] const char* ZoneDescription(ProximityZone zone);

/// Pure threshold classification, no hysteresis.
[[nodiscard]] ProximityZone ClassifyZone(double distanceMeters, const ProximityTuning& tuning);

/// Entering a tighter zone needs the raw threshold; leaving one needs threshold + hysteresis.
[[nodiscard]] ProximityZone ClassifyZone(double distanceMeters, ProximityZone previous, const ProximityTuning& tuning);

/// Notification hooks. Any hook may be left empty.
struct ProximityListener
{
    std::function<void(const coins::Coin&)> onTargetSet;
    std::function<void()> onTargetCleared;
    std::function<void(const coins::Coin&, economy::Money)> onTargetCollected;
    std::function<void(ProximityZone, ProximityZone)> onZoneChanged;
    std::function<void(double, double)> onDistanceUpdated; ///< distance meters, bearing degrees
    std::function<void(const coins::Coin&)> onEnteredCollectionRange;
    std::function<void(const coins::Coin&)> onExitedCollectionRange;
    std::function<void(bool)> onLockStateChanged;
};

using ListenerId = std::uint32_t;
constexpr ListenerId kInvalidListenerId = 0;

/// Consistent copy of the engine state taken under one lock.
struct ProximitySnapshot
{
    std::optional<coins::Coin> target;
    bool pinned = false;
    ProximityZone zone = ProximityZone::OutOfRange;
    double distanceMeters = 0.0;
    double bearingDegrees = 0.0;
    std::optional<double> relativeBearingDegrees;
    bool locked = false;
};

struct ProximityStats
{
    std::uint64_t acceptedTicks = 0;
    std::uint64_t rejectedTicks = 0;
    std::uint64_t targetChanges = 0;
    std::uint64_t targetLosses = 0;
};

/// Tracks one target coin relative to the player.
///
/// States are NoTarget and Tracking(coin, zone). Update() is driven by a single tick
/// source; queries, pinning and NotifyTargetCollected() may come from other threads.
/// Each Update() is atomic: a rejected tick leaves every field untouched.
/// Notifications are delivered after the new state is committed, outside the state lock,
/// so listeners may query the engine.
class ProximityEngine
{
public:
    ProximityEngine() = default;
    ProximityEngine(const ProximityEngine&) = delete;
    ProximityEngine& operator=(const ProximityEngine&) = delete;

    /// Rejects invalid thresholds and keeps the previous tuning.
    [[nodiscard]] bool SetTuning(const ProximityTuning& tuning, std::string* outError = nullptr);
    [[nodiscard]] ProximityTuning Tuning() const;

    /// One sensor tick. Returns false, and leaves state untouched, on malformed input.
    /// headingDegrees is nullopt when no compass is available; zones do not depend on it.
    bool Update(
        const engine::geo::GeoPoint& playerPosition,
        std::optional<double> headingDegrees,
        const coins::CoinPool& pool,
        economy::Money findLimit,
        std::string* outError = nullptr
    );

    /// Overrides nearest-coin selection from the next tick on. False if the coin is not in the pool.
    [[nodiscard]] bool PinTarget(coins::CoinId id, const coins::CoinPool& pool);
    void ClearPin();

    /// Brackets a collection in flight. Between BeginCollection() and either
    /// NotifyTargetCollected() or AbortCollection(), a tick that finds the target missing
    /// from the pool keeps the current state instead of treating it as a lost target.
    void BeginCollection(coins::CoinId id);
    void AbortCollection(coins::CoinId id);

    /// Called after the coin left the pool through a successful collection.
    void NotifyTargetCollected(const coins::Coin& coin, economy::Money creditedValue);

    /// Drops the target (session start/end). A tracked target leaves with the same
    /// exited/zone/lock notifications as a collection, then onTargetCleared.
    /// Listeners and stats are kept.
    void Reset();

    [[nodiscard]] ListenerId AddListener(ProximityListener listener);
    bool RemoveListener(ListenerId id);

    [[nodiscard]] bool HasTarget() const;
    [[nodiscard]] std::optional<coins::Coin> CurrentTarget() const;
    [[nodiscard]] ProximityZone CurrentZone() const;
    [[nodiscard]] std::optional<double> CurrentDistance() const;
    [[nodiscard]] std::optional<double> CurrentBearing() const;
    [[nodiscard]] std::optional<double> CurrentRelativeBearing() const;
    [[nodiscard]] bool IsLocked() const;
    [[nodiscard]] bool IsPinned() const;
    [[nodiscard]] ProximitySnapshot Snapshot() const;
    [[nodiscard]] ProximityStats Stats() const;

    /// "12m NE", or "No coins nearby" without a target.
    [[nodiscard]] std::string DirectionText() const;

private:
    using Notification = std::function<void(const ProximityListener&)>;

    [[nodiscard]] std::optional<coins::Coin> SelectTarget(
        const engine::geo::GeoPoint& playerPosition,
        const coins::CoinPool& pool,
        const ProximitySnapshot& current,
        bool& outPinned
    );
    /// Exited range, zone back to OutOfRange and unlock, as applicable to the old target.
    static void AppendLeaveNotifications(const ProximitySnapshot& previous, std::vector<Notification>& notifications);
    [[nodiscard]] bool ErasePending(coins::CoinId id);
    void Dispatch(const std::vector<Notification>& notifications) const;
    void Log(const std::string& message) const;

    mutable std::mutex m_stateMutex;
    ProximityTuning m_tuning{};
    ProximitySnapshot m_state{};
    std::optional<coins::CoinId> m_pinRequest;
    std::vector<coins::CoinId> m_pendingCollections;
    ProximityStats m_stats{};

    mutable std::mutex m_listenerMutex;
    std::vector<std::pair<ListenerId, ProximityListener>> m_listeners;
    ListenerId m_nextListenerId = 1;
};
} // namespace hunt::proximity
