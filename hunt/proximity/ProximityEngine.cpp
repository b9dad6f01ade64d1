#include "hunt/proximity/ProximityEngine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "hunt/economy/TierPolicy.hpp"

namespace hunt::proximity
{
const char* ZoneName(ProximityZone zone)
{
    switch (zone)
    {
        case ProximityZone::OutOfRange: return "OutOfRange";
        case ProximityZone::Near: return "Near";
        case ProximityZone::Collectible: return "Collectible";
        default: return "Unknown";
    }
}

const char* ZoneDescription(ProximityZone zone)
{
    switch (zone)
    {
        case ProximityZone::OutOfRange: return "Keep searching...";
        case ProximityZone::Near: return "Almost there!";
        case ProximityZone::Collectible: return "In range! Tap to collect!";
        default: return "Unknown";
    }
}

ProximityZone ClassifyZone(double distanceMeters, const ProximityTuning& tuning)
{
    if (distanceMeters <= tuning.collectDistanceMeters)
    {
        return ProximityZone::Collectible;
    }
    if (distanceMeters <= tuning.nearDistanceMeters)
    {
        return ProximityZone::Near;
    }
    return ProximityZone::OutOfRange;
}

ProximityZone ClassifyZone(double distanceMeters, ProximityZone previous, const ProximityTuning& tuning)
{
    const ProximityZone raw = ClassifyZone(distanceMeters, tuning);
    if (raw >= previous)
    {
        return raw;
    }

    // Moving outward: the previous zone holds until its threshold is exceeded by the hysteresis band.
    if (previous == ProximityZone::Collectible &&
        distanceMeters <= tuning.collectDistanceMeters + tuning.hysteresisMeters)
    {
        return ProximityZone::Collectible;
    }
    if (distanceMeters <= tuning.nearDistanceMeters + tuning.hysteresisMeters)
    {
        return ProximityZone::Near;
    }
    return ProximityZone::OutOfRange;
}

bool ProximityEngine::SetTuning(const ProximityTuning& tuning, std::string* outError)
{
    if (!tuning.Validate(outError))
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_tuning = tuning;
    return true;
}

ProximityTuning ProximityEngine::Tuning() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_tuning;
}

bool ProximityEngine::Update(
    const engine::geo::GeoPoint& playerPosition,
    std::optional<double> headingDegrees,
    const coins::CoinPool& pool,
    economy::Money findLimit,
    std::string* outError
)
{
    std::string rejection;
    if (!engine::geo::IsValidCoordinate(playerPosition))
    {
        rejection = "Player position is not a valid coordinate";
    }
    else if (headingDegrees.has_value() && !std::isfinite(*headingDegrees))
    {
        rejection = "Device heading is not finite";
    }

    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!rejection.empty())
        {
            ++m_stats.rejectedTicks;
            if (outError != nullptr)
            {
                *outError = rejection;
            }
            return false;
        }

        const ProximitySnapshot previous = m_state;
        if (previous.target.has_value() &&
            std::find(m_pendingCollections.begin(), m_pendingCollections.end(), previous.target->id) !=
                m_pendingCollections.end() &&
            !pool.Contains(previous.target->id))
        {
            // Taken by a collection that has not reported back yet; it clears the target.
            ++m_stats.acceptedTicks;
            return true;
        }

        bool pinned = false;
        const std::optional<coins::Coin> target = SelectTarget(playerPosition, pool, previous, pinned);

        ProximitySnapshot next;
        if (target.has_value())
        {
            const bool sameTarget = previous.target.has_value() && previous.target->id == target->id;

            next.target = target;
            next.pinned = pinned;
            next.distanceMeters = engine::geo::DistanceMeters(playerPosition, target->position);
            next.bearingDegrees = engine::geo::BearingDegrees(playerPosition, target->position);
            if (headingDegrees.has_value())
            {
                next.relativeBearingDegrees = engine::geo::RelativeBearing(
                    next.bearingDegrees,
                    engine::geo::NormalizeDegrees(*headingDegrees)
                );
            }
            next.zone = ClassifyZone(
                next.distanceMeters,
                sameTarget ? previous.zone : ProximityZone::OutOfRange,
                m_tuning
            );
            next.locked = !economy::TierPolicy::IsCollectible(target->value, findLimit);
        }

        const bool targetChanged =
            previous.target.has_value() != next.target.has_value() ||
            (previous.target.has_value() && next.target.has_value() && previous.target->id != next.target->id);
        const bool wasInRange = previous.target.has_value() && previous.zone == ProximityZone::Collectible;
        const bool isInRange = next.target.has_value() && next.zone == ProximityZone::Collectible;

        if (wasInRange && (targetChanged || !isInRange))
        {
            const coins::Coin exited = *previous.target;
            Log("Exited collection range: " + exited.DisplayName());
            notifications.push_back([exited](const ProximityListener& l) {
                if (l.onExitedCollectionRange) l.onExitedCollectionRange(exited);
            });
        }
        if (targetChanged && next.target.has_value())
        {
            const coins::Coin selected = *next.target;
            Log("Target set: " + selected.DisplayName() + " at " + engine::geo::FormatDistance(next.distanceMeters) +
                (next.pinned ? " (pinned)" : ""));
            notifications.push_back([selected](const ProximityListener& l) {
                if (l.onTargetSet) l.onTargetSet(selected);
            });
        }
        if (next.zone != previous.zone)
        {
            const ProximityZone oldZone = previous.zone;
            const ProximityZone newZone = next.zone;
            Log(std::string("Zone changed: ") + ZoneName(oldZone) + " -> " + ZoneName(newZone));
            notifications.push_back([oldZone, newZone](const ProximityListener& l) {
                if (l.onZoneChanged) l.onZoneChanged(oldZone, newZone);
            });
        }
        if (isInRange && (targetChanged || !wasInRange))
        {
            const coins::Coin entered = *next.target;
            Log("Entered collection range: " + entered.DisplayName());
            notifications.push_back([entered](const ProximityListener& l) {
                if (l.onEnteredCollectionRange) l.onEnteredCollectionRange(entered);
            });
        }
        if (next.locked != previous.locked)
        {
            const bool locked = next.locked;
            notifications.push_back([locked](const ProximityListener& l) {
                if (l.onLockStateChanged) l.onLockStateChanged(locked);
            });
        }
        if (next.target.has_value())
        {
            const double distance = next.distanceMeters;
            const double bearing = next.bearingDegrees;
            notifications.push_back([distance, bearing](const ProximityListener& l) {
                if (l.onDistanceUpdated) l.onDistanceUpdated(distance, bearing);
            });
        }
        if (targetChanged && !next.target.has_value())
        {
            Log("Target cleared");
            notifications.push_back([](const ProximityListener& l) {
                if (l.onTargetCleared) l.onTargetCleared();
            });
        }

        if (targetChanged)
        {
            ++m_stats.targetChanges;
        }
        ++m_stats.acceptedTicks;
        m_state = next;
    }

    Dispatch(notifications);
    return true;
}

std::optional<coins::Coin> ProximityEngine::SelectTarget(
    const engine::geo::GeoPoint& playerPosition,
    const coins::CoinPool& pool,
    const ProximitySnapshot& current,
    bool& outPinned
)
{
    outPinned = false;

    std::optional<coins::Coin> live;
    if (current.target.has_value())
    {
        live = pool.Get(current.target->id);
        if (!live.has_value())
        {
            ++m_stats.targetLosses;
            std::cout << "ProximityEngine: WARNING - target coin " << current.target->id
                      << " left the pool outside a collection, reselecting\n";
            if (m_pinRequest == current.target->id)
            {
                m_pinRequest.reset();
            }
        }
    }

    if (m_pinRequest.has_value())
    {
        if (live.has_value() && live->id == *m_pinRequest)
        {
            outPinned = true;
            return live;
        }

        std::optional<coins::Coin> pinned = pool.Get(*m_pinRequest);
        if (pinned.has_value())
        {
            outPinned = true;
            return pinned;
        }

        Log("Pinned coin " + std::to_string(*m_pinRequest) + " is gone, resuming nearest selection");
        m_pinRequest.reset();
    }

    if (live.has_value())
    {
        const double distance = engine::geo::DistanceMeters(playerPosition, live->position);
        if (distance > m_tuning.trackingRadiusMeters + m_tuning.hysteresisMeters)
        {
            Log("Released " + live->DisplayName() + ", beyond tracking radius");
            live.reset();
        }
        else
        {
            if (m_tuning.followNearest)
            {
                std::optional<coins::Coin> nearest = pool.Nearest(playerPosition, m_tuning.trackingRadiusMeters);
                if (nearest.has_value() && nearest->id != live->id &&
                    engine::geo::DistanceMeters(playerPosition, nearest->position) + m_tuning.retargetMarginMeters < distance)
                {
                    return nearest;
                }
            }
            return live;
        }
    }

    return pool.Nearest(playerPosition, m_tuning.trackingRadiusMeters);
}

bool ProximityEngine::PinTarget(coins::CoinId id, const coins::CoinPool& pool)
{
    if (!pool.Contains(id))
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_pinRequest = id;
    Log("Pin requested for coin " + std::to_string(id));
    return true;
}

void ProximityEngine::ClearPin()
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_pinRequest.reset();
    m_state.pinned = false;
}

void ProximityEngine::BeginCollection(coins::CoinId id)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_pendingCollections.push_back(id);
}

void ProximityEngine::AbortCollection(coins::CoinId id)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    static_cast<void>(ErasePending(id));
}

bool ProximityEngine::ErasePending(coins::CoinId id)
{
    const auto it = std::find(m_pendingCollections.begin(), m_pendingCollections.end(), id);
    if (it == m_pendingCollections.end())
    {
        return false;
    }
    m_pendingCollections.erase(it);
    return true;
}

void ProximityEngine::AppendLeaveNotifications(const ProximitySnapshot& previous, std::vector<Notification>& notifications)
{
    if (!previous.target.has_value())
    {
        return;
    }

    if (previous.zone == ProximityZone::Collectible)
    {
        const coins::Coin exited = *previous.target;
        notifications.push_back([exited](const ProximityListener& l) {
            if (l.onExitedCollectionRange) l.onExitedCollectionRange(exited);
        });
    }
    if (previous.zone != ProximityZone::OutOfRange)
    {
        const ProximityZone oldZone = previous.zone;
        notifications.push_back([oldZone](const ProximityListener& l) {
            if (l.onZoneChanged) l.onZoneChanged(oldZone, ProximityZone::OutOfRange);
        });
    }
    if (previous.locked)
    {
        notifications.push_back([](const ProximityListener& l) {
            if (l.onLockStateChanged) l.onLockStateChanged(false);
        });
    }
}

void ProximityEngine::NotifyTargetCollected(const coins::Coin& coin, economy::Money creditedValue)
{
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        static_cast<void>(ErasePending(coin.id));

        const bool wasTarget = m_state.target.has_value() && m_state.target->id == coin.id;
        if (wasTarget)
        {
            AppendLeaveNotifications(m_state, notifications);
        }

        notifications.push_back([coin, creditedValue](const ProximityListener& l) {
            if (l.onTargetCollected) l.onTargetCollected(coin, creditedValue);
        });

        if (wasTarget)
        {
            notifications.push_back([](const ProximityListener& l) {
                if (l.onTargetCleared) l.onTargetCleared();
            });
            m_state = ProximitySnapshot{};
            ++m_stats.targetChanges;
        }
        if (m_pinRequest == coin.id)
        {
            m_pinRequest.reset();
        }

        Log("Collected " + coin.DisplayName() + ", credited " + creditedValue.ToString());
    }

    Dispatch(notifications);
}

void ProximityEngine::Reset()
{
    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state.target.has_value())
        {
            AppendLeaveNotifications(m_state, notifications);
            notifications.push_back([](const ProximityListener& l) {
                if (l.onTargetCleared) l.onTargetCleared();
            });
            ++m_stats.targetChanges;
            Log("Target cleared on reset");
        }
        m_state = ProximitySnapshot{};
        m_pinRequest.reset();
    }

    Dispatch(notifications);
}

ListenerId ProximityEngine::AddListener(ProximityListener listener)
{
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    const ListenerId id = m_nextListenerId++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

bool ProximityEngine::RemoveListener(ListenerId id)
{
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    const auto it = std::find_if(m_listeners.begin(), m_listeners.end(), [id](const auto& entry) {
        return entry.first == id;
    });
    if (it == m_listeners.end())
    {
        return false;
    }
    m_listeners.erase(it);
    return true;
}

bool ProximityEngine::HasTarget() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.target.has_value();
}

std::optional<coins::Coin> ProximityEngine::CurrentTarget() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.target;
}

ProximityZone ProximityEngine::CurrentZone() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.zone;
}

std::optional<double> ProximityEngine::CurrentDistance() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_state.target.has_value())
    {
        return std::nullopt;
    }
    return m_state.distanceMeters;
}

std::optional<double> ProximityEngine::CurrentBearing() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_state.target.has_value())
    {
        return std::nullopt;
    }
    return m_state.bearingDegrees;
}

std::optional<double> ProximityEngine::CurrentRelativeBearing() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.relativeBearingDegrees;
}

bool ProximityEngine::IsLocked() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.locked;
}

bool ProximityEngine::IsPinned() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.pinned;
}

ProximitySnapshot ProximityEngine::Snapshot() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

ProximityStats ProximityEngine::Stats() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_stats;
}

std::string ProximityEngine::DirectionText() const
{
    const ProximitySnapshot snapshot = Snapshot();
    if (!snapshot.target.has_value())
    {
        return "No coins nearby";
    }
    return engine::geo::FormatDistance(snapshot.distanceMeters) + " " +
           engine::geo::CardinalDirection(snapshot.bearingDegrees);
}

void ProximityEngine::Dispatch(const std::vector<Notification>& notifications) const
{
    if (notifications.empty())
    {
        return;
    }

    std::vector<ProximityListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        listeners.reserve(m_listeners.size());
        for (const auto& [id, listener] : m_listeners)
        {
            listeners.push_back(listener);
        }
    }

    for (const Notification& notification : notifications)
    {
        for (const ProximityListener& listener : listeners)
        {
            notification(listener);
        }
    }
}

void ProximityEngine::Log(const std::string& message) const
{
    if (m_tuning.debugLogging)
    {
        std::cout << "ProximityEngine: " << message << "\n";
    }
}
} // namespace hunt::proximity
