#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "hunt/coins/Coin.hpp"

namespace hunt::coins
{
/// Authoritative set of coins for one hunt session.
///
/// Every member is safe to call from several threads at once. Remove() is a
/// single-winner compare-and-remove: for a given id exactly one caller sees true.
/// Queries return copies so callers never hold references into the pool.
class CoinPool
{
public:
    CoinPool() = default;
    CoinPool(const CoinPool&) = delete;
    CoinPool& operator=(const CoinPool&) = delete;

    /// Adds a coin. Rejects duplicate ids, negative values and invalid coordinates.
    [[nodiscard]] bool Add(const Coin& coin, std::string* outError = nullptr);

    /// Replaces the whole pool in one step; readers see either the old or the new contents.
    /// Coins that Add() would reject are skipped. Returns the number of coins accepted.
    std::size_t Populate(const std::vector<Coin>& coins);

    void Clear();

    [[nodiscard]] std::optional<Coin> Get(CoinId id) const;
    [[nodiscard]] bool Contains(CoinId id) const;

    /// Idempotent: removing an absent id returns false.
    bool Remove(CoinId id);

    /// Removes and returns the stored coin. Single winner per id.
    [[nodiscard]] std::optional<Coin> Take(CoinId id);

    /// Like Take(), but only when accept(storedCoin) holds. accept runs under the pool lock
    /// and must not call back into the pool.
    [[nodiscard]] std::optional<Coin> TakeIf(CoinId id, const std::function<bool(const Coin&)>& accept);

    /// Closest coin within maxRadiusMeters (inclusive). Exact distance ties go to the lower id.
    /// Invalid position or a negative/NaN radius yields nullopt.
    [[nodiscard]] std::optional<Coin> Nearest(const engine::geo::GeoPoint& position, double maxRadiusMeters) const;

    /// Coins within radiusMeters ordered by (distance, id).
    [[nodiscard]] std::vector<Coin> WithinRadius(const engine::geo::GeoPoint& position, double radiusMeters) const;

    [[nodiscard]] std::vector<Coin> Snapshot() const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] bool Empty() const { return Size() == 0; }

    /// Grid cell edge in degrees of latitude/longitude.
    void SetCellSizeDegrees(double degrees);

private:
    struct CellKey
    {
        int x = 0;
        int y = 0;

        [[nodiscard]] bool operator==(const CellKey& other) const
        {
            return x == other.x && y == other.y;
        }
    };

    struct CellKeyHash
    {
        [[nodiscard]] std::size_t operator()(const CellKey& key) const
        {
            const std::size_t hx = static_cast<std::size_t>(key.x) * 73856093U;
            const std::size_t hy = static_cast<std::size_t>(key.y) * 19349663U;
            return hx ^ hy;
        }
    };

    struct Candidate
    {
        CoinId id = 0;
        double distance = 0.0;
    };

    [[nodiscard]] static bool CheckCoin(const Coin& coin, std::string* outError);
    [[nodiscard]] CellKey CellFor(const engine::geo::GeoPoint& position) const;
    void RebuildSpatialIndex() const;
    void CollectCandidatesLocked(const engine::geo::GeoPoint& position, double radiusMeters, std::vector<Candidate>& out) const;

    std::unordered_map<CoinId, Coin> m_coins;

    mutable std::unordered_map<CellKey, std::vector<CoinId>, CellKeyHash> m_spatialCells;
    mutable bool m_spatialDirty = true;
    double m_cellSizeDegrees = 0.01;

    mutable std::mutex m_mutex;
};
} // namespace hunt::coins
