#include "hunt/coins/CoinPool.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace hunt::coins
{
namespace
{
// Degree length on the haversine sphere, not the 111320 m survey figure, so spans never undershoot.
constexpr double kMetersPerDegree = engine::geo::kEarthRadiusMeters * std::numbers::pi / 180.0;
constexpr double kSpanSafetyFactor = 1.05;
constexpr double kPolarCutoffLatitude = 85.0;
constexpr long long kMaxCellsPerQuery = 4096;

int CellCoord(double value, double cellSize)
{
    return static_cast<int>(std::floor(value / std::max(1.0e-6, cellSize)));
}
} // namespace

bool CoinPool::CheckCoin(const Coin& coin, std::string* outError)
{
    if (coin.value.IsNegative() || coin.poolContribution.IsNegative())
    {
        if (outError != nullptr)
        {
            *outError = "Coin " + std::to_string(coin.id) + " has a negative value";
        }
        return false;
    }
    if (!engine::geo::IsValidCoordinate(coin.position))
    {
        if (outError != nullptr)
        {
            *outError = "Coin " + std::to_string(coin.id) + " has invalid coordinates";
        }
        return false;
    }
    return true;
}

bool CoinPool::Add(const Coin& coin, std::string* outError)
{
    if (!CheckCoin(coin, outError))
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_coins.contains(coin.id))
    {
        if (outError != nullptr)
        {
            *outError = "Duplicate coin id " + std::to_string(coin.id);
        }
        return false;
    }

    m_coins.emplace(coin.id, coin);
    m_spatialDirty = true;
    return true;
}

std::size_t CoinPool::Populate(const std::vector<Coin>& coins)
{
    std::unordered_map<CoinId, Coin> next;
    next.reserve(coins.size());
    for (const Coin& coin : coins)
    {
        if (CheckCoin(coin, nullptr))
        {
            next.emplace(coin.id, coin);
        }
    }

    const std::size_t accepted = next.size();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_coins.swap(next);
    m_spatialCells.clear();
    m_spatialDirty = true;
    return accepted;
}

void CoinPool::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_coins.clear();
    m_spatialCells.clear();
    m_spatialDirty = true;
}

std::optional<Coin> CoinPool::Get(CoinId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_coins.find(id);
    if (it == m_coins.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool CoinPool::Contains(CoinId id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_coins.contains(id);
}

bool CoinPool::Remove(CoinId id)
{
    return Take(id).has_value();
}

std::optional<Coin> CoinPool::Take(CoinId id)
{
    return TakeIf(id, nullptr);
}

std::optional<Coin> CoinPool::TakeIf(CoinId id, const std::function<bool(const Coin&)>& accept)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_coins.find(id);
    if (it == m_coins.end())
    {
        return std::nullopt;
    }
    if (accept && !accept(it->second))
    {
        return std::nullopt;
    }

    Coin taken = std::move(it->second);
    m_coins.erase(it);
    m_spatialDirty = true;
    return taken;
}

std::optional<Coin> CoinPool::Nearest(const engine::geo::GeoPoint& position, double maxRadiusMeters) const
{
    if (!engine::geo::IsValidCoordinate(position) || !std::isfinite(maxRadiusMeters) || maxRadiusMeters < 0.0)
    {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Candidate> candidates;
    CollectCandidatesLocked(position, maxRadiusMeters, candidates);
    if (candidates.empty())
    {
        return std::nullopt;
    }

    const auto best = std::min_element(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance)
        {
            return a.distance < b.distance;
        }
        return a.id < b.id;
    });
    return m_coins.at(best->id);
}

std::vector<Coin> CoinPool::WithinRadius(const engine::geo::GeoPoint& position, double radiusMeters) const
{
    if (!engine::geo::IsValidCoordinate(position) || !std::isfinite(radiusMeters) || radiusMeters < 0.0)
    {
        return {};
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<Candidate> candidates;
    CollectCandidatesLocked(position, radiusMeters, candidates);
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance)
        {
            return a.distance < b.distance;
        }
        return a.id < b.id;
    });

    std::vector<Coin> result;
    result.reserve(candidates.size());
    for (const Candidate& candidate : candidates)
    {
        result.push_back(m_coins.at(candidate.id));
    }
    return result;
}

std::vector<Coin> CoinPool::Snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Coin> result;
    result.reserve(m_coins.size());
    for (const auto& [id, coin] : m_coins)
    {
        result.push_back(coin);
    }
    std::sort(result.begin(), result.end(), [](const Coin& a, const Coin& b) { return a.id < b.id; });
    return result;
}

std::size_t CoinPool::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_coins.size();
}

void CoinPool::SetCellSizeDegrees(double degrees)
{
    if (!std::isfinite(degrees) || degrees <= 0.0)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cellSizeDegrees = degrees;
    m_spatialDirty = true;
}

CoinPool::CellKey CoinPool::CellFor(const engine::geo::GeoPoint& position) const
{
    return CellKey{CellCoord(position.longitude, m_cellSizeDegrees), CellCoord(position.latitude, m_cellSizeDegrees)};
}

void CoinPool::RebuildSpatialIndex() const
{
    if (!m_spatialDirty)
    {
        return;
    }

    m_spatialCells.clear();
    for (const auto& [id, coin] : m_coins)
    {
        m_spatialCells[CellFor(coin.position)].push_back(id);
    }
    m_spatialDirty = false;
}

void CoinPool::CollectCandidatesLocked(
    const engine::geo::GeoPoint& position,
    double radiusMeters,
    std::vector<Candidate>& out
) const
{
    out.clear();
    if (m_coins.empty())
    {
        return;
    }

    auto appendIfInRange = [&](CoinId id, const Coin& coin) {
        const double distance = engine::geo::DistanceMeters(position, coin.position);
        if (distance <= radiusMeters)
        {
            out.push_back(Candidate{id, distance});
        }
    };

    auto fullScan = [&]() {
        for (const auto& [id, coin] : m_coins)
        {
            appendIfInRange(id, coin);
        }
    };

    const double latSpan = radiusMeters / kMetersPerDegree * kSpanSafetyFactor;
    const double minLat = position.latitude - latSpan;
    const double maxLat = position.latitude + latSpan;
    if (minLat <= -kPolarCutoffLatitude || maxLat >= kPolarCutoffLatitude)
    {
        fullScan();
        return;
    }

    const double worstCos = std::cos(std::max(std::abs(minLat), std::abs(maxLat)) * std::numbers::pi / 180.0);
    const double lonSpan = radiusMeters / (kMetersPerDegree * worstCos) * kSpanSafetyFactor;
    const double minLon = position.longitude - lonSpan;
    const double maxLon = position.longitude + lonSpan;
    if (minLon < -180.0 || maxLon > 180.0)
    {
        // Query wraps the antimeridian; cells do not.
        fullScan();
        return;
    }

    const int minX = CellCoord(minLon, m_cellSizeDegrees) - 1;
    const int maxX = CellCoord(maxLon, m_cellSizeDegrees) + 1;
    const int minY = CellCoord(minLat, m_cellSizeDegrees) - 1;
    const int maxY = CellCoord(maxLat, m_cellSizeDegrees) + 1;

    const long long cellCount = static_cast<long long>(maxX - minX + 1) * static_cast<long long>(maxY - minY + 1);
    if (cellCount > kMaxCellsPerQuery || cellCount > static_cast<long long>(m_coins.size()) * 4)
    {
        fullScan();
        return;
    }

    RebuildSpatialIndex();
    for (int y = minY; y <= maxY; ++y)
    {
        for (int x = minX; x <= maxX; ++x)
        {
            const auto cellIt = m_spatialCells.find(CellKey{x, y});
            if (cellIt == m_spatialCells.end())
            {
                continue;
            }
            for (const CoinId id : cellIt->second)
            {
                appendIfInRange(id, m_coins.at(id));
            }
        }
    }
}
} // namespace hunt::coins
