#include "hunt/HuntSession.hpp"

#include <iostream>

#include "hunt/economy/TierPolicy.hpp"

namespace hunt
{
HuntSession::HuntSession()
    : m_collector(m_engine, m_pool)
{
}

bool HuntSession::Configure(const proximity::ProximityTuning& tuning, std::string* outError)
{
    return m_engine.SetTuning(tuning, outError);
}

std::size_t HuntSession::Begin(const std::vector<coins::Coin>& coins)
{
    m_engine.Reset();
    const std::size_t accepted = m_pool.Populate(coins);
    if (accepted != coins.size())
    {
        std::cout << "HuntSession: WARNING - " << (coins.size() - accepted) << " of " << coins.size()
                  << " coins rejected while populating the pool\n";
    }
    m_active = true;
    std::cout << "HuntSession: Started with " << accepted << " coins\n";
    return accepted;
}

void HuntSession::End()
{
    if (!m_active)
    {
        return;
    }
    m_engine.Reset();
    m_pool.Clear();
    m_active = false;
    std::cout << "HuntSession: Ended, collected " << m_collector.CollectedCount() << " coins worth "
              << m_collector.TotalCredited().ToString() << "\n";
}

bool HuntSession::OnLocationFix(double latitude, double longitude, std::optional<double> headingDegrees)
{
    std::string error;
    if (!m_engine.Update({latitude, longitude}, headingDegrees, m_pool, CurrentFindLimit(), &error))
    {
        std::cout << "HuntSession: WARNING - tick rejected: " << error << "\n";
        return false;
    }
    return true;
}

economy::CollectionResult HuntSession::AttemptCollect()
{
    economy::CollectionResult result = m_collector.Attempt(CurrentFindLimit());
    if (const auto* collected = std::get_if<economy::CoinCollected>(&result))
    {
        if (m_creditSink)
        {
            m_creditSink(*collected);
        }
    }
    return result;
}

economy::Money HuntSession::CurrentFindLimit() const
{
    if (m_findLimitProvider)
    {
        return m_findLimitProvider();
    }
    return economy::TierPolicy::kDefaultFindLimit;
}
} // namespace hunt
