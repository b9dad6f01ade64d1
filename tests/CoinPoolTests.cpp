#include "hunt/coins/CoinPool.hpp"

#include <atomic>
#include <limits>
#include <random>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace hunt::coins::test
{
namespace
{
Coin MakeCoin(CoinId id, double latitude, double longitude, std::int64_t cents = 100)
{
    Coin coin;
    coin.id = id;
    coin.position = {latitude, longitude};
    coin.value = economy::Money::FromCents(cents);
    return coin;
}

/// Linear scan with the same tie rule, used as the reference for the grid.
std::optional<CoinId> BruteForceNearest(const std::vector<Coin>& coins, const engine::geo::GeoPoint& from, double radius)
{
    std::optional<CoinId> best;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (const Coin& coin : coins)
    {
        const double d = engine::geo::DistanceMeters(from, coin.position);
        if (d > radius)
        {
            continue;
        }
        if (d < bestDistance || (d == bestDistance && coin.id < *best))
        {
            best = coin.id;
            bestDistance = d;
        }
    }
    return best;
}
} // namespace

TEST(CoinPool, AddRejectsBadCoins)
{
    CoinPool pool;
    std::string error;

    EXPECT_TRUE(pool.Add(MakeCoin(1, 0.0, 0.0), &error));
    EXPECT_FALSE(pool.Add(MakeCoin(1, 0.1, 0.1), &error));
    EXPECT_NE(error.find("Duplicate"), std::string::npos);

    EXPECT_FALSE(pool.Add(MakeCoin(2, 0.0, 0.0, -1), &error));
    EXPECT_FALSE(pool.Add(MakeCoin(3, 91.0, 0.0), &error));
    EXPECT_FALSE(pool.Add(MakeCoin(4, 0.0, std::numeric_limits<double>::quiet_NaN()), &error));

    EXPECT_EQ(pool.Size(), 1U);
}

TEST(CoinPool, PopulateReplacesContents)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(99, 1.0, 1.0)));

    const std::size_t accepted = pool.Populate({MakeCoin(1, 0.0, 0.0), MakeCoin(2, 0.0, 0.001), MakeCoin(2, 0.0, 0.002)});
    EXPECT_EQ(accepted, 2U);
    EXPECT_FALSE(pool.Contains(99));

    const std::vector<Coin> snapshot = pool.Snapshot();
    ASSERT_EQ(snapshot.size(), 2U);
    EXPECT_EQ(snapshot[0].id, 1U);
    EXPECT_EQ(snapshot[1].id, 2U);
}

TEST(CoinPool, NearestBreaksTiesByLowerId)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(9, 0.0, 0.0001)));
    ASSERT_TRUE(pool.Add(MakeCoin(4, 0.0, -0.0001)));

    const std::optional<Coin> nearest = pool.Nearest({0.0, 0.0}, 100.0);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(nearest->id, 4U);
}

TEST(CoinPool, NearestRadiusIsInclusive)
{
    CoinPool pool;
    const Coin coin = MakeCoin(1, 0.0001, 0.0002);
    ASSERT_TRUE(pool.Add(coin));

    const engine::geo::GeoPoint player{0.0, 0.0};
    const double exact = engine::geo::DistanceMeters(player, coin.position);

    EXPECT_TRUE(pool.Nearest(player, exact).has_value());
    EXPECT_FALSE(pool.Nearest(player, exact - 0.01).has_value());
}

TEST(CoinPool, NearestRejectsBadQueries)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(1, 0.0, 0.0)));

    EXPECT_FALSE(pool.Nearest({0.0, 0.0}, -1.0).has_value());
    EXPECT_FALSE(pool.Nearest({0.0, 0.0}, std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(pool.Nearest({95.0, 0.0}, 10.0).has_value());
    EXPECT_TRUE(pool.Nearest({0.0, 0.0}, 0.0).has_value());

    CoinPool empty;
    EXPECT_FALSE(empty.Nearest({0.0, 0.0}, 1000.0).has_value());
}

TEST(CoinPool, RemoveIsIdempotent)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(7, 0.0, 0.0)));

    EXPECT_TRUE(pool.Remove(7));
    EXPECT_FALSE(pool.Remove(7));
    EXPECT_FALSE(pool.Remove(12345));
    EXPECT_FALSE(pool.Get(7).has_value());
    EXPECT_FALSE(pool.Nearest({0.0, 0.0}, 10.0).has_value());
}

TEST(CoinPool, TakeReturnsTheStoredCoin)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(7, 1.0, 2.0, 321)));

    const std::optional<Coin> taken = pool.Take(7);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->value.Cents(), 321);
    EXPECT_DOUBLE_EQ(taken->position.longitude, 2.0);
    EXPECT_FALSE(pool.Take(7).has_value());
}

TEST(CoinPool, TakeIfKeepsRejectedCoin)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(7, 0.0, 0.0, 2500)));

    EXPECT_FALSE(pool.TakeIf(7, [](const Coin& coin) { return coin.value.Cents() <= 1000; }).has_value());
    EXPECT_TRUE(pool.Contains(7));
    EXPECT_TRUE(pool.Nearest({0.0, 0.0}, 10.0).has_value());

    EXPECT_TRUE(pool.TakeIf(7, [](const Coin&) { return true; }).has_value());
    EXPECT_TRUE(pool.Empty());
}

TEST(CoinPool, ReadersNeverSeeHalfPopulatedPool)
{
    std::vector<Coin> first;
    std::vector<Coin> second;
    for (CoinId id = 1; id <= 100; ++id)
    {
        first.push_back(MakeCoin(id, 0.0, 0.0001 * static_cast<double>(id)));
        second.push_back(MakeCoin(id + 1000, 0.0001 * static_cast<double>(id), 0.0));
    }

    CoinPool pool;
    ASSERT_EQ(pool.Populate(first), 100U);

    std::atomic<bool> done{false};
    std::atomic<int> partial{0};
    std::thread reader([&]() {
        while (!done.load())
        {
            if (pool.Size() != 100U || pool.Snapshot().size() != 100U)
            {
                partial.fetch_add(1);
            }
        }
    });

    for (int i = 0; i < 200; ++i)
    {
        static_cast<void>(pool.Populate(i % 2 == 0 ? second : first));
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(partial.load(), 0);
}

TEST(CoinPool, ConcurrentRemoveHasOneWinner)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(42, 10.0, 10.0)));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&pool, &winners]() {
            if (pool.Remove(42))
            {
                winners.fetch_add(1);
            }
        });
    }
    for (std::thread& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(pool.Empty());
}

TEST(CoinPool, WithinRadiusIsOrderedByDistanceThenId)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(5, 0.0, 0.0003)));
    ASSERT_TRUE(pool.Add(MakeCoin(3, 0.0, -0.0001)));
    ASSERT_TRUE(pool.Add(MakeCoin(2, 0.0, 0.0001)));
    ASSERT_TRUE(pool.Add(MakeCoin(8, 0.01, 0.01)));

    const std::vector<Coin> inRange = pool.WithinRadius({0.0, 0.0}, 50.0);
    ASSERT_EQ(inRange.size(), 3U);
    EXPECT_EQ(inRange[0].id, 2U);
    EXPECT_EQ(inRange[1].id, 3U);
    EXPECT_EQ(inRange[2].id, 5U);
}

TEST(CoinPool, FindsCoinsAcrossTheAntimeridian)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(1, 0.0, -179.99995)));
    ASSERT_TRUE(pool.Add(MakeCoin(2, 0.0, 179.9)));

    const std::optional<Coin> nearest = pool.Nearest({0.0, 179.99995}, 100.0);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(nearest->id, 1U);
}

TEST(CoinPool, FindsCoinsAcrossThePole)
{
    CoinPool pool;
    ASSERT_TRUE(pool.Add(MakeCoin(1, 89.9999, 180.0)));
    ASSERT_TRUE(pool.Add(MakeCoin(2, 89.0, 0.0)));

    const std::optional<Coin> nearest = pool.Nearest({89.9999, 0.0}, 100.0);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(nearest->id, 1U);
}

TEST(CoinPool, GridMatchesLinearScan)
{
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> latitude(37.77, 37.80);
    std::uniform_real_distribution<double> longitude(-122.43, -122.40);

    std::vector<Coin> coins;
    for (CoinId id = 1; id <= 400; ++id)
    {
        coins.push_back(MakeCoin(id, latitude(rng), longitude(rng)));
    }

    CoinPool pool;
    pool.SetCellSizeDegrees(0.001);
    ASSERT_EQ(pool.Populate(coins), coins.size());

    for (int query = 0; query < 200; ++query)
    {
        const engine::geo::GeoPoint player{latitude(rng), longitude(rng)};
        for (const double radius : {5.0, 50.0, 150.0, 2000.0})
        {
            const std::optional<Coin> fromGrid = pool.Nearest(player, radius);
            const std::optional<CoinId> expected = BruteForceNearest(coins, player, radius);
            ASSERT_EQ(fromGrid.has_value(), expected.has_value()) << "radius " << radius;
            if (expected.has_value())
            {
                EXPECT_EQ(fromGrid->id, *expected);
            }
        }
    }
}
} // namespace hunt::coins::test
