#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hunt/HuntSession.hpp"
#include "hunt/coins/CoinManifest.hpp"
#include "hunt/economy/CoinValuer.hpp"
#include "hunt/economy/TierPolicy.hpp"

namespace
{
using json = nlohmann::json;

struct TrackFix
{
    engine::geo::GeoPoint position;
    std::optional<double> heading;
    bool collect = false;
};

struct Track
{
    hunt::economy::Money findLimit = hunt::economy::TierPolicy::kDefaultFindLimit;
    std::optional<std::uint32_t> valueSeed; ///< fixes pool coin rolls for repeatable runs
    std::vector<TrackFix> fixes;
};

bool LoadTrack(const std::string& path, Track& outTrack, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        *outError = "Cannot open track: " + path;
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        *outError = std::string{"Invalid track JSON: "} + ex.what();
        return false;
    }

    if (!root.contains("fixes") || !root["fixes"].is_array())
    {
        *outError = "Track has no fixes array";
        return false;
    }

    Track track;
    if (root.contains("find_limit") && root["find_limit"].is_number())
    {
        track.findLimit = hunt::economy::Money::FromDecimal(root["find_limit"].get<double>());
    }
    if (root.contains("value_seed") && root["value_seed"].is_number_unsigned())
    {
        track.valueSeed = root["value_seed"].get<std::uint32_t>();
    }

    for (const json& node : root["fixes"])
    {
        if (!node.is_object() || !node.contains("latitude") || !node["latitude"].is_number() ||
            !node.contains("longitude") || !node["longitude"].is_number())
        {
            *outError = "Track fix " + std::to_string(track.fixes.size()) + " needs numeric latitude and longitude";
            return false;
        }

        TrackFix fix;
        fix.position.latitude = node["latitude"].get<double>();
        fix.position.longitude = node["longitude"].get<double>();
        if (node.contains("heading") && node["heading"].is_number())
        {
            fix.heading = node["heading"].get<double>();
        }
        fix.collect = node.contains("collect") && node["collect"].is_boolean() && node["collect"].get<bool>();
        track.fixes.push_back(fix);
    }

    outTrack = std::move(track);
    return true;
}

hunt::proximity::ProximityListener MakePrinter()
{
    using hunt::proximity::ProximityZone;

    hunt::proximity::ProximityListener printer;
    printer.onTargetSet = [](const hunt::coins::Coin& coin) {
        std::cout << "  target set      " << coin.DisplayName() << "\n";
    };
    printer.onTargetCleared = []() {
        std::cout << "  target cleared\n";
    };
    printer.onTargetCollected = [](const hunt::coins::Coin& coin, hunt::economy::Money credited) {
        std::cout << "  collected       " << coin.DisplayName() << " (" << hunt::coins::CoinTypeId(coin.type)
                  << ") credited " << credited.ToString() << "\n";
    };
    printer.onZoneChanged = [](ProximityZone from, ProximityZone to) {
        std::cout << "  zone            " << hunt::proximity::ZoneName(from) << " -> "
                  << hunt::proximity::ZoneName(to) << " (" << hunt::proximity::ZoneDescription(to) << ")\n";
    };
    printer.onDistanceUpdated = [](double distance, double bearing) {
        std::cout << "  distance        " << engine::geo::FormatDistance(distance) << " "
                  << engine::geo::FormatBearing(bearing) << "\n";
    };
    printer.onEnteredCollectionRange = [](const hunt::coins::Coin& coin) {
        std::cout << "  entered range   " << coin.DisplayName() << "\n";
    };
    printer.onExitedCollectionRange = [](const hunt::coins::Coin& coin) {
        std::cout << "  exited range    " << coin.DisplayName() << "\n";
    };
    printer.onLockStateChanged = [](bool locked) {
        std::cout << "  lock            " << (locked ? "locked" : "unlocked") << "\n";
    };
    return printer;
}
} // namespace

int main(int argc, char** argv)
{
    if (argc != 4)
    {
        std::cerr << "Usage: hunt_replay <tuning.json> <coins.json> <track.json>\n";
        return 2;
    }

    std::string error;

    hunt::proximity::ProximityTuning tuning;
    if (!hunt::proximity::LoadProximityTuning(argv[1], tuning, &error))
    {
        std::cerr << "hunt_replay: ERROR - " << error << "\n";
        return 1;
    }

    std::vector<hunt::coins::Coin> coins;
    if (!hunt::coins::LoadCoinManifest(argv[2], coins, &error))
    {
        std::cerr << "hunt_replay: ERROR - " << error << "\n";
        return 1;
    }

    Track track;
    if (!LoadTrack(argv[3], track, &error))
    {
        std::cerr << "hunt_replay: ERROR - " << error << "\n";
        return 1;
    }

    hunt::HuntSession session;
    if (!session.Configure(tuning, &error))
    {
        std::cerr << "hunt_replay: ERROR - " << error << "\n";
        return 1;
    }

    if (track.valueSeed.has_value())
    {
        session.Collector().SetValuer(std::make_unique<hunt::economy::CoinValuer>(*track.valueSeed));
    }

    const hunt::economy::Money findLimit = track.findLimit;
    session.SetFindLimitProvider([findLimit]() { return findLimit; });
    const hunt::proximity::ListenerId printerId = session.Engine().AddListener(MakePrinter());

    std::cout << "Find limit " << findLimit.ToString() << " ("
              << hunt::economy::TierPolicy::NameFor(hunt::economy::TierPolicy::TierFor(findLimit)) << ")\n";
    session.Begin(coins);

    int rejected = 0;
    for (std::size_t i = 0; i < track.fixes.size(); ++i)
    {
        const TrackFix& fix = track.fixes[i];
        std::cout << "fix " << i << " " << engine::geo::FormatCoordinates(fix.position, 6) << "\n";
        if (!session.OnLocationFix(fix.position.latitude, fix.position.longitude, fix.heading))
        {
            ++rejected;
            continue;
        }

        if (fix.collect)
        {
            const hunt::economy::CollectionResult result = session.AttemptCollect();
            if (const auto* denied = std::get_if<hunt::economy::CollectionDenied>(&result))
            {
                std::cout << "  collect denied  " << hunt::economy::DenialReasonName(denied->reason) << ": "
                          << hunt::economy::DenialMessage(denied->reason) << "\n";
            }
        }
        std::cout << "  status          " << session.Engine().DirectionText() << "\n";
    }

    const hunt::proximity::ProximityStats stats = session.Engine().Stats();
    std::cout << "Summary: " << track.fixes.size() << " fixes, " << rejected << " rejected, "
              << stats.targetChanges << " target changes, " << session.Collector().CollectedCount()
              << " collected worth " << session.Collector().TotalCredited().ToString() << ", "
              << session.Pool().Size() << " coins left\n";

    session.Engine().RemoveListener(printerId);
    session.End();
    return 0;
}
