#include "hunt/coins/CoinManifest.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace hunt::coins
{
namespace
{
using json = nlohmann::json;

bool Fail(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
    return false;
}

bool ParseEntry(const json& node, std::size_t index, Coin& outCoin, std::string* outError)
{
    const std::string where = "coins[" + std::to_string(index) + "]";
    if (!node.is_object())
    {
        return Fail(outError, where + " is not an object");
    }

    if (!node.contains("id") || !node["id"].is_number_unsigned())
    {
        return Fail(outError, where + ".id must be a non-negative integer");
    }
    if (!node.contains("latitude") || !node["latitude"].is_number() ||
        !node.contains("longitude") || !node["longitude"].is_number())
    {
        return Fail(outError, where + " needs numeric latitude and longitude");
    }

    Coin coin;
    coin.id = node["id"].get<CoinId>();
    coin.position.latitude = node["latitude"].get<double>();
    coin.position.longitude = node["longitude"].get<double>();
    if (!engine::geo::IsValidCoordinate(coin.position))
    {
        return Fail(outError, where + " has coordinates out of range");
    }

    if (node.contains("value_cents") && node["value_cents"].is_number_integer())
    {
        coin.value = economy::Money::FromCents(node["value_cents"].get<std::int64_t>());
    }
    else if (node.contains("value") && node["value"].is_number())
    {
        coin.value = economy::Money::FromDecimal(node["value"].get<double>());
    }
    else
    {
        return Fail(outError, where + " needs value or value_cents");
    }
    if (coin.value.IsNegative())
    {
        return Fail(outError, where + " has a negative value");
    }

    if (node.contains("type"))
    {
        const std::optional<CoinType> type =
            node["type"].is_string() ? ParseCoinType(node["type"].get<std::string>()) : std::nullopt;
        if (!type.has_value())
        {
            return Fail(outError, where + ".type must be \"fixed\" or \"pool\"");
        }
        coin.type = *type;
    }

    if (node.contains("pool_contribution_cents") && node["pool_contribution_cents"].is_number_integer())
    {
        coin.poolContribution = economy::Money::FromCents(node["pool_contribution_cents"].get<std::int64_t>());
    }
    else if (node.contains("pool_contribution") && node["pool_contribution"].is_number())
    {
        coin.poolContribution = economy::Money::FromDecimal(node["pool_contribution"].get<double>());
    }
    if (coin.poolContribution.IsNegative())
    {
        return Fail(outError, where + " has a negative pool contribution");
    }

    if (node.contains("label") && node["label"].is_string())
    {
        coin.label = node["label"].get<std::string>();
    }

    outCoin = std::move(coin);
    return true;
}
} // namespace

bool ParseCoinManifest(std::string_view text, std::vector<Coin>& outCoins, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const std::exception& ex)
    {
        return Fail(outError, std::string{"Invalid coin manifest JSON: "} + ex.what());
    }

    if (!root.is_object() || !root.contains("coins") || !root["coins"].is_array())
    {
        return Fail(outError, "Missing coins array");
    }

    std::vector<Coin> coins;
    std::unordered_set<CoinId> seen;
    const json& entries = root["coins"];
    coins.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        Coin coin;
        if (!ParseEntry(entries[i], i, coin, outError))
        {
            return false;
        }
        if (!seen.insert(coin.id).second)
        {
            return Fail(outError, "Duplicate coin id " + std::to_string(coin.id));
        }
        coins.push_back(std::move(coin));
    }

    outCoins = std::move(coins);
    return true;
}

bool LoadCoinManifest(const std::string& path, std::vector<Coin>& outCoins, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        return Fail(outError, "Cannot open coin manifest: " + path);
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return ParseCoinManifest(buffer.str(), outCoins, outError);
}
} // namespace hunt::coins
