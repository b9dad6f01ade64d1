#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hunt/coins/Coin.hpp"

namespace hunt::coins
{
/// Coin manifest format:
/// { "asset_version": 1, "coins": [ { "id": 7, "latitude": 0.0, "longitude": 0.00005,
///   "value": 10.0, "label": "Bart" } ] }
/// "value_cents" (integer) may replace "value". Optional "type" is "fixed" (default) or "pool";
/// "pool_contribution" / "pool_contribution_cents" give a pool coin's base.
/// A manifest with any malformed entry is rejected whole.
[[nodiscard]] bool ParseCoinManifest(std::string_view text, std::vector<Coin>& outCoins, std::string* outError = nullptr);
[[nodiscard]] bool LoadCoinManifest(const std::string& path, std::vector<Coin>& outCoins, std::string* outError = nullptr);
} // namespace hunt::coins
