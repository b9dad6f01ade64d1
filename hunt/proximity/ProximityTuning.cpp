#include "hunt/proximity/ProximityTuning.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace hunt::proximity
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

bool IsNonNegativeDistance(double value)
{
    return std::isfinite(value) && value >= 0.0;
}
} // namespace

bool ProximityTuning::Validate(std::string* outError) const
{
    if (!IsNonNegativeDistance(trackingRadiusMeters))
    {
        return Fail(outError, "tracking_radius must be a non-negative number");
    }
    if (!IsNonNegativeDistance(nearDistanceMeters))
    {
        return Fail(outError, "near_distance must be a non-negative number");
    }
    if (!IsNonNegativeDistance(collectDistanceMeters))
    {
        return Fail(outError, "collect_distance must be a non-negative number");
    }
    if (!IsNonNegativeDistance(hysteresisMeters))
    {
        return Fail(outError, "hysteresis must be a non-negative number");
    }
    if (!IsNonNegativeDistance(retargetMarginMeters))
    {
        return Fail(outError, "retarget_margin must be a non-negative number");
    }
    if (collectDistanceMeters > nearDistanceMeters)
    {
        return Fail(outError, "collect_distance must not exceed near_distance");
    }
    if (nearDistanceMeters > trackingRadiusMeters)
    {
        return Fail(outError, "near_distance must not exceed tracking_radius");
    }
    return true;
}

bool LoadProximityTuning(const std::string& path, ProximityTuning& outTuning, std::string* outError)
{
    const std::filesystem::path filePath(path);
    if (!std::filesystem::exists(filePath))
    {
        outTuning = ProximityTuning{};
        return SaveProximityTuning(path, outTuning, outError);
    }

    std::ifstream stream(filePath);
    if (!stream.is_open())
    {
        return Fail(outError, "Cannot open hunt tuning file: " + path);
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        return Fail(outError, std::string{"Invalid hunt tuning JSON: "} + ex.what());
    }

    if (!root.is_object())
    {
        return Fail(outError, "Hunt tuning root must be an object");
    }

    ProximityTuning loaded;

    auto readDouble = [&](const char* key, double& target) {
        if (root.contains(key) && root[key].is_number())
        {
            target = root[key].get<double>();
        }
    };
    auto readInt = [&](const char* key, int& target) {
        if (root.contains(key) && root[key].is_number_integer())
        {
            target = root[key].get<int>();
        }
    };
    auto readBool = [&](const char* key, bool& target) {
        if (root.contains(key) && root[key].is_boolean())
        {
            target = root[key].get<bool>();
        }
    };

    readInt("asset_version", loaded.assetVersion);
    readDouble("tracking_radius", loaded.trackingRadiusMeters);
    readDouble("near_distance", loaded.nearDistanceMeters);
    readDouble("collect_distance", loaded.collectDistanceMeters);
    readDouble("hysteresis", loaded.hysteresisMeters);
    readBool("follow_nearest", loaded.followNearest);
    readDouble("retarget_margin", loaded.retargetMarginMeters);
    readBool("debug_logging", loaded.debugLogging);

    std::string validationError;
    if (!loaded.Validate(&validationError))
    {
        return Fail(outError, "Invalid hunt tuning: " + validationError);
    }

    outTuning = loaded;
    return true;
}

bool SaveProximityTuning(const std::string& path, const ProximityTuning& tuning, std::string* outError)
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec)
        {
            return Fail(outError, "Cannot create directory for " + path + ": " + ec.message());
        }
    }

    json root;
    root["asset_version"] = tuning.assetVersion;
    root["tracking_radius"] = tuning.trackingRadiusMeters;
    root["near_distance"] = tuning.nearDistanceMeters;
    root["collect_distance"] = tuning.collectDistanceMeters;
    root["hysteresis"] = tuning.hysteresisMeters;
    root["follow_nearest"] = tuning.followNearest;
    root["retarget_margin"] = tuning.retargetMarginMeters;
    root["debug_logging"] = tuning.debugLogging;

    std::ofstream stream(filePath);
    if (!stream.is_open())
    {
        return Fail(outError, "Cannot write hunt tuning file: " + path);
    }
    stream << root.dump(2) << "\n";
    return true;
}
} // namespace hunt::proximity
