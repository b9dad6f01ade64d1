#pragma once

#include <string>

namespace hunt::proximity
{
/// Thresholds that drive target selection and zone classification.
/// Distances are meters. Stored as config/hunt_tuning.json.
struct ProximityTuning
{
    int assetVersion = 1;

    double trackingRadiusMeters = 100.0;
    double nearDistanceMeters = 50.0;
    double collectDistanceMeters = 5.0;

    /// Extra distance needed to leave a tighter zone (and to release an auto-selected target).
    double hysteresisMeters = 1.0;

    /// Switch an auto-selected target when another coin is closer by more than retargetMarginMeters.
    bool followNearest = false;
    double retargetMarginMeters = 2.0;

    bool debugLogging = false;

    /// collect <= near <= tracking, all finite and non-negative.
    [[nodiscard]] bool Validate(std::string* outError = nullptr) const;
};

/// Missing file is created with defaults. Missing keys keep their defaults.
[[nodiscard]] bool LoadProximityTuning(const std::string& path, ProximityTuning& outTuning, std::string* outError = nullptr);
[[nodiscard]] bool SaveProximityTuning(const std::string& path, const ProximityTuning& tuning, std::string* outError = nullptr);
} // namespace hunt::proximity
