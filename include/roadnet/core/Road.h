#pragma once

#include "Types.h"
#include "roadnet/config/NetworkConfig.h"

#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace roadnet {

/// Validation rules for road attributes
namespace road {

constexpr float SPEED_OF_LIGHT = 299792458.0f;

/// Length limits: a valid length lies strictly between 0 and MAX_LENGTH
constexpr int MAX_LENGTH = std::numeric_limits<int>::max();
constexpr int MIN_LENGTH = std::numeric_limits<int>::min();

/// Check 0 < length < MAX_LENGTH
bool canHaveAsLength(int length);

/// Map any integer onto a valid length
///
/// Valid values are kept, negative values down to MIN_LENGTH + 2 are
/// mirrored, zero becomes 1 and everything else (MIN_LENGTH, MIN_LENGTH + 1,
/// MAX_LENGTH) becomes MAX_LENGTH - 1.
int repairLength(int length);

/// Check 0 < speedLimit <= SPEED_OF_LIGHT
bool isValidSpeedLimit(float speedLimit);

/// Check 0 <= averageSpeed <= speedLimit
bool isValidAverageSpeed(float averageSpeed, float speedLimit);

bool isValidDelay(float delay);

/// Values a road is left with after termination
constexpr int TERMINATED_LENGTH = 1;
constexpr float TERMINATED_SPEED = 0.1f;

}  // namespace road

/// Traffic state of one travel direction
struct DirectionState {
    float currentDelay = 0.0f;  ///< Seconds
    bool blocked = false;

    bool operator==(const DirectionState& o) const = default;
};

/// Input for RoadNetwork::addRoad
struct RoadDefinition {
    std::string identification;
    Location endPoint1;
    Location endPoint2;
    int length = 1;                                   ///< Meters, repaired if invalid
    float speedLimit = NetworkConfig::DEFAULT_SPEED_LIMIT;  ///< Meters per second
    float averageSpeed = 0.0f;                        ///< Meters per second
    Directionality directionality = Directionality::TwoWay;
};

/// Stored state of a road inside a RoadNetwork
struct RoadData {
    RoadId id = INVALID_ROAD;
    std::string identification;
    Location endPoint1;
    Location endPoint2;
    int length = 1;
    float speedLimit = NetworkConfig::DEFAULT_SPEED_LIMIT;
    float averageSpeed = 0.0f;
    Directionality directionality = Directionality::TwoWay;

    DirectionState forth;
    std::optional<DirectionState> opposite;  ///< Absent on one-way roads

    std::set<RouteId> routes;  ///< Routes that currently hold this road
    bool terminated = false;

    bool isOneWay() const { return directionality == Directionality::OneWay; }
    bool isSelfLoop() const { return endPoint1 == endPoint2; }

    /// Locations a route may enter this road from
    std::vector<Location> validStartLocations() const;
    /// Locations a route may leave this road at
    std::vector<Location> validEndLocations() const;
};

}  // namespace roadnet
