#pragma once

#include "ModelError.h"
#include "roadnet/config/NetworkConfig.h"
#include "roadnet/core/RoadNetwork.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace roadnet {

/// Entry point for external callers
///
/// Owns a RoadNetwork and forwards to it. Every operation reports failure
/// as a ModelError, whatever the underlying cause was.
///
/// Usage:
///   RoadNetworkFacade facade;
///   RoadId a1 = facade.createOneWayRoad("A1", p1, p2, 10000, 33.0f, 28.0f);
///   RouteId route = facade.createRoute(p1, {SegmentRef::road(a1)});
///   facade.getTotalLength(route);
///
class RoadNetworkFacade {
public:
    RoadNetworkFacade() = default;
    explicit RoadNetworkFacade(NetworkConfig config);

    RoadNetwork& network() { return network_; }
    const RoadNetwork& network() const { return network_; }

    // =========================================================================
    // Roads
    // =========================================================================

    RoadId createOneWayRoad(const std::string& identification, Location endPoint1,
                            Location endPoint2, int length, float speedLimit,
                            float averageSpeed);
    RoadId createOneWayRoad(const std::string& identification, Location endPoint1,
                            Location endPoint2, int length, float averageSpeed);
    RoadId createTwoWayRoad(const std::string& identification, Location endPoint1,
                            Location endPoint2, int length, float speedLimit,
                            float averageSpeed);
    RoadId createTwoWayRoad(const std::string& identification, Location endPoint1,
                            Location endPoint2, int length, float averageSpeed);

    void terminateRoad(RoadId road);
    bool isTerminated(RoadId road) const;

    std::string getIdentification(RoadId road) const;
    void changeIdentification(RoadId road, const std::string& identification);

    std::pair<Location, Location> getEndPoints(RoadId road) const;
    std::vector<Location> getValidStartLocations(RoadId road) const;
    std::vector<Location> getValidEndLocations(RoadId road) const;

    int getLength(RoadId road) const;
    void changeLength(RoadId road, int length);

    float getSpeedLimit(RoadId road) const;
    void changeSpeedLimit(RoadId road, float speedLimit);

    float getAverageSpeed(RoadId road) const;
    void changeAverageSpeed(RoadId road, float averageSpeed);

    float getDelay(RoadId road, Direction direction) const;
    void changeDelay(RoadId road, Direction direction, float delay);

    bool isBlocked(RoadId road, Direction direction) const;
    void changeBlocked(RoadId road, Direction direction, bool blocked);

    // =========================================================================
    // Routes
    // =========================================================================

    RouteId createRoute(Location startLocation, const std::vector<SegmentRef>& segments);

    Location getStartLocation(RouteId route) const;
    std::vector<SegmentRef> getRouteSegments(RouteId route) const;

    void addRouteSegment(RouteId route, SegmentRef segment);
    void removeRouteSegment(RouteId route, size_t index);

    int64_t getTotalLength(RouteId route) const;
    bool isTraversable(RouteId route) const;
    std::vector<Location> getAllLocations(RouteId route) const;

private:
    RoadNetwork network_;
};

}  // namespace roadnet
