#pragma once

#include "IdentificationRegistry.h"
#include "Road.h"
#include "Route.h"
#include "Types.h"
#include "roadnet/config/NetworkConfig.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roadnet {

/// Owner of the roads and routes of one road network
///
/// Roads and routes live in arenas and are referred to by handle
/// (RoadId, RouteId). Routes reference their segments through SegmentRef,
/// roads keep the set of routes that use them. Handles are never reused,
/// terminated objects stay readable.
///
/// Example usage:
/// @code
/// roadnet::RoadNetwork network;
/// auto a1 = network.addOneWayRoad("A1", {3.4, 8.6}, {13.8, 22.0}, 10000, 33.0f, 28.0f);
/// auto n1 = network.addTwoWayRoad("N1", {13.8, 22.0}, {45.3, 18.1}, 4000, 25.0f, 20.0f);
/// auto route = network.createRoute({3.4, 8.6}, {SegmentRef::road(a1), SegmentRef::road(n1)});
/// network.getTotalLength(route);   // 14000
/// network.setBlocked(n1, Direction::Forth, true);
/// network.isTraversable(route);    // false
/// @endcode
class RoadNetwork {
public:
    RoadNetwork() = default;
    explicit RoadNetwork(NetworkConfig config);

    const NetworkConfig& config() const { return config_; }
    const IdentificationRegistry& identifications() const { return registry_; }

    // ===== Road construction =====

    /// Create a road
    /// @throws InvalidLocationError, InvalidIdentificationError,
    ///         DuplicateIdentificationError, InvalidSpeedLimitError,
    ///         InvalidAverageSpeedError (checked in that order)
    RoadId addRoad(const RoadDefinition& definition);

    RoadId addOneWayRoad(const std::string& identification, Location endPoint1, Location endPoint2,
                         int length, float speedLimit, float averageSpeed);
    RoadId addOneWayRoad(const std::string& identification, Location endPoint1, Location endPoint2,
                         int length, float averageSpeed);
    RoadId addTwoWayRoad(const std::string& identification, Location endPoint1, Location endPoint2,
                         int length, float speedLimit, float averageSpeed);
    RoadId addTwoWayRoad(const std::string& identification, Location endPoint1, Location endPoint2,
                         int length, float averageSpeed);

    // Road access API:
    // - getRoad(): reference into the arena, throws std::out_of_range for an unknown ID.
    //   The reference is invalidated by any later addRoad().
    // - tryGetRoad(): copy, std::nullopt for an unknown ID.
    bool hasRoad(RoadId id) const;
    const RoadData& getRoad(RoadId id) const;
    std::optional<RoadData> tryGetRoad(RoadId id) const;

    /// Active road carrying an identification
    std::optional<RoadId> findRoad(const std::string& identification) const;

    size_t roadCount() const { return roads_.size(); }
    std::vector<RoadId> roads() const;

    // ===== Road attributes =====

    /// @throws InvalidIdentificationError, DuplicateIdentificationError
    void setIdentification(RoadId id, const std::string& identification);

    /// Store a length, repaired by road::repairLength
    void setLength(RoadId id, int length);

    /// @throws InvalidSpeedLimitError, or InvalidAverageSpeedError when the
    ///         current average speed exceeds the new limit
    void setSpeedLimit(RoadId id, float speedLimit);

    /// @throws InvalidAverageSpeedError
    void setAverageSpeed(RoadId id, float averageSpeed);

    // Direction state. Direction::Opposite on a one-way road throws ContractViolation.
    float getCurrentDelay(RoadId id, Direction direction) const;
    /// @throws ContractViolation for a negative delay
    void setCurrentDelay(RoadId id, Direction direction, float delay);
    bool isBlocked(RoadId id, Direction direction) const;
    void setBlocked(RoadId id, Direction direction, bool blocked);

    // ===== Road lifecycle =====

    /// Terminate a road (idempotent)
    ///
    /// Every occurrence is removed from the routes using it, without
    /// re-checking their chaining. The identification is released and the
    /// numeric attributes are set to the terminal values.
    void terminateRoad(RoadId id);
    bool isRoadTerminated(RoadId id) const;

    // ===== Route construction =====

    /// Create a route from a start location and its initial segments
    /// @throws InvalidLocationError for a start location out of bounds
    /// @throws InvalidSegmentError for an empty list or a segment that does not chain;
    ///         nothing is left behind on failure
    RouteId createRoute(Location startLocation, const std::vector<SegmentRef>& segments);

    bool hasRoute(RouteId id) const;
    const RouteData& getRoute(RouteId id) const;
    std::optional<RouteData> tryGetRoute(RouteId id) const;

    size_t routeCount() const { return routes_.size(); }
    std::vector<RouteId> routes() const;

    /// Check if the handle names an existing road or route
    bool hasSegment(SegmentRef segment) const;

    // ===== Route queries =====

    Location getStartLocation(RouteId id) const;
    std::optional<Location> getEndLocation(RouteId id) const;
    const std::vector<SegmentRef>& getSegments(RouteId id) const;
    /// @throws ContractViolation for an index out of range
    SegmentRef getSegmentAt(RouteId id, size_t index) const;
    size_t segmentCount(RouteId id) const;
    bool hasAsSegment(RouteId id, SegmentRef segment) const;
    bool hasAsSubSegment(SegmentRef segment, SegmentRef other) const;
    bool canHaveAsSegment(RouteId id, SegmentRef segment) const;
    bool hasProperSegments(RouteId id) const;

    /// @throws InvalidStateError if the route is not proper
    int64_t getTotalLength(RouteId id) const;
    /// @throws InvalidStateError if the route is not proper
    bool isTraversable(RouteId id) const;
    /// @throws InvalidStateError if the route is non-empty and not proper
    std::vector<Location> getLocationsVisited(RouteId id) const;

    // ===== Route mutation =====
    // Edits are checked before they are committed; a rejected edit leaves
    // the route and all back-references unchanged.

    /// Append a segment
    /// @throws InvalidStateError if the route is terminated
    /// @throws InvalidSegmentError if the segment cannot be chained
    void addSegment(RouteId id, SegmentRef segment);

    /// Remove the first occurrence of a segment
    /// @throws ContractViolation if the segment is not in the route
    /// @throws InvalidSegmentError if the remaining segments do not chain
    void removeSegment(RouteId id, SegmentRef segment);

    /// Remove the segment at an index
    /// @throws ContractViolation for an index out of range
    /// @throws InvalidSegmentError if the remaining segments do not chain
    void removeSegmentAt(RouteId id, size_t index);

    /// Replace the segment at an index by one spanning the same endpoints
    /// @throws ContractViolation for an index out of range
    /// @throws InvalidSegmentError if the endpoints differ, the segment is
    ///         terminated or contains the route, or the result does not chain
    void changeSegment(RouteId id, size_t index, SegmentRef segment);

    // ===== Route lifecycle =====

    /// Terminate a route and, in cascade, all of its segments (idempotent)
    void terminateRoute(RouteId id);
    bool isRouteTerminated(RouteId id) const;

    /// Terminate any segment kind
    void terminate(SegmentRef segment);

private:
    RoadData& mutableRoad(RoadId id);
    RouteData& mutableRoute(RouteId id);
    DirectionState& directionState(RoadId id, Direction direction);
    const DirectionState& directionState(RoadId id, Direction direction) const;

    /// Register `route` as a user of `segment`
    void attach(RouteId route, SegmentRef segment);
    /// Drop the registration unless `route` still holds `segment`
    void detachIfUnused(RouteId route, SegmentRef segment);

    /// Append after canHaveAsSegment, used by construction and addSegment
    void appendChecked(RouteId id, SegmentRef segment);
    /// Remove the element at `index` and verify the remainder chains
    void eraseChecked(RouteId id, size_t index);
    /// Remove every occurrence without any check (termination cascade)
    void purgeSegment(RouteId id, SegmentRef segment);

    void requireSegment(SegmentRef segment) const;

    NetworkConfig config_;
    IdentificationRegistry registry_;
    std::vector<RoadData> roads_;
    std::vector<RouteData> routes_;
};

}  // namespace roadnet
