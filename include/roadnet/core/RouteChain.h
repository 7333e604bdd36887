#pragma once

#include "Types.h"

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace roadnet {

class RoadNetwork;
struct RoadData;

/// A start location plus an ordered run of segments
///
/// Used both for stored routes and for candidate sequences that are
/// checked before an edit is committed.
struct ChainView {
    Location start;
    std::span<const SegmentRef> segments;

    bool empty() const { return segments.empty(); }

    /// The same chain cut down to its first `count` segments
    ChainView prefix(size_t count) const { return {start, segments.first(count)}; }
};

/// Chaining rules and derived queries over the routes of a network
///
/// Stateless apart from the network reference; cheap to construct on
/// demand. All queries are read-only.
class RouteChain {
public:
    explicit RouteChain(const RoadNetwork& network) : network_(network) {}

    // ===== End location =====

    /// Location reached at the end of a route, none for an empty route
    std::optional<Location> endLocation(RouteId route) const;

    /// Location reached at the end of a chain
    ///
    /// Resolution looks at the last segment only, using its predecessor to
    /// decide which endpoint of a two-way road is new. When that stays
    /// ambiguous (both endpoints coincide with the predecessor, as with
    /// parallel roads) the chain without its last segment is resolved first.
    std::optional<Location> endLocation(const ChainView& chain) const;

    /// The two locations a segment connects: a road's endpoints, or a
    /// route's start and end location
    std::optional<std::pair<Location, Location>> endpoints(SegmentRef segment) const;

    // ===== Invariant =====

    /// Check if `candidate` can be appended to `route` right now
    bool canHaveAsSegment(RouteId route, SegmentRef candidate) const;

    /// Check if `other` is `segment` itself or is contained in it, at any depth
    bool hasAsSubSegment(SegmentRef segment, SegmentRef other) const;

    /// Full route invariant: non-empty, roads registered and alive,
    /// segments chained from the start location, nested routes proper
    bool hasProperSegments(RouteId route) const;

    /// Geometric part of the invariant for an arbitrary chain
    /// (back-references are not consulted)
    bool isChained(const ChainView& chain) const;

    // ===== Derived queries (require hasProperSegments) =====

    /// Sum of road lengths, recursing into nested routes
    /// @throws InvalidStateError if the route is not proper
    int64_t totalLength(RouteId route) const;

    /// Check that no road is blocked in the direction the route uses it
    /// @throws InvalidStateError if the route is not proper
    bool isTraversable(RouteId route) const;

    /// Ordered waypoints from the start location to the end location
    /// @throws InvalidStateError if the route is non-empty and not proper
    std::vector<Location> locationsVisited(RouteId route) const;

    // ===== Road traversal helpers =====

    /// Location a road is left at when entered at `entry`,
    /// none if the road cannot be entered there
    static std::optional<Location> exitPoint(const RoadData& road, const Location& entry);

    /// Direction a road is travelled in when entered at `entry`
    static Direction travelDirection(const RoadData& road, const Location& entry);

private:
    void requireProperSegments(RouteId route, const char* query) const;
    bool isPassable(const RoadData& road, const Location& entry) const;

    const RoadNetwork& network_;
};

}  // namespace roadnet
