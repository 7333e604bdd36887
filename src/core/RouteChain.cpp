#include "roadnet/core/RouteChain.h"
#include "roadnet/core/Errors.h"
#include "roadnet/core/GeometryUtils.h"
#include "roadnet/core/RoadNetwork.h"

#include <format>

namespace roadnet {

// ===== Road traversal helpers =====

std::optional<Location> RouteChain::exitPoint(const RoadData& road, const Location& entry) {
    if (road.isOneWay()) {
        if (entry == road.endPoint1) return road.endPoint2;
        return std::nullopt;
    }
    if (entry == road.endPoint1) return road.endPoint2;
    if (entry == road.endPoint2) return road.endPoint1;
    return std::nullopt;
}

Direction RouteChain::travelDirection(const RoadData& road, const Location& entry) {
    if (road.isOneWay() || entry == road.endPoint1) {
        return Direction::Forth;
    }
    return Direction::Opposite;
}

bool RouteChain::isPassable(const RoadData& road, const Location& entry) const {
    if (road.isOneWay()) {
        return !road.forth.blocked;
    }
    // A loop is entered at both endpoints at once, so both directions count
    if (road.isSelfLoop()) {
        return !road.forth.blocked && !road.opposite->blocked;
    }
    return travelDirection(road, entry) == Direction::Forth ? !road.forth.blocked
                                                            : !road.opposite->blocked;
}

// ===== End location =====

std::optional<Location> RouteChain::endLocation(RouteId route) const {
    const RouteData& data = network_.getRoute(route);
    return endLocation(ChainView{data.startLocation, data.segments});
}

std::optional<Location> RouteChain::endLocation(const ChainView& chain) const {
    if (chain.empty()) {
        return std::nullopt;
    }

    const SegmentRef last = chain.segments.back();
    if (last.isRoute()) {
        return endLocation(last.id);
    }

    const RoadData& road = network_.getRoad(last.id);
    if (road.isSelfLoop()) {
        return road.endPoint1;
    }
    if (chain.segments.size() == 1) {
        return geometry::otherEndpoint(chain.start, road.endPoint1, road.endPoint2);
    }
    if (road.isOneWay()) {
        return road.endPoint2;
    }

    const SegmentRef previous = chain.segments[chain.segments.size() - 2];
    if (previous.isRoute()) {
        auto joint = endLocation(previous.id);
        if (!joint) return std::nullopt;
        return geometry::otherEndpoint(*joint, road.endPoint1, road.endPoint2);
    }

    const RoadData& before = network_.getRoad(previous.id);
    if (before.isOneWay()) {
        return geometry::otherEndpoint(before.endPoint2, road.endPoint1, road.endPoint2);
    }

    bool firstTouches = geometry::touches(road.endPoint1, before.endPoint1, before.endPoint2);
    bool secondTouches = geometry::touches(road.endPoint2, before.endPoint1, before.endPoint2);
    if (firstTouches && !secondTouches) return road.endPoint2;
    if (secondTouches && !firstTouches) return road.endPoint1;

    // Both endpoints (or neither) meet the predecessor: resolve where the
    // chain stood before this road
    auto joint = endLocation(chain.prefix(chain.segments.size() - 1));
    if (!joint) return std::nullopt;
    return geometry::otherEndpoint(*joint, road.endPoint1, road.endPoint2);
}

std::optional<std::pair<Location, Location>> RouteChain::endpoints(SegmentRef segment) const {
    if (segment.isRoad()) {
        const RoadData& road = network_.getRoad(segment.id);
        return std::make_pair(road.endPoint1, road.endPoint2);
    }
    auto end = endLocation(segment.id);
    if (!end) return std::nullopt;
    return std::make_pair(network_.getRoute(segment.id).startLocation, *end);
}

// ===== Invariant =====

bool RouteChain::hasAsSubSegment(SegmentRef segment, SegmentRef other) const {
    if (segment == other) {
        return true;
    }
    if (segment.isRoad()) {
        return false;
    }
    for (const auto& child : network_.getRoute(segment.id).segments) {
        if (hasAsSubSegment(child, other)) {
            return true;
        }
    }
    return false;
}

bool RouteChain::canHaveAsSegment(RouteId route, SegmentRef candidate) const {
    if (!network_.hasSegment(candidate)) {
        return false;
    }
    const RouteData& data = network_.getRoute(route);
    if (data.terminated) {
        return false;
    }

    std::optional<Location> anchor =
        data.empty() ? std::optional<Location>(data.startLocation) : endLocation(route);
    if (!anchor) {
        return false;
    }

    if (candidate.isRoad()) {
        const RoadData& road = network_.getRoad(candidate.id);
        if (road.terminated) {
            return false;
        }
        if (road.isOneWay()) {
            return road.endPoint1 == *anchor;
        }
        return geometry::touches(*anchor, road.endPoint1, road.endPoint2);
    }

    const RouteData& nested = network_.getRoute(candidate.id);
    if (nested.terminated || hasAsSubSegment(candidate, SegmentRef::route(route))) {
        return false;
    }
    return nested.startLocation == *anchor;
}

bool RouteChain::hasProperSegments(RouteId route) const {
    const RouteData& data = network_.getRoute(route);
    if (data.segments.empty()) {
        return false;
    }

    for (const auto& segment : data.segments) {
        if (segment.isRoad()) {
            const RoadData& road = network_.getRoad(segment.id);
            if (road.terminated || road.routes.count(route) == 0) {
                return false;
            }
        } else if (network_.getRoute(segment.id).terminated) {
            return false;
        }
    }

    return isChained(ChainView{data.startLocation, data.segments});
}

bool RouteChain::isChained(const ChainView& chain) const {
    if (chain.empty()) {
        return false;
    }

    // Walk from the start, tracking the point reached so far
    Location reached = chain.start;
    for (const auto& segment : chain.segments) {
        if (segment.isRoad()) {
            auto exit = exitPoint(network_.getRoad(segment.id), reached);
            if (!exit) {
                return false;
            }
            reached = *exit;
            continue;
        }

        const RouteData& nested = network_.getRoute(segment.id);
        if (nested.startLocation != reached || !hasProperSegments(segment.id)) {
            return false;
        }
        reached = *endLocation(segment.id);
    }

    auto end = endLocation(chain);
    return end && *end == reached;
}

// ===== Derived queries =====

void RouteChain::requireProperSegments(RouteId route, const char* query) const {
    if (!hasProperSegments(route)) {
        throw InvalidStateError(std::format(
            "Cannot compute {} of route {}: segments are not properly chained", query, route));
    }
}

int64_t RouteChain::totalLength(RouteId route) const {
    requireProperSegments(route, "total length");

    int64_t sum = 0;
    for (const auto& segment : network_.getRoute(route).segments) {
        if (segment.isRoad()) {
            sum += network_.getRoad(segment.id).length;
        } else {
            sum += totalLength(segment.id);
        }
    }
    return sum;
}

bool RouteChain::isTraversable(RouteId route) const {
    requireProperSegments(route, "traversability");

    const RouteData& data = network_.getRoute(route);
    Location reached = data.startLocation;
    for (const auto& segment : data.segments) {
        if (segment.isRoute()) {
            if (!isTraversable(segment.id)) {
                return false;
            }
            reached = *endLocation(segment.id);
            continue;
        }

        const RoadData& road = network_.getRoad(segment.id);
        if (!isPassable(road, reached)) {
            return false;
        }
        reached = *exitPoint(road, reached);
    }
    return true;
}

std::vector<Location> RouteChain::locationsVisited(RouteId route) const {
    const RouteData& data = network_.getRoute(route);
    std::vector<Location> locations{data.startLocation};
    if (data.segments.empty()) {
        return locations;
    }
    requireProperSegments(route, "visited locations");

    // A lone road is reported as start and end, even when both are the same point
    if (data.segments.size() == 1 && data.segments.front().isRoad()) {
        locations.push_back(*exitPoint(network_.getRoad(data.segments.front().id),
                                       data.startLocation));
        return locations;
    }

    for (const auto& segment : data.segments) {
        if (segment.isRoute()) {
            auto nested = locationsVisited(segment.id);
            // First waypoint is the one we are standing on
            locations.insert(locations.end(), nested.begin() + 1, nested.end());
            continue;
        }

        Location exit = *exitPoint(network_.getRoad(segment.id), locations.back());
        if (exit != locations.back()) {
            locations.push_back(exit);
        }
    }
    return locations;
}

}  // namespace roadnet
