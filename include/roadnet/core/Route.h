#pragma once

#include "Types.h"

#include <vector>

namespace roadnet {

/// Stored state of a route inside a RoadNetwork
///
/// The end location is not stored; RouteChain derives it from the
/// segment sequence.
struct RouteData {
    RouteId id = INVALID_ROUTE;
    Location startLocation;
    std::vector<SegmentRef> segments;   ///< Ordered, may repeat a segment
    std::vector<RouteId> usedBy;        ///< Routes holding this one as a segment
    bool terminated = false;

    bool empty() const { return segments.empty(); }
    size_t segmentCount() const { return segments.size(); }
};

}  // namespace roadnet
