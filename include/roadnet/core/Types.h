#pragma once

#include <cstdint>

namespace roadnet {

using RoadId = uint32_t;
using RouteId = uint32_t;

constexpr RoadId INVALID_ROAD = UINT32_MAX;
constexpr RouteId INVALID_ROUTE = UINT32_MAX;

/// Geographic coordinate pair in degrees
struct Location {
    double latitude = 0.0;
    double longitude = 0.0;

    constexpr Location() = default;
    constexpr Location(double lat, double lon) : latitude(lat), longitude(lon) {}

    /// Exact comparison, no tolerance
    constexpr bool operator==(const Location& o) const {
        return latitude == o.latitude && longitude == o.longitude;
    }
    constexpr bool operator!=(const Location& o) const { return !(*this == o); }
};

/// Travel direction along a road
/// Forth runs endPoint1 -> endPoint2, Opposite runs endPoint2 -> endPoint1
enum class Direction {
    Forth,
    Opposite
};

enum class Directionality {
    OneWay,   ///< Forth direction only
    TwoWay    ///< Both directions, with independent state
};

enum class SegmentKind {
    Road,
    Route
};

/// Handle to one element of a route: either a road or a nested route
struct SegmentRef {
    SegmentKind kind = SegmentKind::Road;
    uint32_t id = UINT32_MAX;

    constexpr SegmentRef() = default;
    constexpr SegmentRef(SegmentKind k, uint32_t i) : kind(k), id(i) {}

    static constexpr SegmentRef road(RoadId id) { return {SegmentKind::Road, id}; }
    static constexpr SegmentRef route(RouteId id) { return {SegmentKind::Route, id}; }

    constexpr bool isRoad() const { return kind == SegmentKind::Road; }
    constexpr bool isRoute() const { return kind == SegmentKind::Route; }

    constexpr bool operator==(const SegmentRef& o) const { return kind == o.kind && id == o.id; }
    constexpr bool operator!=(const SegmentRef& o) const { return !(*this == o); }
};

}  // namespace roadnet
