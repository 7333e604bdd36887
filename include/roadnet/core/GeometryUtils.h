#pragma once

#include "Types.h"

namespace roadnet {

/// Coordinate helpers shared by roads and routes
namespace geometry {

/// Smallest accepted latitude/longitude in degrees
constexpr double MIN_DEGREES = 0.0;
/// Largest accepted latitude/longitude in degrees
constexpr double MAX_DEGREES = 70.0;

/// Check that both coordinates lie in [MIN_DEGREES, MAX_DEGREES]
bool isValidLocation(const Location& location);

/// Check if a location is one of the two endpoints
bool touches(const Location& location, const Location& endPoint1, const Location& endPoint2);

/// Check if two endpoint pairs have at least one location in common
bool sharesEndpoint(const Location& a1, const Location& a2,
                    const Location& b1, const Location& b2);

/// Check if two endpoint pairs span the same two locations, in either order
bool sameEndpointPair(const Location& a1, const Location& a2,
                      const Location& b1, const Location& b2);

/// The endpoint opposite to `from`
/// @return endPoint2 when `from` equals endPoint1, endPoint1 otherwise
Location otherEndpoint(const Location& from, const Location& endPoint1, const Location& endPoint2);

}  // namespace geometry

}  // namespace roadnet
