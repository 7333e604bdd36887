#pragma once

/// @file roadnet.h
/// @brief Main header for the roadnet road network library
///
/// roadnet models roads and the routes composed of them, and keeps every
/// route a continuous, cycle-free chain of segments.
///
/// Example usage:
/// @code
/// #include <roadnet/roadnet.h>
///
/// roadnet::RoadNetwork network;
/// auto a1 = network.addOneWayRoad("A1", {3.4, 8.6}, {13.8, 22.0}, 10000, 33.0f, 28.0f);
/// auto route = network.createRoute({3.4, 8.6}, {roadnet::SegmentRef::road(a1)});
/// network.getTotalLength(route);  // 10000
/// @endcode

#include <string>

// Core module - Roads, routes and the chaining rules
#include "core/Types.h"
#include "core/Errors.h"
#include "core/GeometryUtils.h"
#include "core/Road.h"
#include "core/Route.h"
#include "core/RoadNetwork.h"
#include "core/RouteChain.h"

// Configuration
#include "config/NetworkConfig.h"
#include "config/ConfigSerializer.h"

// Facade - single error type for external callers
#include "facade/ModelError.h"
#include "facade/RoadNetworkFacade.h"

namespace roadnet {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace roadnet
