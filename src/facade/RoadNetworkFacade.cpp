#include "roadnet/facade/RoadNetworkFacade.h"
#include "roadnet/common/Logger.h"

#include <stdexcept>

namespace roadnet {

ModelError::ModelError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

namespace {

/// Run a network call, rethrowing any failure as ModelError
template <typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const RoadNetworkError& e) {
        LOG_DEBUG("{} failed: {} ({})", operation, e.what(), errorCodeToString(e.code()));
        throw ModelError(e.code(), e.what());
    } catch (const ContractViolation& e) {
        // Programming errors are reported at error level and still reach the
        // caller under their own code, never swallowed
        LOG_ERROR("{} violated a precondition: {}", operation, e.what());
        throw ModelError(ErrorCode::ContractViolation, e.what());
    } catch (const std::out_of_range& e) {
        LOG_DEBUG("{} failed: {}", operation, e.what());
        throw ModelError(ErrorCode::UnknownHandle, e.what());
    }
}

}  // namespace

RoadNetworkFacade::RoadNetworkFacade(NetworkConfig config) : network_(std::move(config)) {}

// ===== Roads =====

RoadId RoadNetworkFacade::createOneWayRoad(const std::string& identification, Location endPoint1,
                                           Location endPoint2, int length, float speedLimit,
                                           float averageSpeed) {
    return guarded("createOneWayRoad", [&] {
        return network_.addOneWayRoad(identification, endPoint1, endPoint2, length, speedLimit,
                                      averageSpeed);
    });
}

RoadId RoadNetworkFacade::createOneWayRoad(const std::string& identification, Location endPoint1,
                                           Location endPoint2, int length, float averageSpeed) {
    return guarded("createOneWayRoad", [&] {
        return network_.addOneWayRoad(identification, endPoint1, endPoint2, length, averageSpeed);
    });
}

RoadId RoadNetworkFacade::createTwoWayRoad(const std::string& identification, Location endPoint1,
                                           Location endPoint2, int length, float speedLimit,
                                           float averageSpeed) {
    return guarded("createTwoWayRoad", [&] {
        return network_.addTwoWayRoad(identification, endPoint1, endPoint2, length, speedLimit,
                                      averageSpeed);
    });
}

RoadId RoadNetworkFacade::createTwoWayRoad(const std::string& identification, Location endPoint1,
                                           Location endPoint2, int length, float averageSpeed) {
    return guarded("createTwoWayRoad", [&] {
        return network_.addTwoWayRoad(identification, endPoint1, endPoint2, length, averageSpeed);
    });
}

void RoadNetworkFacade::terminateRoad(RoadId road) {
    guarded("terminateRoad", [&] { network_.terminateRoad(road); });
}

bool RoadNetworkFacade::isTerminated(RoadId road) const {
    return guarded("isTerminated", [&] { return network_.isRoadTerminated(road); });
}

std::string RoadNetworkFacade::getIdentification(RoadId road) const {
    return guarded("getIdentification", [&] { return network_.getRoad(road).identification; });
}

void RoadNetworkFacade::changeIdentification(RoadId road, const std::string& identification) {
    guarded("changeIdentification", [&] { network_.setIdentification(road, identification); });
}

std::pair<Location, Location> RoadNetworkFacade::getEndPoints(RoadId road) const {
    return guarded("getEndPoints", [&] {
        const RoadData& data = network_.getRoad(road);
        return std::make_pair(data.endPoint1, data.endPoint2);
    });
}

std::vector<Location> RoadNetworkFacade::getValidStartLocations(RoadId road) const {
    return guarded("getValidStartLocations",
                   [&] { return network_.getRoad(road).validStartLocations(); });
}

std::vector<Location> RoadNetworkFacade::getValidEndLocations(RoadId road) const {
    return guarded("getValidEndLocations",
                   [&] { return network_.getRoad(road).validEndLocations(); });
}

int RoadNetworkFacade::getLength(RoadId road) const {
    return guarded("getLength", [&] { return network_.getRoad(road).length; });
}

void RoadNetworkFacade::changeLength(RoadId road, int length) {
    guarded("changeLength", [&] { network_.setLength(road, length); });
}

float RoadNetworkFacade::getSpeedLimit(RoadId road) const {
    return guarded("getSpeedLimit", [&] { return network_.getRoad(road).speedLimit; });
}

void RoadNetworkFacade::changeSpeedLimit(RoadId road, float speedLimit) {
    guarded("changeSpeedLimit", [&] { network_.setSpeedLimit(road, speedLimit); });
}

float RoadNetworkFacade::getAverageSpeed(RoadId road) const {
    return guarded("getAverageSpeed", [&] { return network_.getRoad(road).averageSpeed; });
}

void RoadNetworkFacade::changeAverageSpeed(RoadId road, float averageSpeed) {
    guarded("changeAverageSpeed", [&] { network_.setAverageSpeed(road, averageSpeed); });
}

float RoadNetworkFacade::getDelay(RoadId road, Direction direction) const {
    return guarded("getDelay", [&] { return network_.getCurrentDelay(road, direction); });
}

void RoadNetworkFacade::changeDelay(RoadId road, Direction direction, float delay) {
    guarded("changeDelay", [&] { network_.setCurrentDelay(road, direction, delay); });
}

bool RoadNetworkFacade::isBlocked(RoadId road, Direction direction) const {
    return guarded("isBlocked", [&] { return network_.isBlocked(road, direction); });
}

void RoadNetworkFacade::changeBlocked(RoadId road, Direction direction, bool blocked) {
    guarded("changeBlocked", [&] { network_.setBlocked(road, direction, blocked); });
}

// ===== Routes =====

RouteId RoadNetworkFacade::createRoute(Location startLocation,
                                       const std::vector<SegmentRef>& segments) {
    return guarded("createRoute", [&] { return network_.createRoute(startLocation, segments); });
}

Location RoadNetworkFacade::getStartLocation(RouteId route) const {
    return guarded("getStartLocation", [&] { return network_.getStartLocation(route); });
}

std::vector<SegmentRef> RoadNetworkFacade::getRouteSegments(RouteId route) const {
    return guarded("getRouteSegments", [&] { return network_.getSegments(route); });
}

void RoadNetworkFacade::addRouteSegment(RouteId route, SegmentRef segment) {
    guarded("addRouteSegment", [&] { network_.addSegment(route, segment); });
}

void RoadNetworkFacade::removeRouteSegment(RouteId route, size_t index) {
    guarded("removeRouteSegment", [&] { network_.removeSegmentAt(route, index); });
}

int64_t RoadNetworkFacade::getTotalLength(RouteId route) const {
    return guarded("getTotalLength", [&] { return network_.getTotalLength(route); });
}

bool RoadNetworkFacade::isTraversable(RouteId route) const {
    return guarded("isTraversable", [&] { return network_.isTraversable(route); });
}

std::vector<Location> RoadNetworkFacade::getAllLocations(RouteId route) const {
    return guarded("getAllLocations", [&] { return network_.getLocationsVisited(route); });
}

}  // namespace roadnet
