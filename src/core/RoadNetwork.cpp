#include "roadnet/core/RoadNetwork.h"
#include "roadnet/common/Logger.h"
#include "roadnet/core/Errors.h"
#include "roadnet/core/GeometryUtils.h"
#include "roadnet/core/RouteChain.h"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace roadnet {

namespace {

std::string describe(SegmentRef segment) {
    return std::format("{} {}", segment.isRoad() ? "road" : "route", segment.id);
}

const char* directionName(Direction direction) {
    return direction == Direction::Forth ? "forth" : "opposite";
}

}  // namespace

RoadNetwork::RoadNetwork(NetworkConfig config) : config_(std::move(config)) {}

// ===== Road construction =====

RoadId RoadNetwork::addRoad(const RoadDefinition& definition) {
    if (!geometry::isValidLocation(definition.endPoint1)) {
        throw InvalidLocationError(definition.endPoint1);
    }
    if (!geometry::isValidLocation(definition.endPoint2)) {
        throw InvalidLocationError(definition.endPoint2);
    }
    if (!config_.identification.isValid(definition.identification)) {
        throw InvalidIdentificationError(definition.identification);
    }
    if (registry_.contains(definition.identification)) {
        throw DuplicateIdentificationError(definition.identification);
    }
    if (!road::isValidSpeedLimit(definition.speedLimit)) {
        throw InvalidSpeedLimitError(definition.speedLimit);
    }
    if (!road::isValidAverageSpeed(definition.averageSpeed, definition.speedLimit)) {
        throw InvalidAverageSpeedError(definition.averageSpeed, definition.speedLimit);
    }

    RoadId id = static_cast<RoadId>(roads_.size());

    RoadData data;
    data.id = id;
    data.identification = definition.identification;
    data.endPoint1 = definition.endPoint1;
    data.endPoint2 = definition.endPoint2;
    data.length = road::repairLength(definition.length);
    data.speedLimit = definition.speedLimit;
    data.averageSpeed = definition.averageSpeed;
    data.directionality = definition.directionality;
    if (definition.directionality == Directionality::TwoWay) {
        data.opposite = DirectionState{};
    }

    registry_.acquire(definition.identification);
    roads_.push_back(std::move(data));

    LOG_DEBUG("Created {} road '{}' (id={}, length={})",
              definition.directionality == Directionality::OneWay ? "one-way" : "two-way",
              definition.identification, id, roads_.back().length);
    return id;
}

RoadId RoadNetwork::addOneWayRoad(const std::string& identification, Location endPoint1,
                                  Location endPoint2, int length, float speedLimit,
                                  float averageSpeed) {
    RoadDefinition definition;
    definition.identification = identification;
    definition.endPoint1 = endPoint1;
    definition.endPoint2 = endPoint2;
    definition.length = length;
    definition.speedLimit = speedLimit;
    definition.averageSpeed = averageSpeed;
    definition.directionality = Directionality::OneWay;
    return addRoad(definition);
}

RoadId RoadNetwork::addOneWayRoad(const std::string& identification, Location endPoint1,
                                  Location endPoint2, int length, float averageSpeed) {
    return addOneWayRoad(identification, endPoint1, endPoint2, length,
                         config_.defaultSpeedLimit, averageSpeed);
}

RoadId RoadNetwork::addTwoWayRoad(const std::string& identification, Location endPoint1,
                                  Location endPoint2, int length, float speedLimit,
                                  float averageSpeed) {
    RoadDefinition definition;
    definition.identification = identification;
    definition.endPoint1 = endPoint1;
    definition.endPoint2 = endPoint2;
    definition.length = length;
    definition.speedLimit = speedLimit;
    definition.averageSpeed = averageSpeed;
    definition.directionality = Directionality::TwoWay;
    return addRoad(definition);
}

RoadId RoadNetwork::addTwoWayRoad(const std::string& identification, Location endPoint1,
                                  Location endPoint2, int length, float averageSpeed) {
    return addTwoWayRoad(identification, endPoint1, endPoint2, length,
                         config_.defaultSpeedLimit, averageSpeed);
}

// ===== Road access =====

bool RoadNetwork::hasRoad(RoadId id) const {
    return id < roads_.size();
}

const RoadData& RoadNetwork::getRoad(RoadId id) const {
    if (!hasRoad(id)) {
        throw std::out_of_range("Invalid road ID: " + std::to_string(id));
    }
    return roads_[id];
}

RoadData& RoadNetwork::mutableRoad(RoadId id) {
    if (!hasRoad(id)) {
        throw std::out_of_range("Invalid road ID: " + std::to_string(id));
    }
    return roads_[id];
}

std::optional<RoadData> RoadNetwork::tryGetRoad(RoadId id) const {
    if (!hasRoad(id)) {
        return std::nullopt;
    }
    return roads_[id];
}

std::optional<RoadId> RoadNetwork::findRoad(const std::string& identification) const {
    for (const auto& road : roads_) {
        if (!road.terminated && road.identification == identification) {
            return road.id;
        }
    }
    return std::nullopt;
}

std::vector<RoadId> RoadNetwork::roads() const {
    std::vector<RoadId> result;
    result.reserve(roads_.size());
    for (const auto& road : roads_) {
        result.push_back(road.id);
    }
    return result;
}

// ===== Road attributes =====

void RoadNetwork::setIdentification(RoadId id, const std::string& identification) {
    RoadData& road = mutableRoad(id);
    if (road.terminated) {
        throw InvalidStateError(std::format("Road {} is terminated", id));
    }
    if (!config_.identification.isValid(identification)) {
        throw InvalidIdentificationError(identification);
    }
    if (road.identification == identification) {
        return;
    }
    registry_.rename(road.identification, identification);
    LOG_DEBUG("Road {} renamed '{}' -> '{}'", id, road.identification, identification);
    road.identification = identification;
}

void RoadNetwork::setLength(RoadId id, int length) {
    mutableRoad(id).length = road::repairLength(length);
}

void RoadNetwork::setSpeedLimit(RoadId id, float speedLimit) {
    RoadData& road = mutableRoad(id);
    if (!road::isValidSpeedLimit(speedLimit)) {
        throw InvalidSpeedLimitError(speedLimit);
    }
    if (!road::isValidAverageSpeed(road.averageSpeed, speedLimit)) {
        throw InvalidAverageSpeedError(road.averageSpeed, speedLimit);
    }
    road.speedLimit = speedLimit;
}

void RoadNetwork::setAverageSpeed(RoadId id, float averageSpeed) {
    RoadData& road = mutableRoad(id);
    if (!road::isValidAverageSpeed(averageSpeed, road.speedLimit)) {
        throw InvalidAverageSpeedError(averageSpeed, road.speedLimit);
    }
    road.averageSpeed = averageSpeed;
}

const DirectionState& RoadNetwork::directionState(RoadId id, Direction direction) const {
    const RoadData& road = getRoad(id);
    if (direction == Direction::Forth) {
        return road.forth;
    }
    if (!road.opposite) {
        throw ContractViolation(std::format(
            "Road '{}' is one-way and has no opposite direction", road.identification));
    }
    return *road.opposite;
}

DirectionState& RoadNetwork::directionState(RoadId id, Direction direction) {
    RoadData& road = mutableRoad(id);
    if (direction == Direction::Forth) {
        return road.forth;
    }
    if (!road.opposite) {
        throw ContractViolation(std::format(
            "Road '{}' is one-way and has no opposite direction", road.identification));
    }
    return *road.opposite;
}

float RoadNetwork::getCurrentDelay(RoadId id, Direction direction) const {
    return directionState(id, direction).currentDelay;
}

void RoadNetwork::setCurrentDelay(RoadId id, Direction direction, float delay) {
    if (!road::isValidDelay(delay)) {
        throw ContractViolation(std::format("Delay must be non-negative, got {}", delay));
    }
    directionState(id, direction).currentDelay = delay;
}

bool RoadNetwork::isBlocked(RoadId id, Direction direction) const {
    return directionState(id, direction).blocked;
}

void RoadNetwork::setBlocked(RoadId id, Direction direction, bool blocked) {
    directionState(id, direction).blocked = blocked;
    LOG_DEBUG("Road {} {} direction {}", id, directionName(direction),
              blocked ? "blocked" : "unblocked");
}

// ===== Road lifecycle =====

void RoadNetwork::terminateRoad(RoadId id) {
    RoadData& road = mutableRoad(id);
    if (road.terminated) return;

    road.terminated = true;
    std::set<RouteId> users;
    users.swap(road.routes);
    for (RouteId routeId : users) {
        purgeSegment(routeId, SegmentRef::road(id));
    }

    registry_.release(road.identification);
    road.length = road::TERMINATED_LENGTH;
    road.averageSpeed = road::TERMINATED_SPEED;
    road.speedLimit = road::TERMINATED_SPEED;

    LOG_INFO("Terminated road '{}' (id={}), removed from {} route(s)",
             road.identification, id, users.size());
}

bool RoadNetwork::isRoadTerminated(RoadId id) const {
    return getRoad(id).terminated;
}

// ===== Route access =====

bool RoadNetwork::hasRoute(RouteId id) const {
    return id < routes_.size();
}

const RouteData& RoadNetwork::getRoute(RouteId id) const {
    if (!hasRoute(id)) {
        throw std::out_of_range("Invalid route ID: " + std::to_string(id));
    }
    return routes_[id];
}

RouteData& RoadNetwork::mutableRoute(RouteId id) {
    if (!hasRoute(id)) {
        throw std::out_of_range("Invalid route ID: " + std::to_string(id));
    }
    return routes_[id];
}

std::optional<RouteData> RoadNetwork::tryGetRoute(RouteId id) const {
    if (!hasRoute(id)) {
        return std::nullopt;
    }
    return routes_[id];
}

std::vector<RouteId> RoadNetwork::routes() const {
    std::vector<RouteId> result;
    result.reserve(routes_.size());
    for (const auto& route : routes_) {
        result.push_back(route.id);
    }
    return result;
}

bool RoadNetwork::hasSegment(SegmentRef segment) const {
    return segment.isRoad() ? hasRoad(segment.id) : hasRoute(segment.id);
}

void RoadNetwork::requireSegment(SegmentRef segment) const {
    if (!hasSegment(segment)) {
        throw std::out_of_range("Invalid segment: " + describe(segment));
    }
}

// ===== Route construction =====

RouteId RoadNetwork::createRoute(Location startLocation, const std::vector<SegmentRef>& segments) {
    if (!geometry::isValidLocation(startLocation)) {
        throw InvalidLocationError(startLocation);
    }
    if (segments.empty()) {
        throw InvalidSegmentError("A route needs at least one segment");
    }
    for (const auto& segment : segments) {
        requireSegment(segment);
    }

    RouteId id = static_cast<RouteId>(routes_.size());
    RouteData data;
    data.id = id;
    data.startLocation = startLocation;
    routes_.push_back(std::move(data));

    try {
        for (const auto& segment : segments) {
            appendChecked(id, segment);
        }
    } catch (const RoadNetworkError&) {
        // Undo the registrations made so far; the route was never handed out
        for (const auto& segment : routes_[id].segments) {
            if (segment.isRoad()) {
                roads_[segment.id].routes.erase(id);
            } else {
                auto& usedBy = routes_[segment.id].usedBy;
                usedBy.erase(std::remove(usedBy.begin(), usedBy.end(), id), usedBy.end());
            }
        }
        routes_.pop_back();
        throw;
    }

    LOG_DEBUG("Created route {} with {} segment(s)", id, segments.size());
    return id;
}

// ===== Route queries =====

Location RoadNetwork::getStartLocation(RouteId id) const {
    return getRoute(id).startLocation;
}

std::optional<Location> RoadNetwork::getEndLocation(RouteId id) const {
    return RouteChain(*this).endLocation(id);
}

const std::vector<SegmentRef>& RoadNetwork::getSegments(RouteId id) const {
    return getRoute(id).segments;
}

SegmentRef RoadNetwork::getSegmentAt(RouteId id, size_t index) const {
    const RouteData& route = getRoute(id);
    if (index >= route.segments.size()) {
        throw ContractViolation(std::format(
            "Segment index {} out of range for route {} ({} segments)",
            index, id, route.segments.size()));
    }
    return route.segments[index];
}

size_t RoadNetwork::segmentCount(RouteId id) const {
    return getRoute(id).segments.size();
}

bool RoadNetwork::hasAsSegment(RouteId id, SegmentRef segment) const {
    const auto& segments = getRoute(id).segments;
    return std::find(segments.begin(), segments.end(), segment) != segments.end();
}

bool RoadNetwork::hasAsSubSegment(SegmentRef segment, SegmentRef other) const {
    return RouteChain(*this).hasAsSubSegment(segment, other);
}

bool RoadNetwork::canHaveAsSegment(RouteId id, SegmentRef segment) const {
    return RouteChain(*this).canHaveAsSegment(id, segment);
}

bool RoadNetwork::hasProperSegments(RouteId id) const {
    return RouteChain(*this).hasProperSegments(id);
}

int64_t RoadNetwork::getTotalLength(RouteId id) const {
    return RouteChain(*this).totalLength(id);
}

bool RoadNetwork::isTraversable(RouteId id) const {
    return RouteChain(*this).isTraversable(id);
}

std::vector<Location> RoadNetwork::getLocationsVisited(RouteId id) const {
    return RouteChain(*this).locationsVisited(id);
}

// ===== Route mutation =====

void RoadNetwork::attach(RouteId route, SegmentRef segment) {
    if (segment.isRoad()) {
        roads_[segment.id].routes.insert(route);
        return;
    }
    auto& usedBy = routes_[segment.id].usedBy;
    if (std::find(usedBy.begin(), usedBy.end(), route) == usedBy.end()) {
        usedBy.push_back(route);
    }
}

void RoadNetwork::detachIfUnused(RouteId route, SegmentRef segment) {
    if (hasAsSegment(route, segment)) return;

    if (segment.isRoad()) {
        roads_[segment.id].routes.erase(route);
        return;
    }
    auto& usedBy = routes_[segment.id].usedBy;
    usedBy.erase(std::remove(usedBy.begin(), usedBy.end(), route), usedBy.end());
}

void RoadNetwork::appendChecked(RouteId id, SegmentRef segment) {
    RouteChain chain(*this);
    if (!chain.canHaveAsSegment(id, segment)) {
        LOG_DEBUG("Rejected {} for route {}: does not continue the route", describe(segment), id);
        throw InvalidSegmentError(std::format(
            "{} cannot be appended to route {}", describe(segment), id));
    }

    routes_[id].segments.push_back(segment);
    attach(id, segment);

    if (!chain.hasProperSegments(id)) {
        routes_[id].segments.pop_back();
        detachIfUnused(id, segment);
        LOG_DEBUG("Rejected {} for route {}: route would not be proper", describe(segment), id);
        throw InvalidSegmentError(std::format(
            "Appending {} leaves route {} without proper segments", describe(segment), id));
    }
}

void RoadNetwork::addSegment(RouteId id, SegmentRef segment) {
    if (getRoute(id).terminated) {
        throw InvalidStateError(std::format("Route {} is terminated", id));
    }
    requireSegment(segment);
    appendChecked(id, segment);
}

void RoadNetwork::eraseChecked(RouteId id, size_t index) {
    RouteData& route = mutableRoute(id);

    std::vector<SegmentRef> remaining = route.segments;
    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(index));
    if (!remaining.empty() &&
        !RouteChain(*this).isChained({route.startLocation, remaining})) {
        throw InvalidSegmentError(std::format(
            "Removing segment {} breaks the chaining of route {}", index, id));
    }

    SegmentRef removed = route.segments[index];
    route.segments = std::move(remaining);
    detachIfUnused(id, removed);
}

void RoadNetwork::removeSegment(RouteId id, SegmentRef segment) {
    const auto& segments = getRoute(id).segments;
    auto it = std::find(segments.begin(), segments.end(), segment);
    if (it == segments.end()) {
        throw ContractViolation(std::format("Route {} does not hold {}", id, describe(segment)));
    }
    eraseChecked(id, static_cast<size_t>(it - segments.begin()));
}

void RoadNetwork::removeSegmentAt(RouteId id, size_t index) {
    if (index >= getRoute(id).segments.size()) {
        throw ContractViolation(std::format(
            "Segment index {} out of range for route {} ({} segments)",
            index, id, getRoute(id).segments.size()));
    }
    eraseChecked(id, index);
}

void RoadNetwork::changeSegment(RouteId id, size_t index, SegmentRef segment) {
    RouteData& route = mutableRoute(id);
    if (index >= route.segments.size()) {
        throw ContractViolation(std::format(
            "Segment index {} out of range for route {} ({} segments)",
            index, id, route.segments.size()));
    }
    requireSegment(segment);

    RouteChain chain(*this);
    SegmentRef previous = route.segments[index];
    auto oldEnds = chain.endpoints(previous);
    auto newEnds = chain.endpoints(segment);
    if (!oldEnds || !newEnds ||
        !geometry::sameEndpointPair(oldEnds->first, oldEnds->second,
                                    newEnds->first, newEnds->second)) {
        throw InvalidSegmentError(std::format(
            "{} does not connect the same locations as {}", describe(segment), describe(previous)));
    }

    bool terminated = segment.isRoad() ? roads_[segment.id].terminated
                                       : routes_[segment.id].terminated;
    if (terminated) {
        throw InvalidSegmentError(std::format("{} is terminated", describe(segment)));
    }
    if (chain.hasAsSubSegment(segment, SegmentRef::route(id))) {
        throw InvalidSegmentError(std::format(
            "{} contains route {}", describe(segment), id));
    }

    std::vector<SegmentRef> candidate = route.segments;
    candidate[index] = segment;
    if (!chain.isChained({route.startLocation, candidate})) {
        throw InvalidSegmentError(std::format(
            "Replacing segment {} by {} breaks the chaining of route {}",
            index, describe(segment), id));
    }

    route.segments = std::move(candidate);
    attach(id, segment);
    detachIfUnused(id, previous);
}

void RoadNetwork::purgeSegment(RouteId id, SegmentRef segment) {
    RouteData& route = mutableRoute(id);
    route.segments.erase(std::remove(route.segments.begin(), route.segments.end(), segment),
                         route.segments.end());
    detachIfUnused(id, segment);

    if (!route.terminated && !route.segments.empty() && !RouteChain(*this).hasProperSegments(id)) {
        LOG_WARN("Route {} no longer has proper segments after losing {}", id, describe(segment));
    }
}

// ===== Route lifecycle =====

void RoadNetwork::terminateRoute(RouteId id) {
    if (mutableRoute(id).terminated) return;
    routes_[id].terminated = true;

    // Segments detach themselves from this route while terminating
    std::vector<SegmentRef> segments = routes_[id].segments;
    for (const auto& segment : segments) {
        terminate(segment);
    }
    routes_[id].segments.clear();

    std::vector<RouteId> parents;
    parents.swap(routes_[id].usedBy);
    for (RouteId parent : parents) {
        purgeSegment(parent, SegmentRef::route(id));
    }

    LOG_INFO("Terminated route {} ({} segment(s), {} parent route(s))",
             id, segments.size(), parents.size());
}

bool RoadNetwork::isRouteTerminated(RouteId id) const {
    return getRoute(id).terminated;
}

void RoadNetwork::terminate(SegmentRef segment) {
    if (segment.isRoad()) {
        terminateRoad(segment.id);
    } else {
        terminateRoute(segment.id);
    }
}

}  // namespace roadnet
