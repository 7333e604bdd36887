#include "roadnet/core/Road.h"

namespace roadnet {
namespace road {

bool canHaveAsLength(int length) {
    return length > 0 && length < MAX_LENGTH;
}

int repairLength(int length) {
    if (canHaveAsLength(length)) {
        return length;
    }
    if (length < 0 && length >= MIN_LENGTH + 2) {
        return -length;
    }
    if (length == 0) {
        return 1;
    }
    return MAX_LENGTH - 1;
}

bool isValidSpeedLimit(float speedLimit) {
    return speedLimit > 0.0f && speedLimit <= SPEED_OF_LIGHT;
}

bool isValidAverageSpeed(float averageSpeed, float speedLimit) {
    return averageSpeed >= 0.0f && averageSpeed <= speedLimit;
}

bool isValidDelay(float delay) {
    return delay >= 0.0f;
}

}  // namespace road

std::vector<Location> RoadData::validStartLocations() const {
    if (isOneWay()) {
        return {endPoint1};
    }
    return {endPoint1, endPoint2};
}

std::vector<Location> RoadData::validEndLocations() const {
    if (isOneWay()) {
        return {endPoint2};
    }
    return {endPoint1, endPoint2};
}

}  // namespace roadnet
