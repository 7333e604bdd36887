#include "roadnet/core/Errors.h"

#include <format>

namespace roadnet {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidIdentification:
            return "InvalidIdentification";
        case ErrorCode::DuplicateIdentification:
            return "DuplicateIdentification";
        case ErrorCode::InvalidSpeedLimit:
            return "InvalidSpeedLimit";
        case ErrorCode::InvalidAverageSpeed:
            return "InvalidAverageSpeed";
        case ErrorCode::InvalidLength:
            return "InvalidLength";
        case ErrorCode::InvalidLocation:
            return "InvalidLocation";
        case ErrorCode::InvalidSegment:
            return "InvalidSegment";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::ContractViolation:
            return "ContractViolation";
        case ErrorCode::UnknownHandle:
            return "UnknownHandle";
        default:
            return "Unknown";
    }
}

RoadNetworkError::RoadNetworkError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

InvalidIdentificationError::InvalidIdentificationError(const std::string& identification)
    : RoadNetworkError(ErrorCode::InvalidIdentification,
                       std::format("Invalid road identification '{}'", identification)),
      identification_(identification) {}

DuplicateIdentificationError::DuplicateIdentificationError(const std::string& identification)
    : RoadNetworkError(ErrorCode::DuplicateIdentification,
                       std::format("Road identification '{}' is already in use", identification)),
      identification_(identification) {}

InvalidSpeedLimitError::InvalidSpeedLimitError(float speedLimit)
    : RoadNetworkError(ErrorCode::InvalidSpeedLimit,
                       std::format("Invalid speed limit {}", speedLimit)),
      speedLimit_(speedLimit) {}

InvalidAverageSpeedError::InvalidAverageSpeedError(float averageSpeed, float speedLimit)
    : RoadNetworkError(ErrorCode::InvalidAverageSpeed,
                       std::format("Average speed {} is not within [0, {}]", averageSpeed, speedLimit)),
      averageSpeed_(averageSpeed),
      speedLimit_(speedLimit) {}

InvalidLengthError::InvalidLengthError(int length)
    : RoadNetworkError(ErrorCode::InvalidLength,
                       std::format("Invalid identification length {}", length)),
      length_(length) {}

InvalidLocationError::InvalidLocationError(const Location& location)
    : RoadNetworkError(ErrorCode::InvalidLocation,
                       std::format("Location ({}, {}) is out of bounds",
                                   location.latitude, location.longitude)),
      location_(location) {}

InvalidSegmentError::InvalidSegmentError(const std::string& message)
    : RoadNetworkError(ErrorCode::InvalidSegment, message) {}

InvalidStateError::InvalidStateError(const std::string& message)
    : RoadNetworkError(ErrorCode::InvalidState, message) {}

ContractViolation::ContractViolation(const std::string& message)
    : std::logic_error(message) {}

}  // namespace roadnet
