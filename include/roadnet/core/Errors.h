#pragma once

#include "Types.h"

#include <stdexcept>
#include <string>

namespace roadnet {

/// Cause of a failed network operation
enum class ErrorCode {
    InvalidIdentification,
    DuplicateIdentification,
    InvalidSpeedLimit,
    InvalidAverageSpeed,
    InvalidLength,
    InvalidLocation,
    InvalidSegment,
    InvalidState,
    ContractViolation,
    UnknownHandle
};

/// Convert error code to string
const char* errorCodeToString(ErrorCode code);

/// Base class of all recoverable network errors
class RoadNetworkError : public std::runtime_error {
public:
    RoadNetworkError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/// Identification does not match the configured format
class InvalidIdentificationError : public RoadNetworkError {
public:
    explicit InvalidIdentificationError(const std::string& identification);

    const std::string& identification() const { return identification_; }

private:
    std::string identification_;
};

/// Identification is already carried by an active road
class DuplicateIdentificationError : public RoadNetworkError {
public:
    explicit DuplicateIdentificationError(const std::string& identification);

    const std::string& identification() const { return identification_; }

private:
    std::string identification_;
};

class InvalidSpeedLimitError : public RoadNetworkError {
public:
    explicit InvalidSpeedLimitError(float speedLimit);

    float speedLimit() const { return speedLimit_; }

private:
    float speedLimit_;
};

class InvalidAverageSpeedError : public RoadNetworkError {
public:
    InvalidAverageSpeedError(float averageSpeed, float speedLimit);

    float averageSpeed() const { return averageSpeed_; }
    float speedLimit() const { return speedLimit_; }

private:
    float averageSpeed_;
    float speedLimit_;
};

/// Rejected identification length in a configuration
class InvalidLengthError : public RoadNetworkError {
public:
    explicit InvalidLengthError(int length);

    int length() const { return length_; }

private:
    int length_;
};

class InvalidLocationError : public RoadNetworkError {
public:
    explicit InvalidLocationError(const Location& location);

    const Location& location() const { return location_; }

private:
    Location location_;
};

/// A route edit or construction would break the chaining invariant,
/// create a cycle, or use a terminated segment
class InvalidSegmentError : public RoadNetworkError {
public:
    explicit InvalidSegmentError(const std::string& message);
};

/// Operation requires a state the object is not in
/// (e.g. a derived query on a route whose segments do not chain)
class InvalidStateError : public RoadNetworkError {
public:
    explicit InvalidStateError(const std::string& message);
};

/// Caller broke a precondition. Signals a bug, not a recoverable condition.
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& message);
};

}  // namespace roadnet
