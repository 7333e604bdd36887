#pragma once

#include "roadnet/core/Errors.h"

#include <stdexcept>
#include <string>

namespace roadnet {

/// Single error type thrown by RoadNetworkFacade
///
/// Wraps domain errors, contract violations and unknown handles alike;
/// code() tells them apart.
class ModelError : public std::runtime_error {
public:
    ModelError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

}  // namespace roadnet
