#pragma once

#include "NetworkConfig.h"
#include <string>

namespace roadnet {

/// JSON serialization and file I/O for NetworkConfig
///
/// Format:
/// @code
/// {
///   "version": 1,
///   "identification": { "extraLengths": [4], "extraCharacters": "-" },
///   "defaultSpeedLimit": 19.5
/// }
/// @endcode
/// Missing keys fall back to the defaults.
class ConfigSerializer {
public:
    /// Serialize a configuration to a JSON string
    static std::string toJson(const NetworkConfig& config);

    /// Parse a configuration
    /// @throws std::runtime_error if the text is not valid JSON or a field has the wrong type
    /// @throws InvalidLengthError for an extra identification length outside (0, INT_MAX)
    /// @throws InvalidSpeedLimitError for a default speed limit outside (0, SPEED_OF_LIGHT]
    static NetworkConfig fromJson(const std::string& json);

    /// Save a configuration to file
    /// @return true if save succeeded
    static bool saveToFile(const NetworkConfig& config, const std::string& path);

    /// Load a configuration from file
    /// @throws std::runtime_error if the file cannot be read, plus everything fromJson throws
    static NetworkConfig loadFromFile(const std::string& path);
};

}  // namespace roadnet
