#pragma once

#include <string>
#include <vector>

namespace roadnet {

/// Format rules for road identifications
///
/// An identification is an upper-case letter followed by characters from
/// the allowed set. By default the total length is 2 or 3 and the allowed
/// set is the decimal digits; both can be extended.
///
/// Example usage:
/// @code
/// IdentificationRules rules = IdentificationRules::createDefault();
/// rules.allowLengths({4});
/// rules.allowCharacters("-");
/// rules.isValid("E4-1");  // true
/// @endcode
struct IdentificationRules {
    std::vector<int> extraLengths;     ///< Accepted in addition to 2 and 3
    std::string extraCharacters;       ///< Accepted after the leading letter, in addition to 0-9

    static IdentificationRules createDefault() { return {}; }

    /// Accept additional identification lengths
    /// @throws InvalidLengthError if a length is not within (0, INT_MAX);
    ///         the rules are left unchanged in that case
    IdentificationRules& allowLengths(const std::vector<int>& lengths);

    /// Accept additional characters after the leading letter
    IdentificationRules& allowCharacters(const std::string& characters);

    bool isAllowedLength(size_t length) const;
    bool isAllowedTrailingCharacter(char c) const;

    /// Check an identification against these rules
    bool isValid(const std::string& identification) const;

    bool operator==(const IdentificationRules& o) const = default;
};

/// Configuration of a RoadNetwork
struct NetworkConfig {
    static constexpr float DEFAULT_SPEED_LIMIT = 19.5f;

    IdentificationRules identification;
    float defaultSpeedLimit = DEFAULT_SPEED_LIMIT;  ///< Used when a road is created without a speed limit

    static NetworkConfig createDefault() { return {}; }

    bool operator==(const NetworkConfig& o) const = default;
};

}  // namespace roadnet
