#include "roadnet/config/NetworkConfig.h"
#include "roadnet/core/Errors.h"
#include "roadnet/core/Road.h"

#include <algorithm>

namespace roadnet {

namespace {
constexpr size_t DEFAULT_LENGTHS[] = {2, 3};
}

IdentificationRules& IdentificationRules::allowLengths(const std::vector<int>& lengths) {
    for (int length : lengths) {
        if (!road::canHaveAsLength(length)) {
            throw InvalidLengthError(length);
        }
    }
    extraLengths.insert(extraLengths.end(), lengths.begin(), lengths.end());
    return *this;
}

IdentificationRules& IdentificationRules::allowCharacters(const std::string& characters) {
    extraCharacters += characters;
    return *this;
}

bool IdentificationRules::isAllowedLength(size_t length) const {
    for (size_t allowed : DEFAULT_LENGTHS) {
        if (length == allowed) return true;
    }
    return std::any_of(extraLengths.begin(), extraLengths.end(),
                       [length](int extra) { return static_cast<size_t>(extra) == length; });
}

bool IdentificationRules::isAllowedTrailingCharacter(char c) const {
    if (c >= '0' && c <= '9') return true;
    return extraCharacters.find(c) != std::string::npos;
}

bool IdentificationRules::isValid(const std::string& identification) const {
    if (!isAllowedLength(identification.size())) {
        return false;
    }
    if (identification[0] < 'A' || identification[0] > 'Z') {
        return false;
    }
    return std::all_of(identification.begin() + 1, identification.end(),
                       [this](char c) { return isAllowedTrailingCharacter(c); });
}

}  // namespace roadnet
