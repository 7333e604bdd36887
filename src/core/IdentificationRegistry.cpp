#include "roadnet/core/IdentificationRegistry.h"
#include "roadnet/core/Errors.h"

#include <algorithm>

namespace roadnet {

bool IdentificationRegistry::contains(const std::string& identification) const {
    return identifications_.count(identification) > 0;
}

void IdentificationRegistry::acquire(const std::string& identification) {
    if (!identifications_.insert(identification).second) {
        throw DuplicateIdentificationError(identification);
    }
}

void IdentificationRegistry::release(const std::string& identification) {
    identifications_.erase(identification);
}

void IdentificationRegistry::rename(const std::string& from, const std::string& to) {
    if (from == to) return;
    if (contains(to)) {
        throw DuplicateIdentificationError(to);
    }
    identifications_.erase(from);
    identifications_.insert(to);
}

std::vector<std::string> IdentificationRegistry::identifications() const {
    std::vector<std::string> result(identifications_.begin(), identifications_.end());
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace roadnet
