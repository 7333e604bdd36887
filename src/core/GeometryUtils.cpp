#include "roadnet/core/GeometryUtils.h"

namespace roadnet {
namespace geometry {

bool isValidLocation(const Location& location) {
    return location.latitude >= MIN_DEGREES && location.latitude <= MAX_DEGREES &&
           location.longitude >= MIN_DEGREES && location.longitude <= MAX_DEGREES;
}

bool touches(const Location& location, const Location& endPoint1, const Location& endPoint2) {
    return location == endPoint1 || location == endPoint2;
}

bool sharesEndpoint(const Location& a1, const Location& a2,
                    const Location& b1, const Location& b2) {
    return touches(a1, b1, b2) || touches(a2, b1, b2);
}

bool sameEndpointPair(const Location& a1, const Location& a2,
                      const Location& b1, const Location& b2) {
    return (a1 == b1 && a2 == b2) || (a1 == b2 && a2 == b1);
}

Location otherEndpoint(const Location& from, const Location& endPoint1, const Location& endPoint2) {
    return from == endPoint1 ? endPoint2 : endPoint1;
}

}  // namespace geometry
}  // namespace roadnet
