#include <roadnet/roadnet.h>
#include <iostream>

using namespace roadnet;

namespace {

std::ostream& operator<<(std::ostream& os, const Location& location) {
    return os << "{" << location.latitude << "," << location.longitude << "}";
}

void printRoad(const RoadNetwork& network, RoadId id, const std::string& label) {
    const RoadData& road = network.getRoad(id);
    std::cout << label << " '" << road.identification << "'\n"
              << "  end points:     " << road.endPoint1 << " - " << road.endPoint2 << "\n"
              << "  length:         " << road.length << " m\n"
              << "  speed limit:    " << road.speedLimit << " m/s\n"
              << "  average speed:  " << road.averageSpeed << " m/s\n"
              << "  delay forth:    " << network.getCurrentDelay(id, Direction::Forth) << " s\n"
              << "  delay opposite: " << network.getCurrentDelay(id, Direction::Opposite) << " s\n"
              << "  blocked forth:    " << std::boolalpha
              << network.isBlocked(id, Direction::Forth) << "\n"
              << "  blocked opposite: " << network.isBlocked(id, Direction::Opposite) << "\n";
}

}  // namespace

int main() {
    Location location1{3.4, 8.6};
    Location location2{13.8, 22.0};
    Location location3{45.3, 18.1};
    Location location4{27.9, 20.6};

    RoadNetwork network;

    RoadId a1 = network.addOneWayRoad("A1", location1, location2, 10000, 33.0f, 28.0f);
    RoadId countryRoad = network.addTwoWayRoad("N3", location2, location3, 2000, 23.0f, 8.0f);
    RoadId a23 = network.addTwoWayRoad("A23", location3, location4, 7000, 33.0f, 28.0f);
    // Parallel to the country road
    RoadId motorway = network.addTwoWayRoad("N1", location2, location3, 4000, 25.0f, 20.0f);

    printRoad(network, countryRoad, "Country road");
    printRoad(network, motorway, "Motorway");

    const RoadData& n3 = network.getRoad(countryRoad);
    const RoadData& n1 = network.getRoad(motorway);
    std::cout << "Time to traverse the country road: "
              << static_cast<float>(n3.length) / n3.averageSpeed << " s\n"
              << "Time to traverse the motorway:     "
              << static_cast<float>(n1.length) / n1.averageSpeed << " s\n";

    RouteId route = network.createRoute(location1, {SegmentRef::road(a1),
                                                    SegmentRef::road(motorway),
                                                    SegmentRef::road(a23)});

    std::cout << "Total length of the route: " << network.getTotalLength(route) << " m\n"
              << "Locations visited:\n";
    for (const auto& location : network.getLocationsVisited(route)) {
        std::cout << "  " << location << "\n";
    }

    network.setBlocked(motorway, Direction::Forth, true);
    std::cout << "Route still traversable after blocking the motorway: " << std::boolalpha
              << network.isTraversable(route) << "\n";

    return 0;
}
