#include <gtest/gtest.h>
#include <roadnet/core/Errors.h>
#include <roadnet/core/RoadNetwork.h>

#include <limits>

using namespace roadnet;

namespace {
const Location P1{3.4, 8.6};
const Location P2{13.8, 22.0};
const Location P3{45.3, 18.1};
const Location P4{27.9, 20.6};
}

class RouteQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        a1 = network.addOneWayRoad("A1", P1, P2, 10000, 33.0f, 28.0f);
        n3 = network.addTwoWayRoad("N3", P2, P3, 2000, 23.0f, 8.0f);
        a23 = network.addTwoWayRoad("A23", P3, P4, 7000, 33.0f, 28.0f);
        n1 = network.addTwoWayRoad("N1", P2, P3, 4000, 25.0f, 20.0f);
    }

    static SegmentRef road(RoadId id) { return SegmentRef::road(id); }

    RoadNetwork network;
    RoadId a1 = INVALID_ROAD;
    RoadId n3 = INVALID_ROAD;
    RoadId a23 = INVALID_ROAD;
    RoadId n1 = INVALID_ROAD;
};

// ============================================================================
// Basic accessors
// ============================================================================

TEST_F(RouteQueryTest, Accessors) {
    RouteId route = network.createRoute(P1, {road(a1), road(n1)});

    EXPECT_TRUE(network.hasRoute(route));
    EXPECT_EQ(network.routeCount(), 1u);
    EXPECT_EQ(network.routes(), std::vector<RouteId>{route});
    EXPECT_EQ(network.getStartLocation(route), P1);
    EXPECT_EQ(network.getSegments(route), (std::vector<SegmentRef>{road(a1), road(n1)}));
    EXPECT_TRUE(network.hasAsSegment(route, road(n1)));
    EXPECT_FALSE(network.hasAsSegment(route, road(n3)));

    EXPECT_FALSE(network.hasRoute(5));
    EXPECT_THROW(network.getRoute(5), std::out_of_range);
    EXPECT_FALSE(network.tryGetRoute(5).has_value());
    EXPECT_TRUE(network.hasSegment(SegmentRef::route(route)));
    EXPECT_FALSE(network.hasSegment(SegmentRef::route(5)));
}

// ============================================================================
// Total length
// ============================================================================

TEST_F(RouteQueryTest, TotalLength) {
    RouteId route = network.createRoute(P1, {road(a1), road(n1)});
    EXPECT_EQ(network.getTotalLength(route), 14000);

    network.addSegment(route, road(a23));
    EXPECT_EQ(network.getTotalLength(route), 21000);
}

TEST_F(RouteQueryTest, TotalLengthCountsRepeatedSegments) {
    RouteId route = network.createRoute(P2, {road(n3), road(n1), road(n3)});
    EXPECT_EQ(network.getTotalLength(route), 8000);
}

TEST_F(RouteQueryTest, TotalLengthOfNestedRoutes) {
    RouteId inner = network.createRoute(P1, {road(a1)});
    RouteId outer = network.createRoute(P1, {SegmentRef::route(inner), road(n1), road(a23)});
    EXPECT_EQ(network.getTotalLength(outer), 21000);
}

TEST_F(RouteQueryTest, TotalLengthDoesNotOverflow) {
    RoadId big1 = network.addTwoWayRoad("B1", P1, P4, std::numeric_limits<int>::max() - 1, 10.0f);
    RoadId big2 = network.addTwoWayRoad("B2", P4, P1, std::numeric_limits<int>::max() - 1, 10.0f);
    RouteId route = network.createRoute(P1, {road(big1), road(big2)});

    EXPECT_EQ(network.getTotalLength(route),
              2 * static_cast<int64_t>(std::numeric_limits<int>::max() - 1));
}

// ============================================================================
// Traversability
// ============================================================================

TEST_F(RouteQueryTest, TraversableUntilBlocked) {
    RouteId route = network.createRoute(P1, {road(a1), road(n1)});
    EXPECT_TRUE(network.isTraversable(route));

    network.setBlocked(n1, Direction::Forth, true);
    EXPECT_FALSE(network.isTraversable(route));

    network.setBlocked(n1, Direction::Forth, false);
    EXPECT_TRUE(network.isTraversable(route));
}

TEST_F(RouteQueryTest, TraversabilityUsesTravelDirection) {
    // N1 is driven from P3 to P2, the opposite direction
    RouteId route = network.createRoute(P4, {road(a23), road(n1)});

    network.setBlocked(n1, Direction::Forth, true);
    EXPECT_TRUE(network.isTraversable(route));

    network.setBlocked(n1, Direction::Opposite, true);
    EXPECT_FALSE(network.isTraversable(route));
}

TEST_F(RouteQueryTest, BlockedOneWayRoad) {
    RouteId route = network.createRoute(P1, {road(a1)});
    network.setBlocked(a1, Direction::Forth, true);
    EXPECT_FALSE(network.isTraversable(route));
}

TEST_F(RouteQueryTest, RoadUsedInBothDirections) {
    RouteId route = network.createRoute(P2, {road(n1), road(n3), road(n1)});

    network.setBlocked(n1, Direction::Opposite, true);
    EXPECT_TRUE(network.isTraversable(route));

    network.setBlocked(n3, Direction::Opposite, true);
    EXPECT_FALSE(network.isTraversable(route));
}

TEST_F(RouteQueryTest, SelfLoopBlockedForthIsNotTraversable) {
    RoadId loop = network.addTwoWayRoad("L1", P3, P3, 300, 10.0f);
    RouteId route = network.createRoute(P3, {road(loop)});
    EXPECT_TRUE(network.isTraversable(route));

    network.setBlocked(loop, Direction::Forth, true);
    EXPECT_FALSE(network.isTraversable(route));
}

TEST_F(RouteQueryTest, SelfLoopBlockedOppositeIsNotTraversable) {
    RoadId loop = network.addTwoWayRoad("L1", P3, P3, 300, 10.0f);
    RouteId route = network.createRoute(P2, {road(n1), road(loop)});

    network.setBlocked(loop, Direction::Opposite, true);
    EXPECT_FALSE(network.isTraversable(route));

    network.setBlocked(loop, Direction::Opposite, false);
    EXPECT_TRUE(network.isTraversable(route));
}

TEST_F(RouteQueryTest, TraversabilityOfNestedRoutes) {
    RouteId inner = network.createRoute(P2, {road(n1)});
    RouteId outer = network.createRoute(P1, {road(a1), SegmentRef::route(inner)});

    EXPECT_TRUE(network.isTraversable(outer));
    network.setBlocked(n1, Direction::Forth, true);
    EXPECT_FALSE(network.isTraversable(outer));
}

// ============================================================================
// Visited locations
// ============================================================================

TEST_F(RouteQueryTest, LocationsVisited) {
    RouteId route = network.createRoute(P1, {road(a1), road(n1), road(a23)});
    EXPECT_EQ(network.getLocationsVisited(route), (std::vector<Location>{P1, P2, P3, P4}));
}

TEST_F(RouteQueryTest, LocationsVisitedBackAndForth) {
    RouteId route = network.createRoute(P2, {road(n3), road(n1)});
    EXPECT_EQ(network.getLocationsVisited(route), (std::vector<Location>{P2, P3, P2}));
}

TEST_F(RouteQueryTest, LocationsVisitedSkipsSelfLoop) {
    RoadId loop = network.addTwoWayRoad("L1", P3, P3, 300, 10.0f);
    RouteId route = network.createRoute(P2, {road(n1), road(loop), road(a23)});
    EXPECT_EQ(network.getLocationsVisited(route), (std::vector<Location>{P2, P3, P4}));
}

TEST_F(RouteQueryTest, LocationsVisitedOfLoneSelfLoop) {
    RoadId loop = network.addTwoWayRoad("L1", P3, P3, 300, 10.0f);
    RouteId route = network.createRoute(P3, {road(loop)});
    EXPECT_EQ(network.getLocationsVisited(route), (std::vector<Location>{P3, P3}));
}

TEST_F(RouteQueryTest, LocationsVisitedOfSingleRoad) {
    RouteId route = network.createRoute(P3, {road(n1)});
    EXPECT_EQ(network.getLocationsVisited(route), (std::vector<Location>{P3, P2}));
}

TEST_F(RouteQueryTest, LocationsVisitedSplicesNestedRoutes) {
    RouteId inner = network.createRoute(P2, {road(n1), road(a23)});
    RouteId outer = network.createRoute(P1, {road(a1), SegmentRef::route(inner)});
    EXPECT_EQ(network.getLocationsVisited(outer), (std::vector<Location>{P1, P2, P3, P4}));
}

// ============================================================================
// Improper routes
// ============================================================================

TEST_F(RouteQueryTest, QueriesOnImproperRouteThrow) {
    RouteId route = network.createRoute(P1, {road(a1), road(n1), road(a23)});
    network.terminateRoad(n1);

    ASSERT_FALSE(network.hasProperSegments(route));
    EXPECT_THROW(network.getTotalLength(route), InvalidStateError);
    EXPECT_THROW(network.isTraversable(route), InvalidStateError);
    EXPECT_THROW(network.getLocationsVisited(route), InvalidStateError);
}
