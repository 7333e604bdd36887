#include <gtest/gtest.h>
#include <roadnet/core/Errors.h>
#include <roadnet/core/RoadNetwork.h>

#include <limits>

using namespace roadnet;

namespace {
const Location P1{3.4, 8.6};
const Location P2{13.8, 22.0};
const Location P3{45.3, 18.1};
}

class RoadTest : public ::testing::Test {
protected:
    RoadNetwork network;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(RoadTest, CreateOneWayRoad) {
    RoadId id = network.addOneWayRoad("A1", P1, P2, 10000, 33.0f, 28.0f);

    ASSERT_TRUE(network.hasRoad(id));
    const RoadData& road = network.getRoad(id);
    EXPECT_EQ(road.identification, "A1");
    EXPECT_EQ(road.endPoint1, P1);
    EXPECT_EQ(road.endPoint2, P2);
    EXPECT_EQ(road.length, 10000);
    EXPECT_FLOAT_EQ(road.speedLimit, 33.0f);
    EXPECT_FLOAT_EQ(road.averageSpeed, 28.0f);
    EXPECT_TRUE(road.isOneWay());
    EXPECT_FALSE(road.opposite.has_value());
    EXPECT_FLOAT_EQ(network.getCurrentDelay(id, Direction::Forth), 0.0f);
    EXPECT_FALSE(network.isBlocked(id, Direction::Forth));
    EXPECT_FALSE(road.terminated);
    EXPECT_TRUE(network.identifications().contains("A1"));
}

TEST_F(RoadTest, CreateTwoWayRoad) {
    RoadId id = network.addTwoWayRoad("N3", P2, P3, 2000, 23.0f, 8.0f);

    const RoadData& road = network.getRoad(id);
    EXPECT_FALSE(road.isOneWay());
    ASSERT_TRUE(road.opposite.has_value());
    EXPECT_FLOAT_EQ(network.getCurrentDelay(id, Direction::Opposite), 0.0f);
    EXPECT_FALSE(network.isBlocked(id, Direction::Opposite));
}

TEST_F(RoadTest, DefaultSpeedLimit) {
    RoadId id = network.addTwoWayRoad("N3", P2, P3, 2000, 8.0f);
    EXPECT_FLOAT_EQ(network.getRoad(id).speedLimit, 19.5f);

    // Average speed is checked against the default limit
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, 20.0f), InvalidAverageSpeedError);
}

TEST_F(RoadTest, ConfiguredDefaultSpeedLimit) {
    NetworkConfig config;
    config.defaultSpeedLimit = 30.0f;
    RoadNetwork custom(config);

    RoadId id = custom.addOneWayRoad("A1", P1, P2, 100, 25.0f);
    EXPECT_FLOAT_EQ(custom.getRoad(id).speedLimit, 30.0f);
}

TEST_F(RoadTest, AddRoadFromDefinition) {
    RoadDefinition definition;
    definition.identification = "E40";
    definition.endPoint1 = P1;
    definition.endPoint2 = P3;
    definition.length = -250;
    definition.directionality = Directionality::OneWay;

    RoadId id = network.addRoad(definition);
    const RoadData& road = network.getRoad(id);
    EXPECT_EQ(road.length, 250);
    EXPECT_TRUE(road.isOneWay());
    EXPECT_FLOAT_EQ(road.speedLimit, NetworkConfig::DEFAULT_SPEED_LIMIT);
}

TEST_F(RoadTest, ValidStartAndEndLocations) {
    RoadId oneWay = network.addOneWayRoad("A1", P1, P2, 100, 10.0f);
    RoadId twoWay = network.addTwoWayRoad("N1", P2, P3, 100, 10.0f);

    EXPECT_EQ(network.getRoad(oneWay).validStartLocations(), std::vector<Location>{P1});
    EXPECT_EQ(network.getRoad(oneWay).validEndLocations(), std::vector<Location>{P2});

    std::vector<Location> both{P2, P3};
    EXPECT_EQ(network.getRoad(twoWay).validStartLocations(), both);
    EXPECT_EQ(network.getRoad(twoWay).validEndLocations(), both);
}

TEST_F(RoadTest, HandlesAreSequentialAndUnknownHandlesThrow) {
    RoadId first = network.addOneWayRoad("A1", P1, P2, 100, 10.0f);
    RoadId second = network.addOneWayRoad("A2", P2, P3, 100, 10.0f);

    EXPECT_EQ(second, first + 1);
    EXPECT_EQ(network.roadCount(), 2u);
    EXPECT_EQ(network.roads(), (std::vector<RoadId>{first, second}));

    EXPECT_FALSE(network.hasRoad(42));
    EXPECT_THROW(network.getRoad(42), std::out_of_range);
    EXPECT_FALSE(network.tryGetRoad(42).has_value());
    EXPECT_TRUE(network.tryGetRoad(first).has_value());
}

TEST_F(RoadTest, FindRoadByIdentification) {
    RoadId id = network.addTwoWayRoad("N1", P2, P3, 100, 10.0f);

    ASSERT_TRUE(network.findRoad("N1").has_value());
    EXPECT_EQ(*network.findRoad("N1"), id);
    EXPECT_FALSE(network.findRoad("N2").has_value());
}

// ============================================================================
// Construction failures
// ============================================================================

TEST_F(RoadTest, InvalidIdentificationFormats) {
    EXPECT_THROW(network.addOneWayRoad("a1", P1, P2, 100, 10.0f), InvalidIdentificationError);
    EXPECT_THROW(network.addOneWayRoad("A", P1, P2, 100, 10.0f), InvalidIdentificationError);
    EXPECT_THROW(network.addOneWayRoad("A1234", P1, P2, 100, 10.0f), InvalidIdentificationError);
    EXPECT_THROW(network.addOneWayRoad("AB", P1, P2, 100, 10.0f), InvalidIdentificationError);
    EXPECT_THROW(network.addOneWayRoad("1A", P1, P2, 100, 10.0f), InvalidIdentificationError);
    EXPECT_THROW(network.addOneWayRoad("", P1, P2, 100, 10.0f), InvalidIdentificationError);

    EXPECT_NO_THROW(network.addOneWayRoad("Z9", P1, P2, 100, 10.0f));
    EXPECT_NO_THROW(network.addOneWayRoad("B99", P1, P2, 100, 10.0f));
}

TEST_F(RoadTest, DuplicateIdentification) {
    network.addOneWayRoad("A1", P1, P2, 100, 10.0f);
    EXPECT_THROW(network.addTwoWayRoad("A1", P2, P3, 100, 10.0f), DuplicateIdentificationError);
    EXPECT_EQ(network.roadCount(), 1u);
}

TEST_F(RoadTest, IdentificationsArePerNetwork) {
    RoadNetwork other;
    network.addOneWayRoad("A1", P1, P2, 100, 10.0f);
    EXPECT_NO_THROW(other.addOneWayRoad("A1", P1, P2, 100, 10.0f));
}

TEST_F(RoadTest, InvalidLocation) {
    EXPECT_THROW(network.addOneWayRoad("A1", {-1.0, 5.0}, P2, 100, 10.0f), InvalidLocationError);
    EXPECT_THROW(network.addOneWayRoad("A1", P1, {5.0, 75.0}, 100, 10.0f), InvalidLocationError);
}

TEST_F(RoadTest, InvalidSpeeds) {
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, 0.0f, 0.0f), InvalidSpeedLimitError);
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, -5.0f, 0.0f), InvalidSpeedLimitError);
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, road::SPEED_OF_LIGHT * 2.0f, 0.0f),
                 InvalidSpeedLimitError);
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, 30.0f, 31.0f), InvalidAverageSpeedError);
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, 30.0f, -1.0f), InvalidAverageSpeedError);

    EXPECT_NO_THROW(network.addOneWayRoad("A1", P1, P2, 100, road::SPEED_OF_LIGHT, 0.0f));
}

TEST_F(RoadTest, ConstructionChecksInOrder) {
    // Location is checked before identification
    EXPECT_THROW(network.addOneWayRoad("bad", {80.0, 0.0}, P2, 100, -1.0f, -1.0f),
                 InvalidLocationError);
    // Identification before speed limit
    EXPECT_THROW(network.addOneWayRoad("bad", P1, P2, 100, -1.0f, -1.0f),
                 InvalidIdentificationError);
    // Speed limit before average speed
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, -1.0f, -1.0f),
                 InvalidSpeedLimitError);
}

TEST_F(RoadTest, FailedConstructionLeavesNoTrace) {
    EXPECT_THROW(network.addOneWayRoad("A1", P1, P2, 100, 30.0f, 40.0f), InvalidAverageSpeedError);

    EXPECT_EQ(network.roadCount(), 0u);
    EXPECT_FALSE(network.identifications().contains("A1"));
    EXPECT_NO_THROW(network.addOneWayRoad("A1", P1, P2, 100, 30.0f, 20.0f));
}

TEST_F(RoadTest, ExtendedIdentificationRules) {
    NetworkConfig config;
    config.identification.allowLengths({4}).allowCharacters("-");
    RoadNetwork custom(config);

    EXPECT_NO_THROW(custom.addOneWayRoad("E4-1", P1, P2, 100, 10.0f));
    EXPECT_NO_THROW(custom.addOneWayRoad("A-", P1, P2, 100, 10.0f));
    EXPECT_THROW(custom.addOneWayRoad("E4-12", P1, P2, 100, 10.0f), InvalidIdentificationError);
    EXPECT_THROW(network.addOneWayRoad("E4-1", P1, P2, 100, 10.0f), InvalidIdentificationError);
}

// ============================================================================
// Length repair
// ============================================================================

TEST_F(RoadTest, LengthRepair) {
    constexpr int MAX = std::numeric_limits<int>::max();
    constexpr int MIN = std::numeric_limits<int>::min();

    RoadId id = network.addOneWayRoad("A1", P1, P2, 100, 10.0f);

    network.setLength(id, 500);
    EXPECT_EQ(network.getRoad(id).length, 500);

    network.setLength(id, -500);
    EXPECT_EQ(network.getRoad(id).length, 500);

    network.setLength(id, 0);
    EXPECT_EQ(network.getRoad(id).length, 1);

    network.setLength(id, MAX);
    EXPECT_EQ(network.getRoad(id).length, MAX - 1);

    network.setLength(id, MIN);
    EXPECT_EQ(network.getRoad(id).length, MAX - 1);

    network.setLength(id, MIN + 1);
    EXPECT_EQ(network.getRoad(id).length, MAX - 1);

    network.setLength(id, MIN + 2);
    EXPECT_EQ(network.getRoad(id).length, MAX - 1);

    network.setLength(id, MIN + 3);
    EXPECT_EQ(network.getRoad(id).length, MAX - 2);
}

TEST_F(RoadTest, LengthRepairAtConstruction) {
    RoadId id = network.addOneWayRoad("A1", P1, P2, 0, 10.0f);
    EXPECT_EQ(network.getRoad(id).length, 1);
}

// ============================================================================
// Mutators
// ============================================================================

TEST_F(RoadTest, SetSpeedLimit) {
    RoadId id = network.addOneWayRoad("A1", P1, P2, 100, 30.0f, 20.0f);

    network.setSpeedLimit(id, 25.0f);
    EXPECT_FLOAT_EQ(network.getRoad(id).speedLimit, 25.0f);

    EXPECT_THROW(network.setSpeedLimit(id, 0.0f), InvalidSpeedLimitError);
    EXPECT_THROW(network.setSpeedLimit(id, 15.0f), InvalidAverageSpeedError);
    EXPECT_FLOAT_EQ(network.getRoad(id).speedLimit, 25.0f);
}

TEST_F(RoadTest, SetAverageSpeed) {
    RoadId id = network.addOneWayRoad("A1", P1, P2, 100, 30.0f, 20.0f);

    network.setAverageSpeed(id, 30.0f);
    EXPECT_FLOAT_EQ(network.getRoad(id).averageSpeed, 30.0f);

    EXPECT_THROW(network.setAverageSpeed(id, 30.5f), InvalidAverageSpeedError);
    EXPECT_THROW(network.setAverageSpeed(id, -0.5f), InvalidAverageSpeedError);
    EXPECT_FLOAT_EQ(network.getRoad(id).averageSpeed, 30.0f);
}

TEST_F(RoadTest, SetIdentification) {
    RoadId a1 = network.addOneWayRoad("A1", P1, P2, 100, 10.0f);
    network.addOneWayRoad("N1", P2, P3, 100, 10.0f);

    network.setIdentification(a1, "A2");
    EXPECT_EQ(network.getRoad(a1).identification, "A2");
    EXPECT_FALSE(network.identifications().contains("A1"));
    EXPECT_TRUE(network.identifications().contains("A2"));

    // The old identification is free again
    EXPECT_NO_THROW(network.addOneWayRoad("A1", P1, P3, 100, 10.0f));

    EXPECT_THROW(network.setIdentification(a1, "N1"), DuplicateIdentificationError);
    EXPECT_THROW(network.setIdentification(a1, "n1"), InvalidIdentificationError);
    EXPECT_EQ(network.getRoad(a1).identification, "A2");

    // Re-setting its own identification is accepted
    EXPECT_NO_THROW(network.setIdentification(a1, "A2"));
    EXPECT_TRUE(network.identifications().contains("A2"));
}

TEST_F(RoadTest, DirectionState) {
    RoadId id = network.addTwoWayRoad("N1", P2, P3, 100, 10.0f);

    network.setCurrentDelay(id, Direction::Forth, 12.5f);
    network.setCurrentDelay(id, Direction::Opposite, 3.0f);
    network.setBlocked(id, Direction::Opposite, true);

    EXPECT_FLOAT_EQ(network.getCurrentDelay(id, Direction::Forth), 12.5f);
    EXPECT_FLOAT_EQ(network.getCurrentDelay(id, Direction::Opposite), 3.0f);
    EXPECT_FALSE(network.isBlocked(id, Direction::Forth));
    EXPECT_TRUE(network.isBlocked(id, Direction::Opposite));
}

TEST_F(RoadTest, DirectionContractViolations) {
    RoadId oneWay = network.addOneWayRoad("A1", P1, P2, 100, 10.0f);

    EXPECT_THROW(network.getCurrentDelay(oneWay, Direction::Opposite), ContractViolation);
    EXPECT_THROW(network.setCurrentDelay(oneWay, Direction::Opposite, 1.0f), ContractViolation);
    EXPECT_THROW(network.isBlocked(oneWay, Direction::Opposite), ContractViolation);
    EXPECT_THROW(network.setBlocked(oneWay, Direction::Opposite, true), ContractViolation);

    EXPECT_THROW(network.setCurrentDelay(oneWay, Direction::Forth, -1.0f), ContractViolation);
    EXPECT_FLOAT_EQ(network.getCurrentDelay(oneWay, Direction::Forth), 0.0f);
}
