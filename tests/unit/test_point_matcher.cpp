/**
 * @file test_point_matcher.cpp
 * @brief Unit tests for identifier matching and input validation
 */

#include <sitecal/point_matcher.hpp>
#include <sitecal/errors.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace sitecal {
namespace {

GlobalPoint G(const std::string& id, double lat = -33.4, double lon = -70.5, double h = 500.0) {
    GlobalPoint p;
    p.id = id;
    p.geodetic.latitude = lat;
    p.geodetic.longitude = lon;
    p.geodetic.ellipsoidal_height = h;
    return p;
}

LocalPoint L(const std::string& id, double e = 1000.0, double n = 2000.0, double h = 470.0) {
    LocalPoint p;
    p.id = id;
    p.local.easting = e;
    p.local.northing = n;
    p.local.elevation = h;
    return p;
}

class PointMatcherTest : public ::testing::Test {
protected:
    Config config_;
    PointMatcher matcher_{config_};
};

TEST_F(PointMatcherTest, MatchesInGlobalOrderAndReportsLeftovers) {
    std::vector<GlobalPoint> global = {G("C"), G("A"), G("X"), G("B")};
    std::vector<LocalPoint> local = {L("A", 1.0), L("B", 2.0), L("C", 3.0), L("Y")};

    MatchResult result = matcher_.match(global, local);
    ASSERT_EQ(result.records.size(), 3u);
    EXPECT_EQ(result.records[0].id, "C");
    EXPECT_EQ(result.records[1].id, "A");
    EXPECT_EQ(result.records[2].id, "B");
    EXPECT_DOUBLE_EQ(result.records[0].local.easting, 3.0);
    EXPECT_DOUBLE_EQ(result.records[1].local.easting, 1.0);

    ASSERT_EQ(result.unmatched_global.size(), 1u);
    EXPECT_EQ(result.unmatched_global[0], "X");
    ASSERT_EQ(result.unmatched_local.size(), 1u);
    EXPECT_EQ(result.unmatched_local[0], "Y");
}

TEST_F(PointMatcherTest, IdentifiersAreCaseSensitive) {
    std::vector<GlobalPoint> global = {G("a"), G("B"), G("C"), G("D")};
    std::vector<LocalPoint> local = {L("A"), L("B"), L("C"), L("D")};

    MatchResult result = matcher_.match(global, local);
    EXPECT_EQ(result.records.size(), 3u);
    EXPECT_EQ(result.unmatched_global[0], "a");
}

TEST_F(PointMatcherTest, FewerThanThreeMatchesThrows) {
    std::vector<GlobalPoint> global = {G("A"), G("B"), G("C")};
    std::vector<LocalPoint> local = {L("A"), L("B"), L("Z")};

    try {
        matcher_.match(global, local);
        FAIL() << "Expected InputError";
    } catch (const InputError& e) {
        EXPECT_NE(std::string(e.what()).find("Found only 2 common points"), std::string::npos);
    }
}

TEST_F(PointMatcherTest, MinimumIsConfigurable) {
    Config config;
    config.min_matched_points = 4;
    PointMatcher matcher(config);

    std::vector<GlobalPoint> global = {G("A"), G("B"), G("C")};
    std::vector<LocalPoint> local = {L("A"), L("B"), L("C")};
    EXPECT_NO_THROW(matcher_.match(global, local));
    EXPECT_THROW(matcher.match(global, local), InputError);
}

TEST_F(PointMatcherTest, DuplicateIdentifiersThrow) {
    std::vector<GlobalPoint> global = {G("A"), G("B"), G("C"), G("A")};
    std::vector<LocalPoint> local = {L("A"), L("B"), L("C")};
    EXPECT_THROW(matcher_.match(global, local), InputError);

    std::vector<GlobalPoint> global_ok = {G("A"), G("B"), G("C")};
    std::vector<LocalPoint> local_dup = {L("A"), L("B"), L("C"), L("B")};
    EXPECT_THROW(matcher_.match(global_ok, local_dup), InputError);
}

TEST_F(PointMatcherTest, EmptyIdentifierThrows) {
    std::vector<GlobalPoint> global = {G("A"), G("B"), G("C"), G("")};
    std::vector<LocalPoint> local = {L("A"), L("B"), L("C")};
    EXPECT_THROW(matcher_.match(global, local), InputError);
}

TEST_F(PointMatcherTest, OutOfRangeCoordinatesThrow) {
    EXPECT_THROW(PointMatcher::validateGlobal({G("A", 90.5, 0.0)}), InputError);
    EXPECT_THROW(PointMatcher::validateGlobal({G("A", 0.0, -180.5)}), InputError);
    EXPECT_NO_THROW(PointMatcher::validateGlobal({G("A", -90.0, 180.0)}));
}

TEST_F(PointMatcherTest, NonFiniteValuesThrow) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(PointMatcher::validateGlobal({G("A", nan)}), InputError);
    EXPECT_THROW(PointMatcher::validateGlobal({G("A", 0.0, 0.0, inf)}), InputError);
    EXPECT_THROW(PointMatcher::validateLocal({L("A", nan)}), InputError);
    EXPECT_THROW(PointMatcher::validateLocal({L("A", 0.0, 0.0, -inf)}), InputError);
}

}  // namespace
}  // namespace sitecal
