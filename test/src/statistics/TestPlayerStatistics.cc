#include "statistics/PlayerStatistics.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using Landlord::Statistics::PlayerStatistics;
using Landlord::Statistics::RunningMilestone;

namespace {

template<typename T>
std::string toString(const T& t)
{
    auto os = std::ostringstream {};
    os << t;
    return os.str();
}

}

TEST(PlayerStatisticsTest, testRunningMilestoneOutput)
{
    EXPECT_EQ("200 @ 3", toString(RunningMilestone {200, 3}));
    EXPECT_EQ("0 @ (none)", toString(RunningMilestone {}));
}

TEST(PlayerStatisticsTest, testOutputIncludesRunningMilestones)
{
    auto stats = PlayerStatistics {};
    stats.playerId = "alice";
    stats.runningPeak = RunningMilestone {200, 0};
    stats.runningTrough = RunningMilestone {-300, 2};
    const auto output = toString(stats);
    EXPECT_NE(std::string::npos, output.find("alice"));
    EXPECT_NE(std::string::npos, output.find("200 @ 0"));
    EXPECT_NE(std::string::npos, output.find("-300 @ 2"));
}

TEST(PlayerStatisticsTest, testRatesWithoutRounds)
{
    const auto stats = PlayerStatistics {};
    EXPECT_EQ(0.0, winRate(stats));
    EXPECT_EQ(0.0, landlordWinRate(stats));
    EXPECT_EQ(0.0, farmerWinRate(stats));
    EXPECT_EQ(0.0, doubledWinRate(stats));
    EXPECT_EQ(0.0, matchWinRate(stats));
    EXPECT_EQ(0.0, averageScorePerRound(stats));
}
