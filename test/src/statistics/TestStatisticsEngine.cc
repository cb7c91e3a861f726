#include "landlord/MatchSummary.hh"
#include "landlord/RoundRecord.hh"
#include "scoring/MatchAggregator.hh"
#include "statistics/PlayerStatistics.hh"
#include "statistics/StatisticsEngine.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <vector>

using Landlord::BidLevel;
using Landlord::MatchSummary;
using Landlord::PlayerId;
using Landlord::RoundRecord;
using Landlord::Seat;
using Landlord::SeatMap;
using Landlord::makeMatch;
using Landlord::makeRound;
using Landlord::Statistics::PlayerStatistics;
using Landlord::Statistics::StreakSummary;
using Landlord::Statistics::computeMatchStatistics;
using Landlord::Statistics::computeStatistics;

namespace {

const auto PLAYER = PlayerId {"alice"};
const auto FIRST_MATCH = std::string {"first"};
const auto SECOND_MATCH = std::string {"second"};
const auto THIRD_MATCH = std::string {"third"};
const auto SECOND_MATCH_PLAYERS = SeatMap<PlayerId> {"dave", "alice", "erin"};

}

class StatisticsEngineTest : public testing::Test {
protected:

    StatisticsEngineTest()
    {
        // alice is at seat A in the first match
        rounds.push_back(
            makeRound(FIRST_MATCH, 0, Seat::A, {200, -100, -100}, Seat::A, true));
        rounds.push_back(
            makeRound(FIRST_MATCH, 1, Seat::B, {-100, 200, -100}, Seat::B));
        rounds.push_back(
            makeRound(FIRST_MATCH, 2, Seat::A, {-400, 200, 200}, Seat::C));
        // legacy record without first bidder and spring flag
        auto legacy = makeRound(
            FIRST_MATCH, 3, Seat::C, {400, 200, -600}, std::nullopt,
            std::nullopt);
        legacy.doubled[Seat::A] = true;
        rounds.push_back(legacy);

        // alice is at seat B in the second match, and dave springs
        auto sprung = makeRound(
            SECOND_MATCH, 0, Seat::A, {400, -200, -200}, Seat::A, true);
        sprung.playerIds = SECOND_MATCH_PLAYERS;
        sprung.playedAt += std::chrono::hours {1};
        rounds.push_back(sprung);

        const auto first_rounds = std::vector(rounds.begin(), rounds.begin() + 4);
        matches.push_back(
            Landlord::Scoring::summarizeMatch(
                makeMatch(FIRST_MATCH), Landlord::Scoring::foldMatch(first_rounds)));
        auto second = makeMatch(SECOND_MATCH);
        second.playerIds = SECOND_MATCH_PLAYERS;
        matches.push_back(
            Landlord::Scoring::summarizeMatch(
                second, Landlord::Scoring::foldMatch({sprung})));
    }

    std::vector<RoundRecord> rounds;
    std::vector<MatchSummary> matches;
};

TEST_F(StatisticsEngineTest, testEmptyHistory)
{
    const auto stats = computeStatistics(PLAYER, {}, {});
    EXPECT_EQ(PLAYER, stats.playerId);
    EXPECT_EQ(0, stats.totalRounds);
    EXPECT_EQ(0, stats.totalMatches);
    EXPECT_EQ(0, stats.bestRoundScore);
    EXPECT_EQ(0, stats.worstSnapshot);
    EXPECT_FALSE(stats.runningPeak.roundIndex);
    EXPECT_FALSE(stats.runningTrough.roundIndex);
    EXPECT_EQ(0.0, winRate(stats));
    EXPECT_EQ(0.0, landlordWinRate(stats));
    EXPECT_EQ(0.0, farmerWinRate(stats));
    EXPECT_EQ(0.0, doubledWinRate(stats));
    EXPECT_EQ(0.0, matchWinRate(stats));
    EXPECT_EQ(0.0, averageScorePerRound(stats));
}

TEST_F(StatisticsEngineTest, testTotals)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(5, stats.totalRounds);
    EXPECT_EQ(2, stats.roundsWon);
    EXPECT_EQ(3, stats.roundsLost);
    EXPECT_EQ(-100, stats.totalScore);
    EXPECT_DOUBLE_EQ(0.4, winRate(stats));
    EXPECT_DOUBLE_EQ(-20.0, averageScorePerRound(stats));
}

TEST_F(StatisticsEngineTest, testRoles)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(2, stats.roundsAsLandlord);
    EXPECT_EQ(1, stats.landlordWins);
    EXPECT_EQ(1, stats.landlordLosses);
    EXPECT_EQ(3, stats.roundsAsFarmer);
    EXPECT_EQ(1, stats.farmerWins);
    EXPECT_EQ(2, stats.farmerLosses);
    EXPECT_DOUBLE_EQ(0.5, landlordWinRate(stats));
    EXPECT_DOUBLE_EQ(1.0 / 3.0, farmerWinRate(stats));
}

TEST_F(StatisticsEngineTest, testFirstBids)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(2, stats.firstBidderRounds);
    EXPECT_EQ(1, firstBidCount(stats, BidLevel::NONE));
    EXPECT_EQ(1, firstBidCount(stats, BidLevel::ONE));
    EXPECT_EQ(0, firstBidCount(stats, BidLevel::TWO));
    EXPECT_EQ(0, firstBidCount(stats, BidLevel::THREE));
}

TEST_F(StatisticsEngineTest, testSprings)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(1, stats.springCount);
    EXPECT_EQ(1, stats.springAgainstCount);
}

TEST_F(StatisticsEngineTest, testSpringLostByLandlordIsNotCounted)
{
    rounds[0] = makeRound(FIRST_MATCH, 0, Seat::A, {-200, 100, 100}, Seat::A, true);
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(0, stats.springCount);
}

TEST_F(StatisticsEngineTest, testDoubled)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(1, stats.doubledRounds);
    EXPECT_EQ(1, stats.doubledWins);
    EXPECT_EQ(0, stats.doubledLosses);
    EXPECT_DOUBLE_EQ(1.0, doubledWinRate(stats));
}

TEST_F(StatisticsEngineTest, testStreaks)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(StreakSummary(0, 1, 1, 2), stats.roundStreaks);
    EXPECT_EQ(StreakSummary(0, 1, 1, 1), stats.matchStreaks);
}

TEST_F(StatisticsEngineTest, testMatches)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(2, stats.totalMatches);
    EXPECT_EQ(1, stats.matchesWon);
    EXPECT_EQ(1, stats.matchesLost);
    EXPECT_EQ(0, stats.matchesTied);
    EXPECT_DOUBLE_EQ(0.5, matchWinRate(stats));
}

TEST_F(StatisticsEngineTest, testTiedMatch)
{
    const auto third_rounds = std::vector {
        makeRound(THIRD_MATCH, 0, Seat::B, {-100, 200, -100}),
        makeRound(THIRD_MATCH, 1, Seat::A, {200, -100, -100}),
        makeRound(THIRD_MATCH, 2, Seat::C, {-100, -100, 200}),
    };
    const auto third = Landlord::Scoring::summarizeMatch(
        makeMatch(THIRD_MATCH), Landlord::Scoring::foldMatch(third_rounds));
    ASSERT_EQ(0, third.finalScore[Seat::A]);
    matches.push_back(third);
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(3, stats.totalMatches);
    EXPECT_EQ(1, stats.matchesWon);
    EXPECT_EQ(1, stats.matchesLost);
    EXPECT_EQ(1, stats.matchesTied);
    EXPECT_EQ(StreakSummary(0, 0, 1, 1), stats.matchStreaks);
    EXPECT_DOUBLE_EQ(1.0 / 3.0, matchWinRate(stats));
}

TEST_F(StatisticsEngineTest, testScoreMilestones)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(400, stats.bestRoundScore);
    EXPECT_EQ(-400, stats.worstRoundScore);
    EXPECT_EQ(100, stats.bestMatchScore);
    EXPECT_EQ(-200, stats.worstMatchScore);
    EXPECT_EQ(200, stats.bestSnapshot);
    EXPECT_EQ(-300, stats.worstSnapshot);
}

TEST_F(StatisticsEngineTest, testRunningMilestones)
{
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(200, stats.runningPeak.value);
    EXPECT_EQ(0, stats.runningPeak.roundIndex);
    EXPECT_EQ(-300, stats.runningTrough.value);
    EXPECT_EQ(2, stats.runningTrough.roundIndex);
}

TEST_F(StatisticsEngineTest, testRunningMilestoneKeepsFirstOccurrence)
{
    const auto stats = computeStatistics(
        PLAYER,
        {
            makeRound(FIRST_MATCH, 0, Seat::A, {200, -100, -100}),
            makeRound(FIRST_MATCH, 1, Seat::B, {-100, 200, -100}),
            makeRound(FIRST_MATCH, 2, Seat::C, {100, 100, -200}),
        },
        {});
    EXPECT_EQ(200, stats.runningPeak.value);
    EXPECT_EQ(0, stats.runningPeak.roundIndex);
    EXPECT_EQ(100, stats.runningTrough.value);
    EXPECT_EQ(1, stats.runningTrough.roundIndex);
}

TEST_F(StatisticsEngineTest, testRoundsOfOtherPlayersAreSkipped)
{
    auto other = makeRound(SECOND_MATCH, 1, Seat::A, {400, -200, -200});
    other.playerIds = SeatMap<PlayerId> {"dave", "erin", "frank"};
    rounds.push_back(other);
    const auto stats = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(5, stats.totalRounds);
    EXPECT_EQ(-100, stats.totalScore);
}

TEST_F(StatisticsEngineTest, testComputeMatchStatistics)
{
    const auto stats = computeMatchStatistics(PLAYER, matches[0], rounds);
    EXPECT_EQ(4, stats.totalRounds);
    EXPECT_EQ(100, stats.totalScore);
    EXPECT_EQ(1, stats.totalMatches);
    EXPECT_EQ(1, stats.matchesWon);
    EXPECT_EQ(0, stats.springAgainstCount);
    EXPECT_EQ(200, stats.bestSnapshot);
    EXPECT_EQ(-300, stats.worstSnapshot);
}

TEST_F(StatisticsEngineTest, testStatisticsAreRecomputedFromHistory)
{
    const auto first = computeStatistics(PLAYER, rounds, matches);
    const auto second = computeStatistics(PLAYER, rounds, matches);
    EXPECT_EQ(first.totalScore, second.totalScore);
    EXPECT_EQ(first.roundStreaks, second.roundStreaks);
    EXPECT_EQ(first.firstBidCounts, second.firstBidCounts);
}
