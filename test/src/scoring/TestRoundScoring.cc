#include "landlord/RoundInput.hh"
#include "scoring/RoundScoring.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using Landlord::BidLevel;
using Landlord::RoundInput;
using Landlord::ScoreTriple;
using Landlord::Seat;
using Landlord::Scoring::BidValidationError;
using Landlord::Scoring::ScoredRound;
using Landlord::Scoring::scoreRound;

TEST(RoundScoringTest, testScoreRound)
{
    const auto input = RoundInput {
        {BidLevel::ONE, BidLevel::NONE, BidLevel::NONE},
        {true, false, true}, 1, true, true};
    const auto result = scoreRound(input);
    const auto* scored = std::get_if<ScoredRound>(&result);
    ASSERT_TRUE(scored);
    EXPECT_EQ(Seat::A, scored->resolution.landlord);
    EXPECT_EQ(100, scored->resolution.baseStake);
    EXPECT_EQ(ScoreTriple(2400, -800, -1600), scored->score.deltas);
}

TEST(RoundScoringTest, testValidationErrorIsReturned)
{
    const auto input = RoundInput {
        {BidLevel::THREE, BidLevel::THREE, BidLevel::ONE}, {}, 0, false, true};
    const auto result = scoreRound(input);
    const auto* error = std::get_if<BidValidationError>(&result);
    ASSERT_TRUE(error);
    EXPECT_EQ(BidValidationError::ambiguousBid(BidLevel::THREE), *error);
}

TEST(RoundScoringTest, testInvalidBombs)
{
    const auto input = RoundInput {
        {BidLevel::TWO, BidLevel::NONE, BidLevel::NONE}, {}, -1, false, true};
    EXPECT_THROW(scoreRound(input), std::invalid_argument);
}
