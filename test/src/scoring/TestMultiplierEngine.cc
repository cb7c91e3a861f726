#include "landlord/Outcome.hh"
#include "landlord/ScoreTriple.hh"
#include "scoring/MultiplierEngine.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using Landlord::Outcome;
using Landlord::ScoreTriple;
using Landlord::Seat;
using Landlord::SeatMap;
using Landlord::Scoring::RoundModifiers;
using Landlord::Scoring::applyMultipliers;
using Landlord::Scoring::multipliedStake;

class MultiplierEngineTest : public testing::Test {
protected:
    RoundModifiers modifiers {Seat::A, {false, false, false}, 0, false, true};
};

TEST_F(MultiplierEngineTest, testPlainRound)
{
    const auto score = applyMultipliers(100, modifiers);
    EXPECT_EQ(ScoreTriple(200, -100, -100), score.deltas);
    EXPECT_EQ(
        (SeatMap<Outcome> {Outcome::WIN, Outcome::LOSS, Outcome::LOSS}),
        score.outcomes);
}

TEST_F(MultiplierEngineTest, testLandlordLoses)
{
    modifiers.landlord = Seat::B;
    modifiers.landlordWon = false;
    const auto score = applyMultipliers(300, modifiers);
    EXPECT_EQ(ScoreTriple(300, -600, 300), score.deltas);
    EXPECT_EQ(Outcome::LOSS, score.outcomes[Seat::B]);
}

TEST_F(MultiplierEngineTest, testAllModifiers)
{
    modifiers.bombs = 1;
    modifiers.spring = true;
    modifiers.doubled = {true, false, true};
    EXPECT_EQ(800, multipliedStake(100, 1, true, true));
    const auto score = applyMultipliers(100, modifiers);
    EXPECT_EQ(ScoreTriple(2400, -800, -1600), score.deltas);
    EXPECT_EQ(0, Landlord::scoreSum(score.deltas));
}

TEST_F(MultiplierEngineTest, testBombsDoubleStake)
{
    EXPECT_EQ(100, multipliedStake(100, 0, false, false));
    EXPECT_EQ(800, multipliedStake(100, 3, false, false));
    EXPECT_EQ(102400, multipliedStake(100, Landlord::MAXIMUM_BOMBS, false, false));
}

TEST_F(MultiplierEngineTest, testFarmerDoubleOnlyAffectsOwnPayment)
{
    modifiers.landlord = Seat::C;
    modifiers.doubled = {false, true, false};
    modifiers.landlordWon = false;
    const auto score = applyMultipliers(200, modifiers);
    EXPECT_EQ(ScoreTriple(200, 400, -600), score.deltas);
}

TEST_F(MultiplierEngineTest, testZeroSum)
{
    for (const auto landlord : Landlord::SEATS) {
        for (auto bombs = 0; bombs <= 3; ++bombs) {
            for (const auto won : {false, true}) {
                modifiers.landlord = landlord;
                modifiers.bombs = bombs;
                modifiers.landlordWon = won;
                modifiers.doubled = {won, !won, true};
                const auto score = applyMultipliers(200, modifiers);
                EXPECT_EQ(0, Landlord::scoreSum(score.deltas));
            }
        }
    }
}

TEST_F(MultiplierEngineTest, testInvalidModifiers)
{
    modifiers.bombs = -1;
    EXPECT_THROW(applyMultipliers(100, modifiers), std::invalid_argument);
    modifiers.bombs = Landlord::MAXIMUM_BOMBS + 1;
    EXPECT_THROW(applyMultipliers(100, modifiers), std::invalid_argument);
    modifiers.bombs = 0;
    EXPECT_THROW(applyMultipliers(0, modifiers), std::invalid_argument);
}
