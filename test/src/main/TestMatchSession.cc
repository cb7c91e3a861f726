#include "landlord/RoundInput.hh"
#include "main/MatchSession.hh"
#include "storage/JsonRecordStore.hh"
#include "MockRecordStore.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using Landlord::BidLevel;
using Landlord::MatchSummary;
using Landlord::RoundInput;
using Landlord::RoundRecord;
using Landlord::ScoreTriple;
using Landlord::Seat;
using Landlord::HasDeltas;
using Landlord::Main::MatchSession;
using Landlord::Scoring::BidValidationError;

using testing::_;
using testing::AllOf;
using testing::ElementsAre;
using testing::Field;
using testing::Optional;

namespace {

const auto MATCH_ID = std::string {"match"};

RoundInput landlordInput(Seat landlord, bool landlordWon)
{
    auto input = RoundInput {};
    input.bids[landlord] = BidLevel::ONE;
    input.landlordWon = landlordWon;
    return input;
}

}

class MatchSessionTest : public testing::Test {
protected:
    testing::NiceMock<Landlord::Storage::MockRecordStore> store;
    MatchSession session {store, Landlord::makeMatch(MATCH_ID, Seat::B)};
};

TEST_F(MatchSessionTest, testInitialState)
{
    EXPECT_TRUE(session.getRounds().empty());
    EXPECT_TRUE(session.getScores().empty());
    EXPECT_EQ(ScoreTriple {}, session.getTotals());
    EXPECT_EQ(Seat::B, session.nextFirstBidder());
    EXPECT_FALSE(session.isFinished());
}

TEST_F(MatchSessionTest, testAddRound)
{
    EXPECT_CALL(
        store, handleSaveRoundRecord(
            AllOf(
                Field(&RoundRecord::matchId, MATCH_ID),
                Field(&RoundRecord::roundIndex, 0),
                Field(&RoundRecord::firstBidder, Seat::B),
                Field(&RoundRecord::landlord, Seat::A),
                HasDeltas(ScoreTriple {200, -100, -100}))));
    const auto result = session.addRound(landlordInput(Seat::A, true));
    ASSERT_TRUE(std::holds_alternative<RoundRecord>(result));
    EXPECT_EQ(ScoreTriple(200, -100, -100), session.getTotals());
    EXPECT_EQ(Seat::C, session.nextFirstBidder());
}

TEST_F(MatchSessionTest, testInvalidRoundIsNotStored)
{
    EXPECT_CALL(store, handleSaveRoundRecord(_)).Times(0);
    const auto result = session.addRound(RoundInput {});
    EXPECT_EQ(
        MatchSession::RoundResult {BidValidationError::noBid()}, result);
    EXPECT_TRUE(session.getRounds().empty());
    EXPECT_EQ(Seat::B, session.nextFirstBidder());
}

TEST_F(MatchSessionTest, testRunningTotals)
{
    session.addRound(landlordInput(Seat::A, true));
    session.addRound(landlordInput(Seat::B, false));
    EXPECT_THAT(
        session.getScores(),
        ElementsAre(
            ScoreTriple {200, -100, -100},
            ScoreTriple {300, -300, 0}));
    EXPECT_EQ(ScoreTriple(300, 0, 0), session.getSummary().maxSnapshot);
    EXPECT_EQ(ScoreTriple(0, -300, -100), session.getSummary().minSnapshot);
}

TEST_F(MatchSessionTest, testEditRoundKeepsFirstBidder)
{
    session.addRound(landlordInput(Seat::A, true));
    session.addRound(landlordInput(Seat::B, true));
    EXPECT_CALL(
        store, handleUpdateRoundRecord(
            AllOf(
                Field(&RoundRecord::roundIndex, 0),
                Field(&RoundRecord::firstBidder, Seat::B),
                Field(&RoundRecord::landlord, Seat::C))));
    const auto result = session.editRound(0, landlordInput(Seat::C, true));
    ASSERT_TRUE(std::holds_alternative<RoundRecord>(result));
    EXPECT_THAT(
        session.getScores(),
        ElementsAre(
            ScoreTriple {-100, -100, 200},
            ScoreTriple {-200, 100, 100}));
}

TEST_F(MatchSessionTest, testRejectedEditKeepsRound)
{
    session.addRound(landlordInput(Seat::A, true));
    EXPECT_CALL(store, handleUpdateRoundRecord(_)).Times(0);
    const auto result = session.editRound(0, RoundInput {});
    EXPECT_TRUE(std::holds_alternative<BidValidationError>(result));
    EXPECT_EQ(ScoreTriple(200, -100, -100), session.getTotals());
}

TEST_F(MatchSessionTest, testEditMissingRound)
{
    EXPECT_THROW(
        session.editRound(0, landlordInput(Seat::A, true)), std::out_of_range);
}

TEST_F(MatchSessionTest, testRemoveRoundRenumbers)
{
    session.addRound(landlordInput(Seat::A, true));
    session.addRound(landlordInput(Seat::B, true));
    session.addRound(landlordInput(Seat::C, true));
    EXPECT_CALL(
        store, handleReplaceRoundRecords(
            std::string_view {MATCH_ID},
            ElementsAre(
                AllOf(
                    Field(&RoundRecord::roundIndex, 0),
                    Field(&RoundRecord::landlord, Seat::A)),
                AllOf(
                    Field(&RoundRecord::roundIndex, 1),
                    Field(&RoundRecord::landlord, Seat::C),
                    Field(&RoundRecord::firstBidder, Seat::A)))));
    session.removeRound(1);
    EXPECT_EQ(2, session.getSummary().totalRounds);
    EXPECT_EQ(ScoreTriple(100, -200, 100), session.getTotals());
    EXPECT_THROW(session.removeRound(2), std::out_of_range);
}

TEST_F(MatchSessionTest, testFinish)
{
    session.addRound(landlordInput(Seat::A, true));
    const auto ended_at = Landlord::timestampFromMilliseconds(1'600'000'900'000);
    EXPECT_CALL(
        store, handleSaveMatchSummary(
            AllOf(
                Field(&MatchSummary::id, MATCH_ID),
                Field(&MatchSummary::totalRounds, 1),
                Field(&MatchSummary::endedAt, Optional(ended_at)))));
    const auto summary = session.finish(ended_at);
    ASSERT_TRUE(summary);
    EXPECT_EQ(ScoreTriple(200, -100, -100), summary->finalScore);
    EXPECT_TRUE(session.isFinished());
    EXPECT_THROW(
        session.addRound(landlordInput(Seat::A, true)), std::logic_error);
}

TEST_F(MatchSessionTest, testEmptyMatchIsDiscarded)
{
    EXPECT_CALL(store, handleSaveMatchSummary(_)).Times(0);
    EXPECT_FALSE(session.finish());
    EXPECT_THROW(session.finish(), std::logic_error);
}

TEST_F(MatchSessionTest, testEditAfterFinishUpdatesSummary)
{
    session.addRound(landlordInput(Seat::A, true));
    session.finish();
    EXPECT_CALL(
        store, handleUpdateMatchSummary(
            Field(&MatchSummary::finalScore, ScoreTriple {-200, 100, 100})));
    session.editRound(0, landlordInput(Seat::A, false));
}

TEST(RebuildMatchTest, testRebuildMatch)
{
    auto store = Landlord::Storage::JsonRecordStore {};
    {
        auto session = MatchSession {store, Landlord::makeMatch(MATCH_ID)};
        session.addRound(landlordInput(Seat::A, true));
        session.addRound(landlordInput(Seat::B, true));
        session.finish();
    }
    auto record = store.loadRoundRecordsForMatch(MATCH_ID).at(0);
    record.deltas = {-200, 100, 100};
    record.landlordWon = false;
    store.updateRoundRecord(record);

    const auto summary = Landlord::Main::rebuildMatch(store, MATCH_ID);
    EXPECT_EQ(ScoreTriple(-300, 300, 0), summary.finalScore);
    EXPECT_EQ(ScoreTriple(0, 300, 100), summary.maxSnapshot);
    EXPECT_EQ(ScoreTriple(-300, 0, 0), summary.minSnapshot);
    EXPECT_EQ(summary, store.loadMatchSummary(MATCH_ID));
}

TEST(RebuildMatchTest, testRebuildUnknownMatch)
{
    auto store = Landlord::Storage::JsonRecordStore {};
    EXPECT_THROW(
        Landlord::Main::rebuildMatch(store, MATCH_ID), std::invalid_argument);
}
