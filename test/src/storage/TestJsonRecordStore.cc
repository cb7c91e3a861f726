#include "landlord/MatchSummary.hh"
#include "landlord/RoundRecord.hh"
#include "storage/JsonRecordStore.hh"
#include "storage/SerializationFailureException.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

using Landlord::PlayerId;
using Landlord::RoundRecord;
using Landlord::Seat;
using Landlord::SeatMap;
using Landlord::makeMatch;
using Landlord::makeRound;
using Landlord::Storage::JsonRecordStore;
using Landlord::Storage::SerializationFailureException;

using testing::ElementsAre;
using testing::Field;
using testing::IsEmpty;

namespace {

const auto MATCH_ID = std::string {"match"};
const auto OTHER_MATCH_ID = std::string {"other"};

}

class JsonRecordStoreTest : public testing::Test {
protected:
    JsonRecordStore store;
};

TEST_F(JsonRecordStoreTest, testEmptyStore)
{
    EXPECT_THAT(store.loadRoundRecordsForPlayer("alice"), IsEmpty());
    EXPECT_THAT(store.loadRoundRecordsForMatch(MATCH_ID), IsEmpty());
    EXPECT_THAT(store.loadMatchSummaries("alice"), IsEmpty());
    EXPECT_FALSE(store.loadMatchSummary(MATCH_ID));
}

TEST_F(JsonRecordStoreTest, testLoadRoundsForMatchOrderedByIndex)
{
    store.saveRoundRecord(makeRound(MATCH_ID, 1, Seat::B, {-100, 200, -100}));
    store.saveRoundRecord(makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100}));
    store.saveRoundRecord(makeRound(OTHER_MATCH_ID, 0, Seat::A, {200, -100, -100}));
    EXPECT_THAT(
        store.loadRoundRecordsForMatch(MATCH_ID),
        ElementsAre(
            Field(&RoundRecord::roundIndex, 0),
            Field(&RoundRecord::roundIndex, 1)));
}

TEST_F(JsonRecordStoreTest, testLoadRoundsForPlayerOrderedByTime)
{
    auto later = makeRound(OTHER_MATCH_ID, 0, Seat::A, {200, -100, -100});
    later.playedAt += std::chrono::hours {1};
    store.saveRoundRecord(later);
    store.saveRoundRecord(makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100}));
    auto stranger = makeRound("third", 0, Seat::A, {200, -100, -100});
    stranger.playerIds = SeatMap<PlayerId> {"dave", "erin", "frank"};
    store.saveRoundRecord(stranger);
    EXPECT_THAT(
        store.loadRoundRecordsForPlayer("alice"),
        ElementsAre(
            Field(&RoundRecord::matchId, MATCH_ID),
            Field(&RoundRecord::matchId, OTHER_MATCH_ID)));
}

TEST_F(JsonRecordStoreTest, testSaveDuplicateRound)
{
    const auto record = makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100});
    store.saveRoundRecord(record);
    EXPECT_THROW(store.saveRoundRecord(record), std::invalid_argument);
}

TEST_F(JsonRecordStoreTest, testUpdateRound)
{
    store.saveRoundRecord(makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100}));
    const auto updated = makeRound(MATCH_ID, 0, Seat::A, {-200, 100, 100});
    store.updateRoundRecord(updated);
    EXPECT_THAT(store.loadRoundRecordsForMatch(MATCH_ID), ElementsAre(updated));
}

TEST_F(JsonRecordStoreTest, testUpdateMissingRound)
{
    EXPECT_THROW(
        store.updateRoundRecord(makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100})),
        std::out_of_range);
}

TEST_F(JsonRecordStoreTest, testReplaceRounds)
{
    store.saveRoundRecord(makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100}));
    store.saveRoundRecord(makeRound(MATCH_ID, 1, Seat::B, {-100, 200, -100}));
    const auto replacement = makeRound(MATCH_ID, 0, Seat::C, {-100, -100, 200});
    store.replaceRoundRecords(MATCH_ID, {replacement});
    EXPECT_THAT(
        store.loadRoundRecordsForMatch(MATCH_ID), ElementsAre(replacement));
}

TEST_F(JsonRecordStoreTest, testMatchSummaries)
{
    auto later = makeMatch(OTHER_MATCH_ID);
    later.startedAt += std::chrono::hours {1};
    store.saveMatchSummary(later);
    store.saveMatchSummary(makeMatch(MATCH_ID));
    EXPECT_THROW(store.saveMatchSummary(later), std::invalid_argument);
    EXPECT_THAT(
        store.loadMatchSummaries("bob"),
        ElementsAre(
            Field(&Landlord::MatchSummary::id, MATCH_ID),
            Field(&Landlord::MatchSummary::id, OTHER_MATCH_ID)));
    EXPECT_THAT(store.loadMatchSummaries("dave"), IsEmpty());
}

TEST_F(JsonRecordStoreTest, testUpdateMatchSummary)
{
    auto summary = makeMatch(MATCH_ID);
    EXPECT_THROW(store.updateMatchSummary(summary), std::out_of_range);
    store.saveMatchSummary(summary);
    summary.totalRounds = 5;
    store.updateMatchSummary(summary);
    EXPECT_EQ(summary, store.loadMatchSummary(MATCH_ID));
}

TEST_F(JsonRecordStoreTest, testWriteAndRead)
{
    const auto record = makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100}, Seat::A);
    const auto summary = makeMatch(MATCH_ID);
    store.saveRoundRecord(record);
    store.saveMatchSummary(summary);
    auto stream = std::stringstream {};
    store.write(stream);
    const auto restored = JsonRecordStore {stream};
    EXPECT_THAT(restored.loadRoundRecordsForMatch(MATCH_ID), ElementsAre(record));
    EXPECT_EQ(summary, restored.loadMatchSummary(MATCH_ID));
}

TEST_F(JsonRecordStoreTest, testReadMissingSections)
{
    auto stream = std::istringstream {"{}"};
    const auto restored = JsonRecordStore {stream};
    EXPECT_THAT(restored.loadRoundRecordsForPlayer("alice"), IsEmpty());
}

TEST_F(JsonRecordStoreTest, testReadInvalidDocument)
{
    auto stream = std::istringstream {R"({"rounds": "invalid"})"};
    EXPECT_THROW(
        static_cast<void>(JsonRecordStore {stream}),
        SerializationFailureException);
}

TEST_F(JsonRecordStoreTest, testReadSkipsInvalidRecords)
{
    const auto record = makeRound(MATCH_ID, 0, Seat::A, {200, -100, -100}, Seat::A);
    const auto summary = makeMatch(MATCH_ID);
    store.saveRoundRecord(record);
    store.saveMatchSummary(summary);
    auto stream = std::stringstream {};
    store.write(stream);

    auto document = nlohmann::json::parse(stream.str());
    auto unbalanced = document["rounds"][0];
    unbalanced["gameIndex"] = 1;
    unbalanced["scoreA"] = 300;
    auto bad_bid = document["rounds"][0];
    bad_bid["gameIndex"] = 2;
    bad_bid["apoint"] = 4;
    document["rounds"].push_back(unbalanced);
    document["rounds"].push_back(bad_bid);
    document["rounds"].push_back(nlohmann::json {{"matchId", MATCH_ID}});
    document["matches"].push_back(nlohmann::json {{"id", OTHER_MATCH_ID}});

    auto in = std::istringstream {document.dump()};
    const auto restored = JsonRecordStore {in};
    EXPECT_THAT(restored.loadRoundRecordsForMatch(MATCH_ID), ElementsAre(record));
    EXPECT_EQ(summary, restored.loadMatchSummary(MATCH_ID));
    EXPECT_FALSE(restored.loadMatchSummary(OTHER_MATCH_ID));
}
