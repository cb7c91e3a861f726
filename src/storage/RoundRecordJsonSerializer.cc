#include "storage/RoundRecordJsonSerializer.hh"

#include "landlord/RoundRecord.hh"
#include "storage/BidLevelJsonSerializer.hh"
#include "storage/JsonSerializerUtility.hh"

#include <array>

using nlohmann::json;

namespace Landlord {

const std::string ROUND_MATCH_ID_KEY {"matchId"};
const std::string ROUND_INDEX_KEY {"gameIndex"};
const std::string ROUND_PLAYED_AT_KEY {"playedAt"};
const std::string ROUND_PLAYER_A_ID_KEY {"playerAId"};
const std::string ROUND_PLAYER_B_ID_KEY {"playerBId"};
const std::string ROUND_PLAYER_C_ID_KEY {"playerCId"};
const std::string ROUND_BOMBS_KEY {"bombs"};
const std::string ROUND_BID_A_KEY {"apoint"};
const std::string ROUND_BID_B_KEY {"bpoint"};
const std::string ROUND_BID_C_KEY {"cpoint"};
const std::string ROUND_DOUBLED_A_KEY {"adouble"};
const std::string ROUND_DOUBLED_B_KEY {"bdouble"};
const std::string ROUND_DOUBLED_C_KEY {"cdouble"};
const std::string ROUND_SPRING_KEY {"spring"};
const std::string ROUND_LANDLORD_RESULT_KEY {"landlordResult"};
const std::string ROUND_LANDLORD_KEY {"landlord"};
const std::string ROUND_SCORE_A_KEY {"scoreA"};
const std::string ROUND_SCORE_B_KEY {"scoreB"};
const std::string ROUND_SCORE_C_KEY {"scoreC"};
const std::string ROUND_FIRST_BIDDER_KEY {"firstBidder"};

namespace {

using SeatKeys = std::array<const std::string*, N_SEATS>;

const auto PLAYER_ID_KEYS = SeatKeys {
    &ROUND_PLAYER_A_ID_KEY, &ROUND_PLAYER_B_ID_KEY, &ROUND_PLAYER_C_ID_KEY };
const auto BID_KEYS = SeatKeys {
    &ROUND_BID_A_KEY, &ROUND_BID_B_KEY, &ROUND_BID_C_KEY };
const auto DOUBLED_KEYS = SeatKeys {
    &ROUND_DOUBLED_A_KEY, &ROUND_DOUBLED_B_KEY, &ROUND_DOUBLED_C_KEY };
const auto SCORE_KEYS = SeatKeys {
    &ROUND_SCORE_A_KEY, &ROUND_SCORE_B_KEY, &ROUND_SCORE_C_KEY };

template<typename T>
void seatMapToJson(json& j, const SeatMap<T>& values, const SeatKeys& keys)
{
    for (const auto seat : SEATS) {
        j.emplace(*keys[seatOrder(seat)], values[seat]);
    }
}

template<typename T>
void jsonToSeatMap(const json& j, SeatMap<T>& values, const SeatKeys& keys)
{
    for (const auto seat : SEATS) {
        values[seat] = j.at(*keys[seatOrder(seat)]).template get<T>();
    }
}

Seat jsonToLandlord(const json& j)
{
    if (const auto seat = seatForTablePosition(j.get<int>())) {
        return *seat;
    }
    throw Storage::SerializationFailureException {"Invalid landlord position"};
}

Seat jsonToFirstBidder(const json& j)
{
    const auto order = Storage::validate(
        j.get<int>(), [](const auto n) { return 0 <= n && n < N_SEATS; });
    return seatForOrder(order);
}

}

void to_json(json& j, const RoundRecord& record)
{
    j = json::object();
    j.emplace(ROUND_MATCH_ID_KEY, record.matchId);
    j.emplace(ROUND_INDEX_KEY, record.roundIndex);
    j.emplace(ROUND_PLAYED_AT_KEY, Storage::timestampToJson(record.playedAt));
    seatMapToJson(j, record.playerIds, PLAYER_ID_KEYS);
    j.emplace(ROUND_BOMBS_KEY, record.bombs);
    seatMapToJson(j, record.bids, BID_KEYS);
    seatMapToJson(j, record.doubled, DOUBLED_KEYS);
    j.emplace(ROUND_SPRING_KEY, record.spring);
    j.emplace(ROUND_LANDLORD_RESULT_KEY, record.landlordWon);
    j.emplace(ROUND_LANDLORD_KEY, tablePosition(record.landlord));
    seatMapToJson(j, record.deltas, SCORE_KEYS);
    if (record.firstBidder) {
        j.emplace(ROUND_FIRST_BIDDER_KEY, seatOrder(*record.firstBidder));
    } else {
        j.emplace(ROUND_FIRST_BIDDER_KEY, nullptr);
    }
}

void from_json(const json& j, RoundRecord& record)
{
    record.matchId = j.at(ROUND_MATCH_ID_KEY).get<std::string>();
    record.roundIndex = Storage::validate(
        j.at(ROUND_INDEX_KEY).get<int>(), [](const auto n) { return n >= 0; });
    record.playedAt = Storage::jsonToTimestamp(j.at(ROUND_PLAYED_AT_KEY));
    jsonToSeatMap(j, record.playerIds, PLAYER_ID_KEYS);
    record.bombs = Storage::validate(
        j.at(ROUND_BOMBS_KEY).get<int>(), [](const auto n) { return n >= 0; });
    jsonToSeatMap(j, record.bids, BID_KEYS);
    jsonToSeatMap(j, record.doubled, DOUBLED_KEYS);
    record.spring = Storage::getOptional<bool>(j, ROUND_SPRING_KEY);
    record.landlordWon = j.at(ROUND_LANDLORD_RESULT_KEY).get<bool>();
    record.landlord = jsonToLandlord(j.at(ROUND_LANDLORD_KEY));
    jsonToSeatMap(j, record.deltas, SCORE_KEYS);
    if (scoreSum(record.deltas) != 0) {
        throw Storage::SerializationFailureException {
            "Round scores do not sum to zero"};
    }
    const auto first_bidder = Storage::getOptional<json>(
        j, ROUND_FIRST_BIDDER_KEY);
    record.firstBidder = first_bidder ?
        std::optional {jsonToFirstBidder(*first_bidder)} : std::nullopt;
}

}
