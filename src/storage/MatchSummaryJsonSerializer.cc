#include "storage/MatchSummaryJsonSerializer.hh"

#include "landlord/MatchSummary.hh"
#include "storage/JsonSerializerUtility.hh"

#include <string_view>

using nlohmann::json;

namespace Landlord {

const std::string MATCH_ID_KEY {"id"};
const std::string MATCH_STARTED_AT_KEY {"startedAt"};
const std::string MATCH_ENDED_AT_KEY {"endedAt"};
const std::string MATCH_TOTAL_GAMES_KEY {"totalGames"};
const std::string MATCH_INITIAL_STARTER_KEY {"initialStarter"};

namespace {

// The per seat members are the prefix followed by the seat name
const std::string PLAYER_ID_KEY_PREFIX {"player"};
const std::string PLAYER_ID_KEY_SUFFIX {"Id"};
const std::string FINAL_SCORE_KEY_PREFIX {"finalScore"};
const std::string MAX_SNAPSHOT_KEY_PREFIX {"maxSnapshot"};
const std::string MIN_SNAPSHOT_KEY_PREFIX {"minSnapshot"};

std::string seatKey(
    const std::string& prefix, const Seat seat, std::string_view suffix = {})
{
    auto key = prefix + SEAT_TO_STRING_MAP.left.at(seat);
    key.append(suffix);
    return key;
}

template<typename T>
void seatMapToJson(
    json& j, const SeatMap<T>& values, const std::string& prefix,
    std::string_view suffix = {})
{
    for (const auto seat : SEATS) {
        j.emplace(seatKey(prefix, seat, suffix), values[seat]);
    }
}

template<typename T>
SeatMap<T> jsonToSeatMap(
    const json& j, const std::string& prefix, std::string_view suffix = {})
{
    auto values = SeatMap<T> {};
    for (const auto seat : SEATS) {
        values[seat] = j.at(seatKey(prefix, seat, suffix)).template get<T>();
    }
    return values;
}

}

void to_json(json& j, const MatchSummary& summary)
{
    j = json::object();
    j.emplace(MATCH_ID_KEY, summary.id);
    j.emplace(MATCH_STARTED_AT_KEY, Storage::timestampToJson(summary.startedAt));
    if (summary.endedAt) {
        j.emplace(MATCH_ENDED_AT_KEY, Storage::timestampToJson(*summary.endedAt));
    } else {
        j.emplace(MATCH_ENDED_AT_KEY, nullptr);
    }
    seatMapToJson(
        j, summary.playerIds, PLAYER_ID_KEY_PREFIX, PLAYER_ID_KEY_SUFFIX);
    seatMapToJson(j, summary.finalScore, FINAL_SCORE_KEY_PREFIX);
    j.emplace(MATCH_TOTAL_GAMES_KEY, summary.totalRounds);
    seatMapToJson(j, summary.maxSnapshot, MAX_SNAPSHOT_KEY_PREFIX);
    seatMapToJson(j, summary.minSnapshot, MIN_SNAPSHOT_KEY_PREFIX);
    j.emplace(MATCH_INITIAL_STARTER_KEY, seatOrder(summary.initialStarter));
}

void from_json(const json& j, MatchSummary& summary)
{
    summary.id = j.at(MATCH_ID_KEY).get<std::string>();
    summary.startedAt = Storage::jsonToTimestamp(j.at(MATCH_STARTED_AT_KEY));
    const auto ended_at = Storage::getOptional<json>(j, MATCH_ENDED_AT_KEY);
    summary.endedAt = ended_at ?
        std::optional {Storage::jsonToTimestamp(*ended_at)} : std::nullopt;
    summary.playerIds = jsonToSeatMap<PlayerId>(
        j, PLAYER_ID_KEY_PREFIX, PLAYER_ID_KEY_SUFFIX);
    summary.finalScore = jsonToSeatMap<int>(j, FINAL_SCORE_KEY_PREFIX);
    summary.totalRounds = Storage::validate(
        j.at(MATCH_TOTAL_GAMES_KEY).get<int>(),
        [](const auto n) { return n >= 0; });
    summary.maxSnapshot = jsonToSeatMap<int>(j, MAX_SNAPSHOT_KEY_PREFIX);
    summary.minSnapshot = jsonToSeatMap<int>(j, MIN_SNAPSHOT_KEY_PREFIX);
    const auto starter = Storage::validate(
        j.at(MATCH_INITIAL_STARTER_KEY).get<int>(),
        [](const auto n) { return 0 <= n && n < N_SEATS; });
    summary.initialStarter = seatForOrder(starter);
}

}
