#include "storage/JsonRecordStore.hh"

#include "storage/JsonSerializer.hh"
#include "storage/MatchSummaryJsonSerializer.hh"
#include "storage/RoundRecordJsonSerializer.hh"
#include "storage/SerializationFailureException.hh"
#include "Logging.hh"

#include <algorithm>
#include <iomanip>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

using nlohmann::json;

namespace Landlord {
namespace Storage {

const std::string RECORD_STORE_ROUNDS_KEY {"rounds"};
const std::string RECORD_STORE_MATCHES_KEY {"matches"};

namespace {

struct Document {
    std::vector<RoundRecord> rounds;
    std::vector<MatchSummary> matches;
};

// Records that cannot be read are skipped
template<typename T>
std::vector<T> recordsFromJson(const json& j, const std::string& key)
{
    const auto records = j.value(key, json::array());
    if (!records.is_array()) {
        throw SerializationFailureException {"Expected array: " + key};
    }
    auto ret = std::vector<T> {};
    ret.reserve(records.size());
    for (const auto& record : records) {
        try {
            ret.push_back(record.get<T>());
        } catch (const SerializationFailureException& e) {
            log(LogLevel::WARNING, "Skipping invalid record in %s: %s",
                key, e.what());
        } catch (const json::exception& e) {
            log(LogLevel::WARNING, "Skipping invalid record in %s: %s",
                key, e.what());
        }
    }
    return ret;
}

void from_json(const json& j, Document& document)
{
    document.rounds =
        recordsFromJson<RoundRecord>(j, RECORD_STORE_ROUNDS_KEY);
    document.matches =
        recordsFromJson<MatchSummary>(j, RECORD_STORE_MATCHES_KEY);
}

auto sameRound(const RoundRecord& record)
{
    return [&record](const auto& other) {
        return other.matchId == record.matchId &&
            other.roundIndex == record.roundIndex;
    };
}

auto sameMatch(const std::string_view matchId)
{
    return [matchId](const auto& summary) { return summary.id == matchId; };
}

auto playedBy(const PlayerId& playerId)
{
    return [&playerId](const auto& record) {
        return seatOf(record.playerIds, playerId).has_value();
    };
}

}

JsonRecordStore::JsonRecordStore() = default;

JsonRecordStore::JsonRecordStore(std::istream& in)
{
    auto content = std::string {
        std::istreambuf_iterator<char> {in}, std::istreambuf_iterator<char> {}};
    auto document = JsonSerializer::deserialize<Document>(content);
    rounds = std::move(document.rounds);
    matches = std::move(document.matches);
    log(LogLevel::DEBUG, "Read %d rounds and %d matches",
        rounds.size(), matches.size());
}

void JsonRecordStore::write(std::ostream& out) const
{
    const auto j = json {
        { RECORD_STORE_ROUNDS_KEY, rounds },
        { RECORD_STORE_MATCHES_KEY, matches },
    };
    out << std::setw(2) << j << std::endl;
}

std::vector<RoundRecord> JsonRecordStore::handleLoadRoundRecordsForPlayer(
    const PlayerId& playerId) const
{
    auto ret = std::vector<RoundRecord> {};
    std::ranges::copy_if(rounds, std::back_inserter(ret), playedBy(playerId));
    return ret;
}

std::vector<RoundRecord> JsonRecordStore::handleLoadRoundRecordsForMatch(
    const std::string_view matchId) const
{
    auto ret = std::vector<RoundRecord> {};
    std::ranges::copy_if(
        rounds, std::back_inserter(ret),
        [matchId](const auto& record) { return record.matchId == matchId; });
    return ret;
}

std::vector<MatchSummary> JsonRecordStore::handleLoadMatchSummaries(
    const PlayerId& playerId) const
{
    auto ret = std::vector<MatchSummary> {};
    std::ranges::copy_if(matches, std::back_inserter(ret), playedBy(playerId));
    return ret;
}

std::optional<MatchSummary> JsonRecordStore::handleLoadMatchSummary(
    const std::string_view matchId) const
{
    const auto iter = std::ranges::find_if(matches, sameMatch(matchId));
    if (iter == matches.end()) {
        return std::nullopt;
    }
    return *iter;
}

void JsonRecordStore::handleSaveRoundRecord(const RoundRecord& record)
{
    if (std::ranges::any_of(rounds, sameRound(record))) {
        throw std::invalid_argument {"Round already stored"};
    }
    rounds.push_back(record);
}

void JsonRecordStore::handleUpdateRoundRecord(const RoundRecord& record)
{
    const auto iter = std::ranges::find_if(rounds, sameRound(record));
    if (iter == rounds.end()) {
        throw std::out_of_range {"Round not stored"};
    }
    *iter = record;
}

void JsonRecordStore::handleReplaceRoundRecords(
    const std::string_view matchId, const std::vector<RoundRecord>& records)
{
    std::erase_if(
        rounds,
        [matchId](const auto& record) { return record.matchId == matchId; });
    rounds.insert(rounds.end(), records.begin(), records.end());
}

void JsonRecordStore::handleSaveMatchSummary(const MatchSummary& summary)
{
    if (std::ranges::any_of(matches, sameMatch(summary.id))) {
        throw std::invalid_argument {"Match already stored"};
    }
    matches.push_back(summary);
}

void JsonRecordStore::handleUpdateMatchSummary(const MatchSummary& summary)
{
    const auto iter = std::ranges::find_if(matches, sameMatch(summary.id));
    if (iter == matches.end()) {
        throw std::out_of_range {"Match not stored"};
    }
    *iter = summary;
}

}
}
