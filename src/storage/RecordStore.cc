#include "storage/RecordStore.hh"

#include <algorithm>
#include <tuple>

namespace Landlord {
namespace Storage {

RecordStore::~RecordStore() = default;

std::vector<RoundRecord> RecordStore::loadRoundRecordsForPlayer(
    const PlayerId& playerId) const
{
    auto records = handleLoadRoundRecordsForPlayer(playerId);
    std::ranges::stable_sort(
        records, {},
        [](const auto& record) {
            return std::tie(record.playedAt, record.roundIndex);
        });
    return records;
}

std::vector<RoundRecord> RecordStore::loadRoundRecordsForMatch(
    const std::string_view matchId) const
{
    auto records = handleLoadRoundRecordsForMatch(matchId);
    std::ranges::stable_sort(records, {}, &RoundRecord::roundIndex);
    return records;
}

std::vector<MatchSummary> RecordStore::loadMatchSummaries(
    const PlayerId& playerId) const
{
    auto summaries = handleLoadMatchSummaries(playerId);
    std::ranges::stable_sort(summaries, {}, &MatchSummary::startedAt);
    return summaries;
}

std::optional<MatchSummary> RecordStore::loadMatchSummary(
    const std::string_view matchId) const
{
    return handleLoadMatchSummary(matchId);
}

void RecordStore::saveRoundRecord(const RoundRecord& record)
{
    handleSaveRoundRecord(record);
}

void RecordStore::updateRoundRecord(const RoundRecord& record)
{
    handleUpdateRoundRecord(record);
}

void RecordStore::replaceRoundRecords(
    const std::string_view matchId, const std::vector<RoundRecord>& records)
{
    handleReplaceRoundRecords(matchId, records);
}

void RecordStore::saveMatchSummary(const MatchSummary& summary)
{
    handleSaveMatchSummary(summary);
}

void RecordStore::updateMatchSummary(const MatchSummary& summary)
{
    handleUpdateMatchSummary(summary);
}

}
}
