#ifndef MOCKRECORDSTORE_HH_
#define MOCKRECORDSTORE_HH_

#include "storage/RecordStore.hh"

#include <gmock/gmock.h>

#include <optional>
#include <string_view>
#include <vector>

namespace Landlord {
namespace Storage {

class MockRecordStore : public RecordStore
{
public:
    MOCK_CONST_METHOD1(
        handleLoadRoundRecordsForPlayer,
        std::vector<RoundRecord>(const PlayerId&));
    MOCK_CONST_METHOD1(
        handleLoadRoundRecordsForMatch,
        std::vector<RoundRecord>(std::string_view));
    MOCK_CONST_METHOD1(
        handleLoadMatchSummaries,
        std::vector<MatchSummary>(const PlayerId&));
    MOCK_CONST_METHOD1(
        handleLoadMatchSummary,
        std::optional<MatchSummary>(std::string_view));
    MOCK_METHOD1(handleSaveRoundRecord, void(const RoundRecord&));
    MOCK_METHOD1(handleUpdateRoundRecord, void(const RoundRecord&));
    MOCK_METHOD2(
        handleReplaceRoundRecords,
        void(std::string_view, const std::vector<RoundRecord>&));
    MOCK_METHOD1(handleSaveMatchSummary, void(const MatchSummary&));
    MOCK_METHOD1(handleUpdateMatchSummary, void(const MatchSummary&));
};

}
}

#endif // MOCKRECORDSTORE_HH_
