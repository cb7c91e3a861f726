/** \file
 *
 * \brief Definition of JSON serializer for Landlord::Statistics::PlayerStatistics
 *
 * \page jsonplayerstatistics Player statistics JSON representation
 *
 * A Landlord::Statistics::PlayerStatistics is represented by a JSON object
 * whose members are named after the fields of the struct (for instance
 * "totalRounds" and "roundsWon"). In addition the object contains the
 * derived rates "winRate", "landlordWinRate", "farmerWinRate",
 * "doubledWinRate", "matchWinRate" and "averageScorePerRound".
 *
 * - "firstBidCounts" is an array of four integers indexed by the point value
 *   of the bid
 * - "roundStreaks" and "matchStreaks" are objects with members
 *   "currentWinStreak", "currentLossStreak", "maxWinStreak" and
 *   "maxLossStreak"
 * - "runningPeak" and "runningTrough" are objects with members "value" and
 *   "roundIndex" (null if there were no rounds)
 *
 * The statistics are only ever written, never read back.
 */

#ifndef STORAGE_PLAYERSTATISTICSJSONSERIALIZER_HH_
#define STORAGE_PLAYERSTATISTICSJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

namespace Landlord {
namespace Statistics {

struct PlayerStatistics;
struct RunningMilestone;
struct StreakSummary;

/** \brief Convert StreakSummary to JSON
 */
void to_json(nlohmann::json&, const StreakSummary&);

/** \brief Convert RunningMilestone to JSON
 */
void to_json(nlohmann::json&, const RunningMilestone&);

/** \brief Convert PlayerStatistics to JSON
 */
void to_json(nlohmann::json&, const PlayerStatistics&);

}
}

#endif // STORAGE_PLAYERSTATISTICSJSONSERIALIZER_HH_
