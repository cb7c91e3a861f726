/** \file
 *
 * \brief Definition of statistics computation functions
 */

#ifndef STATISTICS_STATISTICSENGINE_HH_
#define STATISTICS_STATISTICSENGINE_HH_

#include "landlord/Player.hh"
#include "statistics/PlayerStatistics.hh"

#include <vector>

namespace Landlord {

struct MatchSummary;
struct RoundRecord;

namespace Statistics {

/** \brief Compute the statistics of a player
 *
 * The statistics are computed from scratch by replaying the whole history of
 * the player. Each group of fields is computed by an independent scan over
 * the inputs.
 *
 * The computation never fails because of historical data. Records lacking
 * the spring flag are treated as non-spring rounds, and records lacking the
 * first bidder are treated as if Seat::A had bid first. Rounds and matches
 * the player did not take part in are skipped.
 *
 * \param playerId the player
 * \param rounds the rounds of the player in the order they were played
 * \param matches the matches of the player in the order they were started
 *
 * \return the statistics of the player
 */
PlayerStatistics computeStatistics(
    const PlayerId& playerId,
    const std::vector<RoundRecord>& rounds,
    const std::vector<MatchSummary>& matches);

/** \brief Compute the statistics of a player within a single match
 *
 * This is the same computation as computeStatistics() restricted to the
 * rounds belonging to \p match.
 *
 * \param playerId the player
 * \param match the match
 * \param rounds the rounds of the match ordered by round index (rounds of
 * other matches are ignored)
 *
 * \return the statistics of the player within the match
 */
PlayerStatistics computeMatchStatistics(
    const PlayerId& playerId,
    const MatchSummary& match,
    const std::vector<RoundRecord>& rounds);

}
}

#endif // STATISTICS_STATISTICSENGINE_HH_
