/** \file
 *
 * \brief Definition of Landlord::Statistics::PlayerStatistics struct
 */

#ifndef STATISTICS_PLAYERSTATISTICS_HH_
#define STATISTICS_PLAYERSTATISTICS_HH_

#include "landlord/BidLevel.hh"
#include "landlord/Player.hh"
#include "statistics/Streak.hh"

#include <array>
#include <iosfwd>
#include <optional>

namespace Landlord {

/** \brief Services related to the statistics derived from the history of a
 * player
 */
namespace Statistics {

/** \brief Extreme value of a running total
 *
 * \ref roundIndex is the 0-based index (in the chronological sequence of all
 * rounds of the player) of the round after which the running total first
 * reached \ref value. It is empty if the player has no rounds.
 */
struct RunningMilestone {
    int value {};                   ///< \brief The extreme value
    std::optional<int> roundIndex;  ///< \brief Where the value was reached
};

/** \brief Aggregate statistics of a player
 *
 * PlayerStatistics is never stored. It is computed from the full history of
 * the player by computeStatistics() whenever it is needed.
 *
 * A round (or a match) is won if the score of the player is positive, lost if
 * the score is negative, and neither if the score is zero.
 */
struct PlayerStatistics {
    PlayerId playerId;        ///< \brief The player

    int totalRounds {};       ///< \brief Number of rounds played
    int roundsWon {};         ///< \brief Number of rounds won
    int roundsLost {};        ///< \brief Number of rounds lost

    int roundsAsLandlord {};  ///< \brief Rounds played as landlord
    int landlordWins {};      ///< \brief Rounds won as landlord
    int landlordLosses {};    ///< \brief Rounds lost as landlord
    int roundsAsFarmer {};    ///< \brief Rounds played as farmer
    int farmerWins {};        ///< \brief Rounds won as farmer
    int farmerLosses {};      ///< \brief Rounds lost as farmer

    /** \brief Rounds in which the player bid first
     */
    int firstBidderRounds {};

    /** \brief Bids made when the player bid first
     *
     * Indexed by the point value of the bid.
     *
     * \sa firstBidCount()
     */
    std::array<int, N_BID_LEVELS> firstBidCounts {};

    int springCount {};         ///< \brief Springs won as landlord
    int springAgainstCount {};  ///< \brief Springs suffered as farmer

    int doubledRounds {};  ///< \brief Rounds in which the player doubled
    int doubledWins {};    ///< \brief Doubled rounds won
    int doubledLosses {};  ///< \brief Doubled rounds lost

    StreakSummary roundStreaks;  ///< \brief Streaks counted by round
    StreakSummary matchStreaks;  ///< \brief Streaks counted by match

    int totalMatches {};  ///< \brief Number of matches played
    int matchesWon {};    ///< \brief Matches with positive final score
    int matchesLost {};   ///< \brief Matches with negative final score
    int matchesTied {};   ///< \brief Matches with zero final score

    int totalScore {};       ///< \brief Sum of all round scores
    int bestRoundScore {};   ///< \brief Highest single round score
    int worstRoundScore {};  ///< \brief Lowest single round score
    int bestMatchScore {};   ///< \brief Highest final score of a match
    int worstMatchScore {};  ///< \brief Lowest final score of a match
    int bestSnapshot {};     ///< \brief Highest running total within a match
    int worstSnapshot {};    ///< \brief Lowest running total within a match

    /** \brief Highest value of the running total across all rounds
     */
    RunningMilestone runningPeak;

    /** \brief Lowest value of the running total across all rounds
     */
    RunningMilestone runningTrough;
};

/** \brief Number of times the player bid \p level when bidding first
 */
int firstBidCount(const PlayerStatistics& stats, BidLevel level);

/** \brief Ratio of rounds won to rounds played
 *
 * \return the ratio in [0, 1], or zero if no rounds were played
 */
double winRate(const PlayerStatistics& stats);

/** \brief Ratio of rounds won to rounds played as landlord
 *
 * \return the ratio in [0, 1], or zero if no rounds were played as landlord
 */
double landlordWinRate(const PlayerStatistics& stats);

/** \brief Ratio of rounds won to rounds played as farmer
 *
 * \return the ratio in [0, 1], or zero if no rounds were played as farmer
 */
double farmerWinRate(const PlayerStatistics& stats);

/** \brief Ratio of doubled rounds won to doubled rounds
 *
 * \return the ratio in [0, 1], or zero if the player never doubled
 */
double doubledWinRate(const PlayerStatistics& stats);

/** \brief Ratio of matches won to matches played
 *
 * \return the ratio in [0, 1], or zero if no matches were played
 */
double matchWinRate(const PlayerStatistics& stats);

/** \brief Average score per round
 *
 * \return the average score, or zero if no rounds were played
 */
double averageScorePerRound(const PlayerStatistics& stats);

/** \brief Output a RunningMilestone to stream
 *
 * \param os the output stream
 * \param milestone the milestone to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const RunningMilestone& milestone);

/** \brief Output a PlayerStatistics to stream
 *
 * \param os the output stream
 * \param stats the statistics to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const PlayerStatistics& stats);

}
}

#endif // STATISTICS_PLAYERSTATISTICS_HH_
