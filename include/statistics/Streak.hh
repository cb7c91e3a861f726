/** \file
 *
 * \brief Definition of Landlord::Statistics::StreakCounter class
 */

#ifndef STATISTICS_STREAK_HH_
#define STATISTICS_STREAK_HH_

#include <boost/operators.hpp>

#include <iosfwd>

namespace Landlord {
namespace Statistics {

/** \brief Win and loss streaks of a player
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct StreakSummary : private boost::equality_comparable<StreakSummary> {
    int currentWinStreak {};   ///< \brief Consecutive wins up to now
    int currentLossStreak {};  ///< \brief Consecutive losses up to now
    int maxWinStreak {};       ///< \brief Longest run of wins
    int maxLossStreak {};      ///< \brief Longest run of losses

    StreakSummary() = default;

    /** \brief Create new streak summary
     *
     * \param currentWinStreak see \ref currentWinStreak
     * \param currentLossStreak see \ref currentLossStreak
     * \param maxWinStreak see \ref maxWinStreak
     * \param maxLossStreak see \ref maxLossStreak
     */
    constexpr StreakSummary(
        int currentWinStreak, int currentLossStreak, int maxWinStreak,
        int maxLossStreak) :
        currentWinStreak {currentWinStreak},
        currentLossStreak {currentLossStreak},
        maxWinStreak {maxWinStreak},
        maxLossStreak {maxLossStreak}
    {
    }
};

/** \brief Streak counter
 *
 * StreakCounter admits signed scores in chronological order and keeps track
 * of the win and loss streaks. A positive score extends the win streak and
 * breaks the loss streak, and a negative score does the opposite. A zero
 * score breaks both streaks.
 */
class StreakCounter {
public:

    /** \brief Add the next score
     *
     * \param score the signed score of a round or a match
     */
    void addScore(int score);

    /** \brief Retrieve the streaks after the scores added so far
     */
    const StreakSummary& getSummary() const;

private:

    StreakSummary summary;
};

/** \brief Equality operator for streak summaries
 *
 * \sa StreakSummary
 */
bool operator==(const StreakSummary&, const StreakSummary&);

/** \brief Output a StreakSummary to stream
 *
 * \param os the output stream
 * \param summary the streak summary to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const StreakSummary& summary);

}
}

#endif // STATISTICS_STREAK_HH_
