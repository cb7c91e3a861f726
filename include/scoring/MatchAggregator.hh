/** \file
 *
 * \brief Definition of the utility folding the rounds of a match
 */

#ifndef SCORING_MATCHAGGREGATOR_HH_
#define SCORING_MATCHAGGREGATOR_HH_

#include "landlord/ScoreTriple.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <vector>

namespace Landlord {

struct MatchSummary;
struct RoundRecord;

namespace Scoring {

/** \brief Running totals of a match
 *
 * MatchFold is the result of folding the ordered rounds of a match. The
 * element \c n of \ref scores is the elementwise sum of the deltas of rounds
 * 0..n. The snapshots are the extremes of the running total of each seat,
 * including the zero totals before the first round.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct MatchFold : private boost::equality_comparable<MatchFold> {
    std::vector<ScoreTriple> scores;  ///< \brief The running totals
    ScoreTriple maxSnapshot;          ///< \brief The highest running totals
    ScoreTriple minSnapshot;          ///< \brief The lowest running totals
};

/** \brief Fold the rounds of a match into running totals
 *
 * The result is always computed from scratch. After any round of a match has
 * been changed, the whole match needs to be folded again.
 *
 * \param rounds the rounds of the match, ordered by round index
 *
 * \return the running totals and the snapshots
 */
MatchFold foldMatch(const std::vector<RoundRecord>& rounds);

/** \brief Return the final score of a folded match
 *
 * \return the last running total in \p fold, or zeros if there were no
 * rounds
 */
ScoreTriple finalScore(const MatchFold& fold);

/** \brief Fill in the scoring fields of a match summary
 *
 * \param summary the match summary whose identity fields (id, players,
 * times, starter) are kept
 * \param fold the folded rounds of the match
 *
 * \return \p summary with the final score, the number of rounds and the
 * snapshots taken from \p fold
 */
MatchSummary summarizeMatch(MatchSummary summary, const MatchFold& fold);

/** \brief Equality operator for match folds
 *
 * \sa MatchFold
 */
bool operator==(const MatchFold&, const MatchFold&);

/** \brief Output a MatchFold to stream
 *
 * \param os the output stream
 * \param fold the match fold to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const MatchFold& fold);

}
}

#endif // SCORING_MATCHAGGREGATOR_HH_
