/** \file
 *
 * \brief Definition of Landlord::ScoreTriple and score arithmetic
 */

#ifndef LANDLORD_SCORETRIPLE_HH_
#define LANDLORD_SCORETRIPLE_HH_

#include "landlord/Seat.hh"

namespace Landlord {

/** \brief Scores of the three seats
 *
 * A ScoreTriple is used both for the signed score deltas of a single round
 * and for the cumulative totals of a match.
 */
using ScoreTriple = SeatMap<int>;

/** \brief Elementwise sum of two score triples
 */
ScoreTriple operator+(const ScoreTriple& lhs, const ScoreTriple& rhs);

/** \brief Sum of the scores of all seats
 *
 * \return the sum of the scores, which is zero for every valid round
 */
int scoreSum(const ScoreTriple& scores);

/** \brief Elementwise maximum of two score triples
 */
ScoreTriple elementwiseMax(const ScoreTriple& lhs, const ScoreTriple& rhs);

/** \brief Elementwise minimum of two score triples
 */
ScoreTriple elementwiseMin(const ScoreTriple& lhs, const ScoreTriple& rhs);

}

#endif // LANDLORD_SCORETRIPLE_HH_
