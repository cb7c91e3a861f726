/** \file
 *
 * \brief Definition of the rotation of the right to bid first
 */

#ifndef SCORING_FIRSTBIDDERROTATION_HH_
#define SCORING_FIRSTBIDDERROTATION_HH_

#include "landlord/Seat.hh"

namespace Landlord {

struct RoundRecord;

namespace Scoring {

/** \brief Determine the seat bidding first in a round
 *
 * The right to bid first rotates in seat order, starting from the seat that
 * bid first in the first round of the match.
 *
 * \param roundIndex the 0-based index of the round within the match
 * \param matchStarter the seat that bid first in the first round
 *
 * \return the seat bidding first in round \p roundIndex
 *
 * \throw std::invalid_argument if \p roundIndex is negative
 */
Seat firstBidder(int roundIndex, Seat matchStarter);

/** \brief Determine the seat that bid first in a recorded round
 *
 * The first bidder stored in the record takes precedence, because the
 * starter may have changed in the middle of a match. The rotation formula is
 * only used as fallback for records that lack the field.
 *
 * \param record the round record
 * \param matchStarter the seat that bid first in the first round of the
 * match the record belongs to
 *
 * \return the seat that bid first in \p record
 *
 * \sa firstBidder()
 */
Seat effectiveFirstBidder(const RoundRecord& record, Seat matchStarter);

}
}

#endif // SCORING_FIRSTBIDDERROTATION_HH_
