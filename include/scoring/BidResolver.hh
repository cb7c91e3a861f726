/** \file
 *
 * \brief Definition of the utility resolving the landlord from the bids
 */

#ifndef SCORING_BIDRESOLVER_HH_
#define SCORING_BIDRESOLVER_HH_

#include "landlord/BidLevel.hh"
#include "landlord/Seat.hh"
#include "scoring/BidValidationError.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <variant>

namespace Landlord {

struct RoundInput;

/** \brief Services related to scoring individual rounds and matches
 */
namespace Scoring {

/** \brief Successful outcome of the bidding phase
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct BidResolution : private boost::equality_comparable<BidResolution> {
    Seat landlord;  ///< \brief The seat that won the bidding
    int baseStake;  ///< \brief The stake before multipliers

    /** \brief Create new bid resolution
     *
     * \param landlord see \ref landlord
     * \param baseStake see \ref baseStake
     */
    constexpr BidResolution(Seat landlord, int baseStake) :
        landlord {landlord},
        baseStake {baseStake}
    {
    }
};

/** \brief Result of resolveBids()
 */
using BidResolverResult = std::variant<BidResolution, BidValidationError>;

/** \brief Resolve the landlord and the base stake from the bids
 *
 * The bid levels are examined from the highest (three) to the lowest
 * (one). At the first level at least one seat bid, the seat is the landlord
 * if it is the only one bidding that level, and the base stake is \ref
 * STAKE_PER_BID_LEVEL times the level. If several seats bid the level, the
 * bids are ambiguous. Ties at lower levels are irrelevant once a higher level
 * has a unique bidder.
 *
 * \param bids the bids of each seat
 *
 * \return BidResolution identifying the landlord and the base stake, or
 * BidValidationError if the bids are ambiguous or nobody bid
 */
BidResolverResult resolveBids(const SeatMap<BidLevel>& bids);

/** \brief Resolve the landlord and the base stake of a round
 *
 * \copydetails resolveBids(const SeatMap<BidLevel>&)
 */
BidResolverResult resolveBids(const RoundInput& input);

/** \brief Equality operator for bid resolutions
 *
 * \sa BidResolution
 */
bool operator==(const BidResolution&, const BidResolution&);

/** \brief Output a BidResolution to stream
 *
 * \param os the output stream
 * \param resolution the bid resolution to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const BidResolution& resolution);

}
}

#endif // SCORING_BIDRESOLVER_HH_
