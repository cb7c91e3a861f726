/** \file
 *
 * \brief Definition of Landlord::RoundInput struct
 */

#ifndef LANDLORD_ROUNDINPUT_HH_
#define LANDLORD_ROUNDINPUT_HH_

#include "landlord/BidLevel.hh"
#include "landlord/Seat.hh"

#include <boost/operators.hpp>

#include <iosfwd>

namespace Landlord {

/** \brief Raw description of a round as entered by the scorekeeper
 *
 * RoundInput contains everything needed to score a round: the bids, the
 * doubling flags, the modifiers and the result. It is transient and only
 * exists until the round has been resolved into a RoundRecord.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct RoundInput : private boost::equality_comparable<RoundInput> {
    SeatMap<BidLevel> bids;  ///< \brief The bid of each seat
    SeatMap<bool> doubled;   ///< \brief Did the seat double the stake
    int bombs {};            ///< \brief The number of bombs played
    bool spring {};          ///< \brief Was the round a spring
    bool landlordWon {true}; ///< \brief Did the landlord’s side win

    RoundInput() = default;

    /** \brief Create new round input
     *
     * \param bids see \ref bids
     * \param doubled see \ref doubled
     * \param bombs see \ref bombs
     * \param spring see \ref spring
     * \param landlordWon see \ref landlordWon
     */
    RoundInput(
        const SeatMap<BidLevel>& bids, const SeatMap<bool>& doubled,
        int bombs, bool spring, bool landlordWon);
};

/** \brief Equality operator for round inputs
 *
 * \sa RoundInput
 */
bool operator==(const RoundInput&, const RoundInput&);

/** \brief Output a RoundInput to stream
 *
 * \param os the output stream
 * \param input the round input to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const RoundInput& input);

}

#endif // LANDLORD_ROUNDINPUT_HH_
