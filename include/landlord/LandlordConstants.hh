/** \file
 *
 * \brief Definition of fundamental game constants needed by several classes
 */

#ifndef LANDLORD_LANDLORDCONSTANTS_HH_
#define LANDLORD_LANDLORDCONSTANTS_HH_

/** \brief Top level namespace of the landlord scorekeeping framework
 *
 * The Landlord namespace directly contains the data model of the scorekeeper:
 * seats, bids, rounds and matches. It also contains several subnamespaces for
 * clearly identifiable collections of higher level functionality.
 */
namespace Landlord {

/** \brief Number of seats (players) in a round
 */
constexpr auto N_SEATS = 3;

/** \brief Number of farmers in a round
 *
 * One seat is the landlord, the rest are farmers.
 */
constexpr auto N_FARMERS = N_SEATS - 1;

/** \brief Stake per bid level
 *
 * The base stake of a round is the winning bid level multiplied by this
 * value.
 */
constexpr auto STAKE_PER_BID_LEVEL = 100;

/** \brief Maximum number of bombs accepted in a round
 *
 * Each bomb doubles the stake, so the number needs to be capped to keep the
 * scores within the range of int.
 */
constexpr auto MAXIMUM_BOMBS = 10;

}

#endif // LANDLORD_LANDLORDCONSTANTS_HH_
