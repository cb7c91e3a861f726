/** \file
 *
 * \brief Definition of Landlord::RoundRecord struct
 */

#ifndef LANDLORD_ROUNDRECORD_HH_
#define LANDLORD_ROUNDRECORD_HH_

#include "landlord/BidLevel.hh"
#include "landlord/Player.hh"
#include "landlord/ScoreTriple.hh"
#include "landlord/Seat.hh"
#include "landlord/Timestamp.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace Landlord {

/** \brief Resolved and persisted outcome of one round
 *
 * A RoundRecord is created when a RoundInput has been validated and scored,
 * and it is never modified afterwards except by re-resolving the round
 * (which also requires the match to be refolded).
 *
 * The \ref spring and \ref firstBidder fields are optional because records
 * created by older versions of the scorekeeper lack them. Use isSpring() and
 * recordedFirstBidder() to access them with their documented defaults.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct RoundRecord : private boost::equality_comparable<RoundRecord> {
    std::string matchId;             ///< \brief The match the round belongs to
    int roundIndex {};               ///< \brief 0-based index within the match
    Timestamp playedAt {};           ///< \brief The time the round was played
    SeatMap<PlayerId> playerIds;     ///< \brief The players at each seat
    Seat landlord {Seat::A};         ///< \brief The landlord of the round
    SeatMap<BidLevel> bids;          ///< \brief The bid of each seat
    SeatMap<bool> doubled;           ///< \brief The doubling flag of each seat
    int bombs {};                    ///< \brief The number of bombs
    std::optional<bool> spring;      ///< \brief Was the round a spring
    bool landlordWon {};             ///< \brief Did the landlord’s side win
    ScoreTriple deltas;              ///< \brief Signed score of each seat
    std::optional<Seat> firstBidder; ///< \brief The seat that bid first
};

/** \brief Determine whether the round was a spring
 *
 * \return the spring flag of \p record, or false if the record lacks it
 */
bool isSpring(const RoundRecord& record);

/** \brief Determine the seat that bid first in the round
 *
 * \return the recorded first bidder of \p record, or Seat::A if the record
 * lacks it
 */
Seat recordedFirstBidder(const RoundRecord& record);

/** \brief Determine whether a seat was the landlord of the round
 */
bool isLandlord(const RoundRecord& record, Seat seat);

/** \brief Equality operator for round records
 *
 * \sa RoundRecord
 */
bool operator==(const RoundRecord&, const RoundRecord&);

/** \brief Output a RoundRecord to stream
 *
 * \param os the output stream
 * \param record the round record to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const RoundRecord& record);

}

#endif // LANDLORD_ROUNDRECORD_HH_
