/** \file
 *
 * \brief Definition of Landlord::MatchSummary struct
 */

#ifndef LANDLORD_MATCHSUMMARY_HH_
#define LANDLORD_MATCHSUMMARY_HH_

#include "landlord/Player.hh"
#include "landlord/ScoreTriple.hh"
#include "landlord/Seat.hh"
#include "landlord/Timestamp.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace Landlord {

/** \brief Aggregate of a match
 *
 * A MatchSummary is created when a match is started. The scoring fields are
 * filled in from the rounds of the match by
 * Scoring::summarizeMatch(). The snapshot fields record the highest and
 * lowest cumulative score each seat reached at any point during the match,
 * including the initial zero.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct MatchSummary : private boost::equality_comparable<MatchSummary> {
    std::string id;                   ///< \brief The identifier of the match
    SeatMap<PlayerId> playerIds;      ///< \brief The players at each seat
    Timestamp startedAt {};           ///< \brief The time the match started
    std::optional<Timestamp> endedAt; ///< \brief The time the match ended
    ScoreTriple finalScore;           ///< \brief The final cumulative score
    int totalRounds {};               ///< \brief The number of rounds played
    ScoreTriple maxSnapshot;          ///< \brief The highest running totals
    ScoreTriple minSnapshot;          ///< \brief The lowest running totals
    Seat initialStarter {Seat::A};    ///< \brief First bidder of round 1
};

/** \brief Equality operator for match summaries
 *
 * \sa MatchSummary
 */
bool operator==(const MatchSummary&, const MatchSummary&);

/** \brief Output a MatchSummary to stream
 *
 * \param os the output stream
 * \param summary the match summary to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const MatchSummary& summary);

}

#endif // LANDLORD_MATCHSUMMARY_HH_
