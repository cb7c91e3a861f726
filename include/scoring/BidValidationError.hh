/** \file
 *
 * \brief Definition of Landlord::Scoring::BidValidationError struct
 */

#ifndef SCORING_BIDVALIDATIONERROR_HH_
#define SCORING_BIDVALIDATIONERROR_HH_

#include "landlord/BidLevel.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>

namespace Landlord {
namespace Scoring {

/** \brief Reason for rejecting the bids of a round
 *
 * A BidValidationError is returned to the scorekeeper, who must correct the
 * bids. An ambiguous bid is never resolved automatically.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct BidValidationError : private boost::equality_comparable<BidValidationError> {

    /** \brief Kind of the error
     */
    enum class Kind {
        AMBIGUOUS_BID,  ///< Several seats bid the highest bid level
        NO_BID          ///< No seat bid
    };

    Kind kind;  ///< \brief The kind of the error

    /** \brief The contested bid level
     *
     * Only present for Kind::AMBIGUOUS_BID.
     */
    std::optional<BidLevel> level;

    /** \brief Create new bid validation error
     *
     * \param kind see \ref kind
     * \param level see \ref level
     */
    constexpr BidValidationError(
        Kind kind, std::optional<BidLevel> level = std::nullopt) :
        kind {kind},
        level {level}
    {
    }

    /** \brief Create error for ambiguous bid
     *
     * \param level the bid level several seats bid
     */
    static BidValidationError ambiguousBid(BidLevel level);

    /** \brief Create error for no bid
     */
    static BidValidationError noBid();
};

/** \brief Equality operator for bid validation errors
 *
 * \sa BidValidationError
 */
bool operator==(const BidValidationError&, const BidValidationError&);

/** \brief Output a BidValidationError to stream
 *
 * The message is intended to be shown to the scorekeeper as is.
 *
 * \param os the output stream
 * \param error the error to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const BidValidationError& error);

}
}

#endif // SCORING_BIDVALIDATIONERROR_HH_
