/** \file
 *
 * \brief Definition of Landlord::Outcome enum
 */

#ifndef LANDLORD_OUTCOME_HH_
#define LANDLORD_OUTCOME_HH_

#include <boost/bimap/bimap.hpp>

#include <iosfwd>
#include <string>

namespace Landlord {

/** \brief Outcome of a round or a match from the point of view of one seat
 */
enum class Outcome {
    WIN,
    LOSS,
    NEUTRAL
};

/** \brief Type of \ref OUTCOME_TO_STRING_MAP
 */
using OutcomeToStringMap = boost::bimaps::bimap<Outcome, std::string>;

/** \brief Two-way map between Outcome enumerations and their string
 * representation
 */
extern const OutcomeToStringMap OUTCOME_TO_STRING_MAP;

/** \brief Determine outcome from a signed score
 *
 * \param score the score (or score delta) of a seat
 *
 * \return Outcome::WIN if \p score is positive, Outcome::LOSS if \p score is
 * negative, and Outcome::NEUTRAL if \p score is zero
 */
constexpr Outcome outcomeFor(const int score)
{
    if (score > 0) {
        return Outcome::WIN;
    } else if (score < 0) {
        return Outcome::LOSS;
    }
    return Outcome::NEUTRAL;
}

/** \brief Output an Outcome to stream
 *
 * \param os the output stream
 * \param outcome the outcome to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Outcome outcome);

}

#endif // LANDLORD_OUTCOME_HH_
