/** \file
 *
 * \brief Definition of the utility scoring a round from its raw input
 */

#ifndef SCORING_ROUNDSCORING_HH_
#define SCORING_ROUNDSCORING_HH_

#include "scoring/BidResolver.hh"
#include "scoring/BidValidationError.hh"
#include "scoring/MultiplierEngine.hh"

#include <variant>

namespace Landlord {

struct RoundInput;

namespace Scoring {

/** \brief A round that has been resolved and scored
 */
struct ScoredRound {
    BidResolution resolution;  ///< \brief The landlord and the base stake
    RoundScore score;          ///< \brief The signed scores
};

/** \brief Result of scoreRound()
 */
using RoundScoringResult = std::variant<ScoredRound, BidValidationError>;

/** \brief Resolve and score a round
 *
 * This function first resolves the bids using resolveBids(), and then
 * applies the modifiers of \p input to the base stake using
 * applyMultipliers().
 *
 * \param input the round input
 *
 * \return the resolved and scored round, or the validation error if the
 * bids could not be resolved
 *
 * \throw std::invalid_argument if the bomb count of \p input is out of range
 */
RoundScoringResult scoreRound(const RoundInput& input);

}
}

#endif // SCORING_ROUNDSCORING_HH_
