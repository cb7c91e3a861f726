/** \file
 *
 * \brief Definition of the utility applying the stake multipliers of a round
 */

#ifndef SCORING_MULTIPLIERENGINE_HH_
#define SCORING_MULTIPLIERENGINE_HH_

#include "landlord/Outcome.hh"
#include "landlord/ScoreTriple.hh"
#include "landlord/Seat.hh"

#include <boost/operators.hpp>

#include <iosfwd>

namespace Landlord {
namespace Scoring {

/** \brief The modifiers of a round affecting its score
 */
struct RoundModifiers {
    Seat landlord {Seat::A};  ///< \brief The landlord of the round
    SeatMap<bool> doubled;    ///< \brief The doubling flag of each seat
    int bombs {};             ///< \brief The number of bombs played
    bool spring {};           ///< \brief Was the round a spring
    bool landlordWon {};      ///< \brief Did the landlord’s side win
};

/** \brief Signed score of each seat in a round
 *
 * The outcome of each seat is carried alongside its score delta.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct RoundScore : private boost::equality_comparable<RoundScore> {
    ScoreTriple deltas;        ///< \brief The score delta of each seat
    SeatMap<Outcome> outcomes; ///< \brief The outcome of each seat

    RoundScore() = default;

    /** \brief Create round score from deltas
     *
     * The outcomes are determined from the signs of \p deltas.
     *
     * \param deltas see \ref deltas
     */
    explicit RoundScore(const ScoreTriple& deltas);
};

/** \brief Calculate the stake a farmer pays before their own doubling
 *
 * The base stake is doubled once for each bomb, once more if the round was a
 * spring, and once more if the landlord doubled.
 *
 * \param baseStake the stake determined by the bidding
 * \param bombs the number of bombs
 * \param spring was the round a spring
 * \param landlordDoubled did the landlord double
 *
 * \return the multiplied stake
 *
 * \throw std::invalid_argument if \p baseStake is not positive, or \p bombs
 * is negative or exceeds \ref MAXIMUM_BOMBS
 */
int multipliedStake(int baseStake, int bombs, bool spring, bool landlordDoubled);

/** \brief Calculate the signed scores of a round
 *
 * Each farmer pays (or receives) the multiplied stake, doubled if that
 * farmer doubled. The landlord receives (or pays) the sum of the farmer
 * payments. The scores always sum to zero.
 *
 * \param baseStake the stake determined by the bidding
 * \param modifiers the modifiers of the round
 *
 * \return the score delta and the outcome of each seat
 *
 * \throw std::invalid_argument if \p baseStake is not positive, or the bomb
 * count is negative or exceeds \ref MAXIMUM_BOMBS
 *
 * \sa multipliedStake()
 */
RoundScore applyMultipliers(int baseStake, const RoundModifiers& modifiers);

/** \brief Equality operator for round scores
 *
 * \sa RoundScore
 */
bool operator==(const RoundScore&, const RoundScore&);

/** \brief Output a RoundScore to stream
 *
 * \param os the output stream
 * \param score the round score to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const RoundScore& score);

}
}

#endif // SCORING_MULTIPLIERENGINE_HH_
