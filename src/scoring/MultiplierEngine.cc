#include "scoring/MultiplierEngine.hh"

#include "landlord/LandlordConstants.hh"

#include <ostream>
#include <stdexcept>

namespace Landlord {
namespace Scoring {

namespace {

int farmerPayment(const int stake, const bool farmerDoubled)
{
    return farmerDoubled ? 2 * stake : stake;
}

}

RoundScore::RoundScore(const ScoreTriple& deltas) :
    deltas {deltas},
    outcomes {
        outcomeFor(deltas[Seat::A]),
        outcomeFor(deltas[Seat::B]),
        outcomeFor(deltas[Seat::C])}
{
}

int multipliedStake(
    const int baseStake, const int bombs, const bool spring,
    const bool landlordDoubled)
{
    if (baseStake <= 0) {
        throw std::invalid_argument {"Non-positive base stake"};
    }
    if (bombs < 0 || bombs > MAXIMUM_BOMBS) {
        throw std::invalid_argument {"Invalid bomb count"};
    }
    auto stake = baseStake * (1 << bombs);
    if (spring) {
        stake *= 2;
    }
    if (landlordDoubled) {
        stake *= 2;
    }
    return stake;
}

RoundScore applyMultipliers(
    const int baseStake, const RoundModifiers& modifiers)
{
    const auto landlord = modifiers.landlord;
    const auto stake = multipliedStake(
        baseStake, modifiers.bombs, modifiers.spring,
        modifiers.doubled[landlord]);

    // Negative when the farmers pay
    const auto farmer_sign = modifiers.landlordWon ? -1 : 1;
    auto deltas = ScoreTriple {};
    auto landlord_total = 0;
    for (const auto seat : SEATS) {
        if (seat != landlord) {
            const auto payment =
                farmerPayment(stake, modifiers.doubled[seat]);
            deltas[seat] = farmer_sign * payment;
            landlord_total += payment;
        }
    }
    deltas[landlord] = -farmer_sign * landlord_total;
    return RoundScore {deltas};
}

bool operator==(const RoundScore& lhs, const RoundScore& rhs)
{
    return lhs.deltas == rhs.deltas && lhs.outcomes == rhs.outcomes;
}

std::ostream& operator<<(std::ostream& os, const RoundScore& score)
{
    return os << score.deltas << " (" << score.outcomes << ")";
}

}
}
