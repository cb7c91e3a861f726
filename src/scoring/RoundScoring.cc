#include "scoring/RoundScoring.hh"

#include "landlord/RoundInput.hh"

namespace Landlord {
namespace Scoring {

RoundScoringResult scoreRound(const RoundInput& input)
{
    const auto result = resolveBids(input);
    if (const auto* error = std::get_if<BidValidationError>(&result)) {
        return *error;
    }
    const auto& resolution = std::get<BidResolution>(result);
    const auto modifiers = RoundModifiers {
        resolution.landlord, input.doubled, input.bombs, input.spring,
        input.landlordWon};
    return ScoredRound {
        resolution, applyMultipliers(resolution.baseStake, modifiers)};
}

}
}
