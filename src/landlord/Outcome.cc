#include "landlord/Outcome.hh"

#include <initializer_list>
#include <ostream>

namespace Landlord {

namespace {

const auto OUTCOME_STRING_PAIRS = {
    OutcomeToStringMap::value_type {Outcome::WIN,     "win"},
    OutcomeToStringMap::value_type {Outcome::LOSS,    "loss"},
    OutcomeToStringMap::value_type {Outcome::NEUTRAL, "neutral"},
};

}

const OutcomeToStringMap OUTCOME_TO_STRING_MAP(
    OUTCOME_STRING_PAIRS.begin(), OUTCOME_STRING_PAIRS.end());

std::ostream& operator<<(std::ostream& os, const Outcome outcome)
{
    return os << OUTCOME_TO_STRING_MAP.left.at(outcome);
}

}
