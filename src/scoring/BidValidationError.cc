#include "scoring/BidValidationError.hh"

#include <ostream>

namespace Landlord {
namespace Scoring {

BidValidationError BidValidationError::ambiguousBid(const BidLevel level)
{
    return BidValidationError {Kind::AMBIGUOUS_BID, level};
}

BidValidationError BidValidationError::noBid()
{
    return BidValidationError {Kind::NO_BID};
}

bool operator==(const BidValidationError& lhs, const BidValidationError& rhs)
{
    return lhs.kind == rhs.kind && lhs.level == rhs.level;
}

std::ostream& operator<<(std::ostream& os, const BidValidationError& error)
{
    if (error.kind == BidValidationError::Kind::AMBIGUOUS_BID && error.level) {
        return os << "More than one seat bid " << bidValue(*error.level);
    }
    return os << "Nobody bid";
}

}
}
