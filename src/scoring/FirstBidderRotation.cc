#include "scoring/FirstBidderRotation.hh"

#include "landlord/LandlordConstants.hh"
#include "landlord/RoundRecord.hh"

#include <stdexcept>

namespace Landlord {
namespace Scoring {

Seat firstBidder(const int roundIndex, const Seat matchStarter)
{
    if (roundIndex < 0) {
        throw std::invalid_argument {"Negative round index"};
    }
    return seatForOrder((roundIndex + seatOrder(matchStarter)) % N_SEATS);
}

Seat effectiveFirstBidder(const RoundRecord& record, const Seat matchStarter)
{
    if (record.firstBidder) {
        return *record.firstBidder;
    }
    return firstBidder(record.roundIndex, matchStarter);
}

}
}
