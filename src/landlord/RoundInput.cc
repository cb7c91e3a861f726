#include "landlord/RoundInput.hh"

#include <ostream>

namespace Landlord {

RoundInput::RoundInput(
    const SeatMap<BidLevel>& bids, const SeatMap<bool>& doubled,
    const int bombs, const bool spring, const bool landlordWon) :
    bids {bids},
    doubled {doubled},
    bombs {bombs},
    spring {spring},
    landlordWon {landlordWon}
{
}

bool operator==(const RoundInput& lhs, const RoundInput& rhs)
{
    return lhs.bids == rhs.bids && lhs.doubled == rhs.doubled &&
        lhs.bombs == rhs.bombs && lhs.spring == rhs.spring &&
        lhs.landlordWon == rhs.landlordWon;
}

std::ostream& operator<<(std::ostream& os, const RoundInput& input)
{
    return os << "bids: " << input.bids << "; doubled: " << input.doubled <<
        "; bombs: " << input.bombs << "; spring: " << input.spring <<
        "; landlord won: " << input.landlordWon;
}

}
