#include "landlord/RoundRecord.hh"

#include "IoUtility.hh"

#include <ostream>

namespace Landlord {

bool isSpring(const RoundRecord& record)
{
    return record.spring.value_or(false);
}

Seat recordedFirstBidder(const RoundRecord& record)
{
    return record.firstBidder.value_or(Seat::A);
}

bool isLandlord(const RoundRecord& record, const Seat seat)
{
    return record.landlord == seat;
}

bool operator==(const RoundRecord& lhs, const RoundRecord& rhs)
{
    return &lhs == &rhs || (
        lhs.matchId == rhs.matchId &&
        lhs.roundIndex == rhs.roundIndex &&
        lhs.playedAt == rhs.playedAt &&
        lhs.playerIds == rhs.playerIds &&
        lhs.landlord == rhs.landlord &&
        lhs.bids == rhs.bids &&
        lhs.doubled == rhs.doubled &&
        lhs.bombs == rhs.bombs &&
        lhs.spring == rhs.spring &&
        lhs.landlordWon == rhs.landlordWon &&
        lhs.deltas == rhs.deltas &&
        lhs.firstBidder == rhs.firstBidder);
}

std::ostream& operator<<(std::ostream& os, const RoundRecord& record)
{
    return os << record.matchId << "#" << record.roundIndex <<
        " landlord: " << record.landlord <<
        "; bids: " << record.bids <<
        "; doubled: " << record.doubled <<
        "; bombs: " << record.bombs <<
        "; spring: " << record.spring <<
        "; landlord won: " << record.landlordWon <<
        "; deltas: " << record.deltas <<
        "; first bidder: " << record.firstBidder;
}

}
