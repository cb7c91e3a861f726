#include "scoring/BidResolver.hh"

#include "landlord/LandlordConstants.hh"
#include "landlord/RoundInput.hh"

#include <algorithm>
#include <array>
#include <ostream>

namespace Landlord {
namespace Scoring {

namespace {

constexpr std::array<BidLevel, N_BID_LEVELS - 1> BID_LEVELS_FROM_HIGHEST {
    BidLevel::THREE,
    BidLevel::TWO,
    BidLevel::ONE,
};

}

BidResolverResult resolveBids(const SeatMap<BidLevel>& bids)
{
    for (const auto level : BID_LEVELS_FROM_HIGHEST) {
        const auto n_bidders = std::count(bids.begin(), bids.end(), level);
        if (n_bidders == 1) {
            const auto iter = std::ranges::find(
                SEATS, level, [&bids](const auto seat) { return bids[seat]; });
            return BidResolution {
                *iter, STAKE_PER_BID_LEVEL * bidValue(level)};
        } else if (n_bidders > 1) {
            return BidValidationError::ambiguousBid(level);
        }
    }
    return BidValidationError::noBid();
}

BidResolverResult resolveBids(const RoundInput& input)
{
    return resolveBids(input.bids);
}

bool operator==(const BidResolution& lhs, const BidResolution& rhs)
{
    return lhs.landlord == rhs.landlord && lhs.baseStake == rhs.baseStake;
}

std::ostream& operator<<(std::ostream& os, const BidResolution& resolution)
{
    return os << resolution.landlord << " " << resolution.baseStake;
}

}
}
