#include "landlord/BidLevel.hh"

#include <initializer_list>
#include <ostream>

namespace Landlord {

namespace {

const auto BID_LEVEL_STRING_PAIRS = {
    BidLevelToStringMap::value_type {BidLevel::NONE,  "none"},
    BidLevelToStringMap::value_type {BidLevel::ONE,   "one"},
    BidLevelToStringMap::value_type {BidLevel::TWO,   "two"},
    BidLevelToStringMap::value_type {BidLevel::THREE, "three"},
};

}

const BidLevelToStringMap BID_LEVEL_TO_STRING_MAP(
    BID_LEVEL_STRING_PAIRS.begin(), BID_LEVEL_STRING_PAIRS.end());

std::optional<BidLevel> bidLevelForValue(const int value)
{
    if (value < 0 || value >= N_BID_LEVELS) {
        return std::nullopt;
    }
    return BID_LEVELS[value];
}

std::ostream& operator<<(std::ostream& os, const BidLevel level)
{
    return os << BID_LEVEL_TO_STRING_MAP.left.at(level);
}

}
