#include "storage/BidLevelJsonSerializer.hh"

#include "landlord/BidLevel.hh"
#include "storage/SerializationFailureException.hh"

using nlohmann::json;

namespace Landlord {

void to_json(json& j, const BidLevel level)
{
    j = bidValue(level);
}

void from_json(const json& j, BidLevel& level)
{
    if (!j.is_number_integer()) {
        throw Storage::SerializationFailureException {"Bid is not an integer"};
    }
    if (const auto opt_level = bidLevelForValue(j.get<int>())) {
        level = *opt_level;
    } else {
        throw Storage::SerializationFailureException {"Invalid bid"};
    }
}

}
