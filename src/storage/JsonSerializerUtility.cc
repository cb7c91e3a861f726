#include "storage/JsonSerializerUtility.hh"

#include <cstdint>

using nlohmann::json;

namespace Landlord {
namespace Storage {

json timestampToJson(const Timestamp timestamp)
{
    return millisecondsSinceEpoch(timestamp);
}

Timestamp jsonToTimestamp(const json& j)
{
    if (!j.is_number_integer()) {
        throw SerializationFailureException {"Timestamp is not an integer"};
    }
    return timestampFromMilliseconds(j.get<std::int64_t>());
}

}
}
