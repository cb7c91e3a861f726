#include "landlord/Timestamp.hh"

#include <ostream>

namespace Landlord {

Timestamp now()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

Timestamp timestampFromMilliseconds(const std::int64_t milliseconds)
{
    return Timestamp {std::chrono::milliseconds {milliseconds}};
}

std::int64_t millisecondsSinceEpoch(const Timestamp timestamp)
{
    return timestamp.time_since_epoch().count();
}

std::ostream& operator<<(std::ostream& os, const Timestamp timestamp)
{
    return os << millisecondsSinceEpoch(timestamp);
}

}
