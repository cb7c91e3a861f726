/** \file
 *
 * \brief Definition of Landlord::Timestamp
 */

#ifndef LANDLORD_TIMESTAMP_HH_
#define LANDLORD_TIMESTAMP_HH_

#include <chrono>
#include <cstdint>
#include <iosfwd>

namespace Landlord {

/** \brief Point in time with millisecond precision
 *
 * Timestamps are used to order rounds by the time they were played and
 * matches by the time they were started.
 */
using Timestamp = std::chrono::time_point<
    std::chrono::system_clock, std::chrono::milliseconds>;

/** \brief Return the current time as Timestamp
 */
Timestamp now();

/** \brief Create timestamp from milliseconds since the Unix epoch
 */
Timestamp timestampFromMilliseconds(std::int64_t milliseconds);

/** \brief Return milliseconds since the Unix epoch
 */
std::int64_t millisecondsSinceEpoch(Timestamp timestamp);

/** \brief Output a Timestamp to stream
 *
 * The timestamp is output as milliseconds since the Unix epoch.
 *
 * \param os the output stream
 * \param timestamp the timestamp to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Timestamp timestamp);

}

#endif // LANDLORD_TIMESTAMP_HH_
