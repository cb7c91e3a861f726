/** \file
 *
 * \brief Definition of JSON serializer for Landlord::BidLevel
 *
 * \page jsonbidlevel Bid level JSON representation
 *
 * A Landlord::BidLevel is represented by its point value, an integer between
 * 0 (no bid) and 3.
 */

#ifndef STORAGE_BIDLEVELJSONSERIALIZER_HH_
#define STORAGE_BIDLEVELJSONSERIALIZER_HH_

#include <nlohmann/json.hpp>

namespace Landlord {

enum class BidLevel;

/** \brief Convert BidLevel to JSON
 */
void to_json(nlohmann::json&, BidLevel);

/** \brief Convert JSON to BidLevel
 *
 * \throw Storage::SerializationFailureException if the value is not a valid
 * bid point value
 */
void from_json(const nlohmann::json&, BidLevel&);

}

#endif // STORAGE_BIDLEVELJSONSERIALIZER_HH_
