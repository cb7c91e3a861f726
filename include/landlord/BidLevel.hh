/** \file
 *
 * \brief Definition of Landlord::BidLevel enum and related utilities
 */

#ifndef LANDLORD_BIDLEVEL_HH_
#define LANDLORD_BIDLEVEL_HH_

#include <boost/bimap/bimap.hpp>

#include <array>
#include <iosfwd>
#include <optional>
#include <string>

namespace Landlord {

/** \brief Bid made by a seat in the bidding phase of a round
 *
 * The levels are ordered from NONE (the seat declined to bid) to THREE (the
 * highest possible bid). The underlying value of each level is its point
 * value.
 */
enum class BidLevel {
    NONE,
    ONE,
    TWO,
    THREE
};

/** \brief Number of bid levels
 *
 * \sa BidLevel
 */
constexpr auto N_BID_LEVELS = 4;

/** \brief Array containing all bid levels in increasing order
 *
 * \sa BidLevel
 */
constexpr std::array<BidLevel, N_BID_LEVELS> BID_LEVELS {
    BidLevel::NONE,
    BidLevel::ONE,
    BidLevel::TWO,
    BidLevel::THREE,
};

/** \brief Type of \ref BID_LEVEL_TO_STRING_MAP
 */
using BidLevelToStringMap = boost::bimaps::bimap<BidLevel, std::string>;

/** \brief Two-way map between BidLevel enumerations and their string
 * representation
 */
extern const BidLevelToStringMap BID_LEVEL_TO_STRING_MAP;

/** \brief Return the point value of a bid level
 *
 * \return 0 for BidLevel::NONE, and 1–3 for the actual bids
 */
constexpr int bidValue(const BidLevel level)
{
    return static_cast<int>(level);
}

/** \brief Return the bid level having given point value
 *
 * \param value the point value
 *
 * \return the bid level, or none if \p value is not between 0–3
 */
std::optional<BidLevel> bidLevelForValue(int value);

/** \brief Output a BidLevel to stream
 *
 * \param os the output stream
 * \param level the bid level to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, BidLevel level);

}

#endif // LANDLORD_BIDLEVEL_HH_
