/** \file
 *
 * \brief Definition of Landlord::Seat enum and related utilities
 */

#ifndef LANDLORD_SEAT_HH_
#define LANDLORD_SEAT_HH_

#include "landlord/LandlordConstants.hh"

#include <boost/bimap/bimap.hpp>
#include <boost/operators.hpp>

#include <algorithm>
#include <array>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace Landlord {

/** \brief Seat at the table
 *
 * The three seats of a match are labeled A, B and C. The order of the seats
 * (0, 1 and 2, respectively) is also the order in which the right to bid
 * first rotates.
 */
enum class Seat {
    A,
    B,
    C
};

/** \brief Array containing all seats
 *
 * \sa Seat
 */
constexpr std::array<Seat, N_SEATS> SEATS {
    Seat::A,
    Seat::B,
    Seat::C,
};

/** \brief Type of \ref SEAT_TO_STRING_MAP
 */
using SeatToStringMap = boost::bimaps::bimap<Seat, std::string>;

/** \brief Two-way map between Seat enumerations and their string
 * representation
 */
extern const SeatToStringMap SEAT_TO_STRING_MAP;

/** \brief Return order of the seat
 *
 * \return order of \p seat (between 0–2)
 *
 * \throw std::invalid_argument if \p seat is not valid
 */
constexpr int seatOrder(const Seat seat)
{
    const auto n = static_cast<int>(seat);
    if (n < 0 || n >= N_SEATS) {
        throw std::invalid_argument {"Invalid seat"};
    }
    return n;
}

/** \brief Return the seat having given order
 *
 * \param order the order of the seat (between 0–2)
 *
 * \return the seat whose seatOrder() is \p order
 *
 * \throw std::invalid_argument if \p order is not a valid seat order
 */
Seat seatForOrder(int order);

/** \brief Determine seat following the given seat in bidding order
 *
 * Examples:
 *
 * \code{.cc}
 * nextSeat(Seat::A) == Seat::B
 * nextSeat(Seat::C) == Seat::A
 * nextSeat(Seat::A, 2) == Seat::C
 * nextSeat(Seat::A, -1) == Seat::C
 * \endcode
 *
 * \param seat the seat from which counting starts
 * \param steps the number of steps skipped
 *
 * \return the rotated seat
 *
 * \throw std::invalid_argument if \p seat is invalid
 */
Seat nextSeat(Seat seat, int steps = 1);

/** \brief Return the 1-based table position of a seat
 *
 * Persisted round records identify the landlord by its table position (1 for
 * A, 2 for B and 3 for C).
 *
 * \throw std::invalid_argument if \p seat is invalid
 */
int tablePosition(Seat seat);

/** \brief Return the seat at 1-based table position
 *
 * \return the seat at table position \p position, or none if the position is
 * not between 1–3
 */
std::optional<Seat> seatForTablePosition(int position);

/** \brief Values of some type for each seat
 *
 * SeatMap is a fixed size container holding one value for each seat, indexed
 * by Seat. It is used for the bids, doubling flags, player identities and
 * scores of a round.
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
template<typename T>
class SeatMap : private boost::equality_comparable<SeatMap<T>> {
public:

    /** \brief Create seat map with value initialized elements
     */
    constexpr SeatMap() : values {} {}

    /** \brief Create seat map from values
     *
     * \param a value for Seat::A
     * \param b value for Seat::B
     * \param c value for Seat::C
     */
    constexpr SeatMap(T a, T b, T c) :
        values {std::move(a), std::move(b), std::move(c)}
    {
    }

    /** \brief Access the value of a seat
     *
     * \throw std::invalid_argument if \p seat is invalid
     */
    constexpr T& operator[](Seat seat)
    {
        return values[seatOrder(seat)];
    }

    /** \brief Access the value of a seat
     *
     * \throw std::invalid_argument if \p seat is invalid
     */
    constexpr const T& operator[](Seat seat) const
    {
        return values[seatOrder(seat)];
    }

    /** \brief Iterator to the value of the first seat
     *
     * The values are iterated in seat order.
     */
    constexpr auto begin() const { return values.begin(); }

    /** \brief Iterator past the value of the last seat
     */
    constexpr auto end() const { return values.end(); }

    /** \brief Mutable iterator to the value of the first seat
     */
    constexpr auto begin() { return values.begin(); }

    /** \brief Mutable iterator past the value of the last seat
     */
    constexpr auto end() { return values.end(); }

private:

    std::array<T, N_SEATS> values;
};

/** \brief Equality operator for seat maps
 *
 * \sa SeatMap
 */
template<typename T>
bool operator==(const SeatMap<T>& lhs, const SeatMap<T>& rhs)
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/** \brief Output a Seat to stream
 *
 * \param os the output stream
 * \param seat the seat to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Seat seat);

/** \brief Output a SeatMap to stream
 *
 * The values are output as “A: a, B: b, C: c”.
 *
 * \param os the output stream
 * \param seatMap the seat map to output
 *
 * \return parameter \p os
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const SeatMap<T>& seatMap)
{
    auto separator = "";
    for (const auto seat : SEATS) {
        os << separator << seat << ": " << seatMap[seat];
        separator = ", ";
    }
    return os;
}

}

#endif // LANDLORD_SEAT_HH_
