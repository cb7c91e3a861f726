/** \file
 *
 * \brief Definition of Landlord::Player struct
 */

#ifndef LANDLORD_PLAYER_HH_
#define LANDLORD_PLAYER_HH_

#include "landlord/Seat.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace Landlord {

/** \brief Identifier of a player
 *
 * Round records and match summaries identify the players sitting at each
 * seat by their identifiers.
 */
using PlayerId = std::string;

/** \brief A registered player
 *
 * \note Boost operators library is used to ensure that operator!= is
 * generated with usual semantics when operator== is supplied.
 */
struct Player : private boost::equality_comparable<Player> {
    PlayerId id;       ///< \brief The identifier of the player
    std::string name;  ///< \brief The display name of the player

    Player() = default;

    /** \brief Create new player
     *
     * \param id see \ref id
     * \param name see \ref name
     */
    Player(PlayerId id, std::string name);
};

/** \brief Determine the seat of a player
 *
 * \param playerIds the identifiers of the players at each seat
 * \param playerId the player whose seat is looked up
 *
 * \return the first seat occupied by \p playerId, or none if the player is
 * not seated
 */
std::optional<Seat> seatOf(
    const SeatMap<PlayerId>& playerIds, const PlayerId& playerId);

/** \brief Equality operator for players
 *
 * \sa Player
 */
bool operator==(const Player&, const Player&);

/** \brief Output a Player to stream
 *
 * \param os the output stream
 * \param player the player to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Player& player);

}

#endif // LANDLORD_PLAYER_HH_
