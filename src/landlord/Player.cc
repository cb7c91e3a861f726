#include "landlord/Player.hh"

#include <ostream>
#include <utility>

namespace Landlord {

Player::Player(PlayerId id, std::string name) :
    id {std::move(id)},
    name {std::move(name)}
{
}

std::optional<Seat> seatOf(
    const SeatMap<PlayerId>& playerIds, const PlayerId& playerId)
{
    for (const auto seat : SEATS) {
        if (playerIds[seat] == playerId) {
            return seat;
        }
    }
    return std::nullopt;
}

bool operator==(const Player& lhs, const Player& rhs)
{
    return lhs.id == rhs.id && lhs.name == rhs.name;
}

std::ostream& operator<<(std::ostream& os, const Player& player)
{
    return os << player.name << " (" << player.id << ")";
}

}
