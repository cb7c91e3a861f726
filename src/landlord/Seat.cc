#include "landlord/Seat.hh"

#include <initializer_list>
#include <ostream>

namespace Landlord {

namespace {

const auto SEAT_STRING_PAIRS = {
    SeatToStringMap::value_type {Seat::A, "A"},
    SeatToStringMap::value_type {Seat::B, "B"},
    SeatToStringMap::value_type {Seat::C, "C"},
};

}

const SeatToStringMap SEAT_TO_STRING_MAP(
    SEAT_STRING_PAIRS.begin(), SEAT_STRING_PAIRS.end());

Seat seatForOrder(const int order)
{
    if (order < 0 || order >= N_SEATS) {
        throw std::invalid_argument {"Invalid seat order"};
    }
    return SEATS[order];
}

Seat nextSeat(const Seat seat, int steps)
{
    steps %= N_SEATS;
    if (steps < 0) {
        steps += N_SEATS;
    }
    return seatForOrder((seatOrder(seat) + steps) % N_SEATS);
}

int tablePosition(const Seat seat)
{
    return seatOrder(seat) + 1;
}

std::optional<Seat> seatForTablePosition(const int position)
{
    if (position < 1 || position > N_SEATS) {
        return std::nullopt;
    }
    return SEATS[position - 1];
}

std::ostream& operator<<(std::ostream& os, const Seat seat)
{
    return os << SEAT_TO_STRING_MAP.left.at(seat);
}

}
