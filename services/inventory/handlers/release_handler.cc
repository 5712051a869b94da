#include "release_handler.hpp"
#include "stockroom/helpers.hpp"

namespace inventory {
namespace handlers {

std::optional<ReservationReleased> handle_release(const ReleaseReservation& cmd,
                                                  const StockState& state) {
    auto it = state.reservations.find(cmd.reservation_id());
    if (it == state.reservations.end()) {
        return std::nullopt;
    }

    ReservationReleased event;
    event.set_reservation_id(cmd.reservation_id());
    event.set_quantity(it->second);
    event.set_reason(cmd.reason());
    *event.mutable_released_at() = stockroom::helpers::now();
    return event;
}

} // namespace handlers
} // namespace inventory
