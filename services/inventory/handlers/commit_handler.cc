#include "commit_handler.hpp"
#include "stockroom/errors.hpp"
#include "stockroom/helpers.hpp"
#include "stockroom/validation.hpp"

namespace inventory {
namespace handlers {

std::optional<ReservationCommitted> handle_commit(const CommitReservation& cmd,
                                                  const StockState& state) {
    // Guard
    stockroom::validation::require_exists(
        state.exists(), "Inventory " + cmd.inventory_id() + " not found");

    if (state.is_committed(cmd.reservation_id())) {
        return std::nullopt;
    }

    auto it = state.reservations.find(cmd.reservation_id());
    if (it == state.reservations.end()) {
        throw stockroom::NotFoundError("Reservation " + cmd.reservation_id() +
                                       " not found in inventory " + cmd.inventory_id());
    }

    ReservationCommitted event;
    event.set_reservation_id(cmd.reservation_id());
    event.set_quantity(it->second);
    *event.mutable_committed_at() = stockroom::helpers::now();
    return event;
}

} // namespace handlers
} // namespace inventory
