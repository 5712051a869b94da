#include "reserve_handler.hpp"
#include "stockroom/errors.hpp"
#include "stockroom/helpers.hpp"
#include "stockroom/validation.hpp"

namespace inventory {
namespace handlers {

std::optional<StockReserved> handle_reserve(const ReserveStock& cmd, const StockState& state) {
    // Guard
    stockroom::validation::require_exists(
        state.exists(), "No inventory found for SKU " + cmd.sku() +
                        " at warehouse " + cmd.warehouse_id());

    if (state.is_reserved(cmd.reservation_id()) || state.is_committed(cmd.reservation_id())) {
        throw stockroom::CommandRejectedError(
            "Reservation " + cmd.reservation_id() + " already exists");
    }

    // Decide
    if (state.available < cmd.quantity()) {
        return std::nullopt;
    }

    StockReserved event;
    event.set_reservation_id(cmd.reservation_id());
    event.set_order_id(cmd.order_id());
    event.set_quantity(cmd.quantity());
    *event.mutable_reserved_at() = stockroom::helpers::now();
    return event;
}

} // namespace handlers
} // namespace inventory
