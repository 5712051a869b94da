#include "command_validation.hpp"
#include "stockroom/validation.hpp"

namespace inventory {

using namespace stockroom::validation;

void validate(const InitializeInventory& cmd) {
    require_bounded(cmd.sku(), MAX_SKU_LENGTH, "sku");
    require_bounded(cmd.warehouse_id(), MAX_WAREHOUSE_LENGTH, "warehouse_id");
    require_non_negative(cmd.initial_quantity(), "initial_quantity");
}

void validate(const ReceiveStock& cmd) {
    require_not_empty(cmd.inventory_id(), "inventory_id");
    require_positive(cmd.quantity(), "quantity");
    require_bounded(cmd.source(), MAX_SOURCE_LENGTH, "source");
}

void validate(const RestockStock& cmd) {
    require_not_empty(cmd.inventory_id(), "inventory_id");
    require_not_empty(cmd.return_id(), "return_id");
    require_positive(cmd.quantity(), "quantity");
    require_bounded(cmd.reason(), MAX_REASON_LENGTH, "reason");
}

void validate(const ReserveStock& cmd) {
    require_not_empty(cmd.order_id(), "order_id");
    require_bounded(cmd.sku(), MAX_SKU_LENGTH, "sku");
    require_bounded(cmd.warehouse_id(), MAX_WAREHOUSE_LENGTH, "warehouse_id");
    require_not_empty(cmd.reservation_id(), "reservation_id");
    require_positive(cmd.quantity(), "quantity");
}

void validate(const CommitReservation& cmd) {
    require_not_empty(cmd.inventory_id(), "inventory_id");
    require_not_empty(cmd.reservation_id(), "reservation_id");
}

void validate(const ReleaseReservation& cmd) {
    require_not_empty(cmd.reservation_id(), "reservation_id");
    require_bounded(cmd.reason(), MAX_REASON_LENGTH, "reason");
}

void validate(const contracts::OrderPlaced& event) {
    require_not_empty(event.order_id(), "order_id");
    if (event.line_items().empty()) {
        throw stockroom::ValidationError("line_items must not be empty");
    }
    for (const auto& item : event.line_items()) {
        require_bounded(item.sku(), MAX_SKU_LENGTH, "line_items.sku");
        require_positive(item.quantity(), "line_items.quantity");
    }
}

void validate(const contracts::ReservationCommitRequested& event) {
    require_not_empty(event.order_id(), "order_id");
    require_not_empty(event.reservation_id(), "reservation_id");
}

void validate(const contracts::ReservationReleaseRequested& event) {
    require_not_empty(event.order_id(), "order_id");
    require_not_empty(event.reservation_id(), "reservation_id");
    require_bounded(event.reason(), MAX_REASON_LENGTH, "reason");
}

} // namespace inventory
