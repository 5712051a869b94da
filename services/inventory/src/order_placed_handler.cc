#include "order_placed_handler.hpp"
#include "command_validation.hpp"
#include "stockroom/errors.hpp"
#include "stockroom/helpers.hpp"
#include "stockroom/logging.hpp"
#include <limits>
#include <unordered_map>

namespace inventory {

WarehouseResolver single_warehouse(const std::string& warehouse_id) {
    return [warehouse_id](const std::string&) { return warehouse_id; };
}

OrderPlacedHandler::OrderPlacedHandler(InventoryEngine& engine, WarehouseResolver resolver)
    : engine_(engine), resolver_(std::move(resolver)) {}

std::vector<contracts::OrderLineItem> OrderPlacedHandler::group_line_items(
    const contracts::OrderPlaced& event) {
    std::vector<contracts::OrderLineItem> grouped;
    std::vector<int64_t> totals;
    std::unordered_map<std::string, size_t> position;

    for (const auto& item : event.line_items()) {
        auto [it, inserted] = position.emplace(item.sku(), grouped.size());
        if (inserted) {
            grouped.push_back(item);
            totals.push_back(0);
        }
        totals[it->second] += item.quantity();
    }

    for (size_t i = 0; i < grouped.size(); ++i) {
        if (totals[i] > std::numeric_limits<int32_t>::max()) {
            throw stockroom::ValidationError("Total quantity for SKU " + grouped[i].sku() +
                                             " exceeds the supported range");
        }
        grouped[i].set_quantity(static_cast<int32_t>(totals[i]));
    }
    return grouped;
}

contracts::ReservationOutcomes OrderPlacedHandler::handle(const contracts::OrderPlaced& event) {
    validate(event);
    auto items = group_line_items(event);

    stockroom::log_info(DOMAIN, "order_placed_received", {
        {"order_id", event.order_id()},
        {"line_items", event.line_items_size()},
        {"distinct_skus", items.size()}});

    contracts::ReservationOutcomes outcomes;
    outcomes.set_order_id(event.order_id());

    for (const auto& item : items) {
        ReserveStock cmd;
        cmd.set_order_id(event.order_id());
        cmd.set_sku(item.sku());
        cmd.set_warehouse_id(resolver_(item.sku()));
        cmd.set_reservation_id(stockroom::helpers::new_uuid());
        cmd.set_quantity(item.quantity());

        try {
            *outcomes.add_outcomes() = engine_.reserve(cmd);
        } catch (const stockroom::Error& e) {
            // Confirmed outcomes must still reach the caller.
            auto* failed = outcomes.add_outcomes()->mutable_failed();
            failed->set_order_id(cmd.order_id());
            failed->set_inventory_id(inventory_id(cmd.sku(), cmd.warehouse_id()));
            failed->set_reservation_id(cmd.reservation_id());
            failed->set_sku(cmd.sku());
            failed->set_warehouse_id(cmd.warehouse_id());
            failed->set_requested_quantity(cmd.quantity());
            failed->set_available_quantity(0);
            failed->set_reason(e.what());
            *failed->mutable_failed_at() = stockroom::helpers::now();
            stockroom::log_warn(DOMAIN, "reservation_declined", {
                {"order_id", cmd.order_id()},
                {"sku", cmd.sku()},
                {"warehouse_id", cmd.warehouse_id()},
                {"code", static_cast<int>(e.status_code())},
                {"reason", e.what()}});
        }
    }
    return outcomes;
}

std::vector<contracts::ReservationReleased> OrderPlacedHandler::compensate(
    const contracts::ReservationOutcomes& outcomes, const std::string& reason) {
    std::vector<contracts::ReservationReleased> released;
    for (const auto& outcome : outcomes.outcomes()) {
        if (!outcome.has_confirmed()) continue;

        ReleaseReservation cmd;
        cmd.set_reservation_id(outcome.confirmed().reservation_id());
        cmd.set_reason(reason);
        if (auto event = engine_.release(cmd)) {
            released.push_back(std::move(*event));
        }
    }

    stockroom::log_info(DOMAIN, "order_compensated", {
        {"order_id", outcomes.order_id()},
        {"released", released.size()}});
    return released;
}

} // namespace inventory
