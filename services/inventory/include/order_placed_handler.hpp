#pragma once

#include <functional>
#include <string>
#include <vector>
#include "inventory_engine.hpp"
#include "contracts/inventory.pb.h"
#include "contracts/orders.pb.h"

namespace inventory {

/// Picks the warehouse a SKU is reserved from.
using WarehouseResolver = std::function<std::string(const std::string& sku)>;

/// Resolver that sends every SKU to one warehouse.
WarehouseResolver single_warehouse(const std::string& warehouse_id);

/**
 * Reacts to OrderPlaced by reserving stock for each distinct SKU.
 *
 * Line items naming the same SKU are summed into one reservation. Each SKU is
 * reserved independently; a declined SKU does not roll back the others, and
 * an error for one SKU is reported as its failed outcome.
 * Callers that need all-or-nothing behaviour pass the outcomes to
 * compensate().
 */
class OrderPlacedHandler {
public:
    OrderPlacedHandler(InventoryEngine& engine, WarehouseResolver resolver);

    /// Sum quantities per SKU, keeping the order in which SKUs first appear.
    static std::vector<contracts::OrderLineItem> group_line_items(
        const contracts::OrderPlaced& event);

    contracts::ReservationOutcomes handle(const contracts::OrderPlaced& event);

    /// Release every confirmed reservation in outcomes. Safe to repeat.
    std::vector<contracts::ReservationReleased> compensate(
        const contracts::ReservationOutcomes& outcomes, const std::string& reason);

private:
    InventoryEngine& engine_;
    WarehouseResolver resolver_;
};

} // namespace inventory
