#include "initialize_handler.hpp"
#include "stockroom/helpers.hpp"
#include "stockroom/validation.hpp"

namespace inventory {
namespace handlers {

InventoryInitialized handle_initialize(const InitializeInventory& cmd, const StockState& state) {
    // Guard
    stockroom::validation::require_not_exists(
        state.exists(), "Inventory already exists for SKU " + cmd.sku() +
                        " at warehouse " + cmd.warehouse_id());

    InventoryInitialized event;
    event.set_sku(cmd.sku());
    event.set_warehouse_id(cmd.warehouse_id());
    event.set_initial_quantity(cmd.initial_quantity());
    *event.mutable_initialized_at() = stockroom::helpers::now();
    return event;
}

} // namespace handlers
} // namespace inventory
