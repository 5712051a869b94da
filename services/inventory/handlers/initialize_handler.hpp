#pragma once

#include "stock_state.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {
namespace handlers {

/// Handle InitializeInventory command.
InventoryInitialized handle_initialize(const InitializeInventory& cmd, const StockState& state);

} // namespace handlers
} // namespace inventory
