#pragma once

#include "stock_state.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {
namespace handlers {

/// Handle ReceiveStock command (new supply).
/// @throws stockroom::CommandRejectedError if total on hand would exceed INT32_MAX
StockReceived handle_receive(const ReceiveStock& cmd, const StockState& state);

/// Handle RestockStock command (inspected customer returns).
/// @throws stockroom::CommandRejectedError if total on hand would exceed INT32_MAX
StockRestocked handle_restock(const RestockStock& cmd, const StockState& state);

} // namespace handlers
} // namespace inventory
