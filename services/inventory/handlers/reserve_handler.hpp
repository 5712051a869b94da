#pragma once

#include <optional>
#include "stock_state.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {
namespace handlers {

/// Handle ReserveStock command.
///
/// Returns std::nullopt when the warehouse cannot cover the quantity; the
/// state is then left untouched and the caller reports a declined outcome.
std::optional<StockReserved> handle_reserve(const ReserveStock& cmd, const StockState& state);

} // namespace handlers
} // namespace inventory
