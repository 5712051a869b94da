#pragma once

#include <optional>
#include "stock_state.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {
namespace handlers {

/// Handle ReleaseReservation command.
///
/// Returns std::nullopt when there is no soft hold to release (already
/// released, already committed, or never reserved here).
std::optional<ReservationReleased> handle_release(const ReleaseReservation& cmd,
                                                  const StockState& state);

} // namespace handlers
} // namespace inventory
