#pragma once

#include <optional>
#include "stock_state.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {
namespace handlers {

/// Handle CommitReservation command.
///
/// Returns std::nullopt when the reservation is already committed.
/// @throws stockroom::NotFoundError if the inventory or the soft hold is missing
std::optional<ReservationCommitted> handle_commit(const CommitReservation& cmd,
                                                  const StockState& state);

} // namespace handlers
} // namespace inventory
