#pragma once

#include "inventory/inventory.pb.h"
#include "contracts/orders.pb.h"

namespace inventory {

// Field limits for incoming commands.
constexpr size_t MAX_SKU_LENGTH = 50;
constexpr size_t MAX_WAREHOUSE_LENGTH = 50;
constexpr size_t MAX_SOURCE_LENGTH = 100;
constexpr size_t MAX_REASON_LENGTH = 256;

/// Structural checks run before any storage access. Each throws
/// stockroom::ValidationError on the first violation.
void validate(const InitializeInventory& cmd);
void validate(const ReceiveStock& cmd);
void validate(const RestockStock& cmd);
void validate(const ReserveStock& cmd);
void validate(const CommitReservation& cmd);
void validate(const ReleaseReservation& cmd);
void validate(const contracts::OrderPlaced& event);
void validate(const contracts::ReservationCommitRequested& event);
void validate(const contracts::ReservationReleaseRequested& event);

} // namespace inventory
