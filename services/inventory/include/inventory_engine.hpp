#pragma once

#include <optional>
#include <string>
#include <vector>
#include "stock_state.hpp"
#include "reservation_index.hpp"
#include "stockroom/event_store.hpp"
#include "inventory/inventory.pb.h"
#include "contracts/inventory.pb.h"
#include "contracts/orders.pb.h"

namespace inventory {

struct EngineConfig {
    /// Load/decide/append attempts before a concurrency conflict surfaces.
    int max_attempts = 5;
    /// Write a snapshot every N events; 0 disables snapshots.
    uint32_t snapshot_interval = 50;
};

/**
 * Command side of the inventory reservation engine.
 *
 * Every command rebuilds the target aggregate from the event store, decides,
 * and appends conditioned on the version it loaded. A lost race reloads and
 * decides again, up to EngineConfig::max_attempts.
 *
 * The reservation index must be subscribed to the same store; it resolves
 * release and commit requests that carry only a reservation id.
 */
class InventoryEngine {
public:
    InventoryEngine(stockroom::EventStore& store, const ReservationIndex& index,
                    EngineConfig config = {});

    /// Declare a SKU at a warehouse. Returns the new inventory id.
    std::string initialize(const InitializeInventory& cmd);

    StockLevel receive_stock(const ReceiveStock& cmd);
    StockLevel restock(const RestockStock& cmd);

    /// Soft-reserve stock for one SKU. Insufficient stock is reported as a
    /// failed outcome and leaves the aggregate untouched.
    contracts::ReservationOutcome reserve(const ReserveStock& cmd);

    /// Convert a soft hold into a hard allocation. Committing an already
    /// committed reservation reports the existing allocation again.
    contracts::ReservationCommitted commit(const CommitReservation& cmd);
    /// Requests must name the order that owns the reservation, otherwise
    /// stockroom::CommandRejectedError.
    contracts::ReservationCommitted commit(const contracts::ReservationCommitRequested& request);

    /// Return a soft hold to the available pool. Returns std::nullopt when
    /// there was nothing to release; that is a success, not an error.
    std::optional<contracts::ReservationReleased> release(const ReleaseReservation& cmd);
    std::optional<contracts::ReservationReleased> release(
        const contracts::ReservationReleaseRequested& request);

    /// Authoritative state, rebuilt from the store.
    StockState load(const std::string& inventory_id) const;

    const EngineConfig& config() const { return config_; }

private:
    template<typename Result>
    struct Decision {
        std::vector<stockroom::EventPage> pages;
        Result result;
    };

    template<typename Decide>
    auto execute(const std::string& root, const std::string& operation, Decide decide);

    contracts::ReservationCommitted commit_for_order(const CommitReservation& cmd,
                                                     const std::string& order_id);
    std::optional<contracts::ReservationReleased> release_for_order(
        const ReleaseReservation& cmd, const std::string& order_id);

    void maybe_snapshot(const std::string& root, const StockState& state,
                        uint32_t loaded_version, uint32_t new_version);

    stockroom::EventStore& store_;
    const ReservationIndex& index_;
    EngineConfig config_;
};

} // namespace inventory
