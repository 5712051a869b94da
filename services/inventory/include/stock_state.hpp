#pragma once

#include <map>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "stockroom/types.pb.h"
#include "inventory/inventory.pb.h"

namespace inventory {

constexpr const char* DOMAIN = "inventory";

/// Deterministic aggregate id for a (sku, warehouse) pair.
///
/// The sku length prefix keeps the key unambiguous when either part contains
/// the separator.
std::string inventory_id(const std::string& sku, const std::string& warehouse_id);

/// Stock for one SKU at one warehouse.
struct StockState {
    std::string inventory_id;
    std::string sku;
    std::string warehouse_id;
    int32_t available = 0;
    std::map<std::string, int32_t> reservations;
    std::map<std::string, int32_t> committed;
    std::map<std::string, std::string> reservation_owner;
    google::protobuf::Timestamp initialized_at;

    bool exists() const { return !inventory_id.empty(); }
    bool is_reserved(const std::string& reservation_id) const {
        return reservations.count(reservation_id) > 0;
    }
    bool is_committed(const std::string& reservation_id) const {
        return committed.count(reservation_id) > 0;
    }

    int32_t reserved_quantity() const;
    int32_t committed_quantity() const;
    int32_t total_on_hand() const { return available + reserved_quantity() + committed_quantity(); }

    /// Order that owns a reservation, or an empty string.
    std::string owner_of(const std::string& reservation_id) const;

    /// Build the initial state from an InventoryInitialized event.
    static StockState create(const InventoryInitialized& event);

    /// Apply a single event, returning the next state. Events that do not fit
    /// the current state (unknown reservation, duplicate initialization) are
    /// ignored.
    static StockState apply(StockState state, const google::protobuf::Any& event_any);

    /// Build state from an EventBook, starting from its snapshot if present.
    static StockState from_event_book(const stockroom::EventBook* event_book);

    static StockState from_snapshot(const StockSnapshot& snapshot);
    StockSnapshot to_snapshot() const;
    StockLevel to_level(uint32_t version) const;
};

bool operator==(const StockState& lhs, const StockState& rhs);
inline bool operator!=(const StockState& lhs, const StockState& rhs) { return !(lhs == rhs); }

} // namespace inventory
