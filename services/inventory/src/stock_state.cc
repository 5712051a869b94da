#include "stock_state.hpp"
#include "stockroom/router.hpp"

namespace inventory {

namespace {

int32_t sum_quantities(const std::map<std::string, int32_t>& holds) {
    int32_t total = 0;
    for (const auto& [_, quantity] : holds) {
        total += quantity;
    }
    return total;
}

const stockroom::StateRouter<StockState>& state_router() {
    static const stockroom::StateRouter<StockState> router =
        stockroom::StateRouter<StockState>([] { return StockState{}; })
            .with_snapshot([](const google::protobuf::Any& any) {
                StockSnapshot snapshot;
                any.UnpackTo(&snapshot);
                return StockState::from_snapshot(snapshot);
            })
            .on<InventoryInitialized>([](StockState& state, const InventoryInitialized& e) {
                if (!state.exists()) state = StockState::create(e);
            })
            .on<StockReceived>([](StockState& state, const StockReceived& e) {
                state.available += e.quantity();
            })
            .on<StockRestocked>([](StockState& state, const StockRestocked& e) {
                state.available += e.quantity();
            })
            .on<StockReserved>([](StockState& state, const StockReserved& e) {
                const auto& id = e.reservation_id();
                if (state.is_reserved(id) || state.is_committed(id)) return;
                state.available -= e.quantity();
                state.reservations[id] = e.quantity();
                state.reservation_owner[id] = e.order_id();
            })
            .on<ReservationCommitted>([](StockState& state, const ReservationCommitted& e) {
                auto it = state.reservations.find(e.reservation_id());
                if (it == state.reservations.end()) return;
                state.committed[it->first] = it->second;
                state.reservations.erase(it);
            })
            .on<ReservationReleased>([](StockState& state, const ReservationReleased& e) {
                auto it = state.reservations.find(e.reservation_id());
                if (it == state.reservations.end()) return;
                state.available += it->second;
                state.reservations.erase(it);
            });
    return router;
}

} // anonymous namespace

std::string inventory_id(const std::string& sku, const std::string& warehouse_id) {
    return std::to_string(sku.size()) + ":" + sku + ":" + warehouse_id;
}

int32_t StockState::reserved_quantity() const {
    return sum_quantities(reservations);
}

int32_t StockState::committed_quantity() const {
    return sum_quantities(committed);
}

std::string StockState::owner_of(const std::string& reservation_id) const {
    auto it = reservation_owner.find(reservation_id);
    return it == reservation_owner.end() ? "" : it->second;
}

StockState StockState::create(const InventoryInitialized& event) {
    StockState state;
    state.inventory_id = inventory::inventory_id(event.sku(), event.warehouse_id());
    state.sku = event.sku();
    state.warehouse_id = event.warehouse_id();
    state.available = event.initial_quantity();
    state.initialized_at = event.initialized_at();
    return state;
}

StockState StockState::apply(StockState state, const google::protobuf::Any& event_any) {
    state_router().apply_event(state, event_any);
    return state;
}

StockState StockState::from_event_book(const stockroom::EventBook* event_book) {
    return state_router().with_event_book(event_book);
}

StockState StockState::from_snapshot(const StockSnapshot& snapshot) {
    StockState state;
    state.inventory_id = snapshot.inventory_id();
    state.sku = snapshot.sku();
    state.warehouse_id = snapshot.warehouse_id();
    state.available = snapshot.available();
    for (const auto& [id, quantity] : snapshot.reservations()) {
        state.reservations[id] = quantity;
    }
    for (const auto& [id, quantity] : snapshot.committed()) {
        state.committed[id] = quantity;
    }
    for (const auto& [id, order_id] : snapshot.reservation_owner()) {
        state.reservation_owner[id] = order_id;
    }
    state.initialized_at = snapshot.initialized_at();
    return state;
}

StockSnapshot StockState::to_snapshot() const {
    StockSnapshot snapshot;
    snapshot.set_inventory_id(inventory_id);
    snapshot.set_sku(sku);
    snapshot.set_warehouse_id(warehouse_id);
    snapshot.set_available(available);
    snapshot.mutable_reservations()->insert(reservations.begin(), reservations.end());
    snapshot.mutable_committed()->insert(committed.begin(), committed.end());
    snapshot.mutable_reservation_owner()->insert(reservation_owner.begin(), reservation_owner.end());
    *snapshot.mutable_initialized_at() = initialized_at;
    return snapshot;
}

StockLevel StockState::to_level(uint32_t version) const {
    StockLevel level;
    level.set_inventory_id(inventory_id);
    level.set_sku(sku);
    level.set_warehouse_id(warehouse_id);
    level.set_available(available);
    level.set_reserved(reserved_quantity());
    level.set_committed(committed_quantity());
    level.set_total_on_hand(total_on_hand());
    level.set_version(version);
    return level;
}

bool operator==(const StockState& lhs, const StockState& rhs) {
    return lhs.inventory_id == rhs.inventory_id &&
           lhs.sku == rhs.sku &&
           lhs.warehouse_id == rhs.warehouse_id &&
           lhs.available == rhs.available &&
           lhs.reservations == rhs.reservations &&
           lhs.committed == rhs.committed &&
           lhs.reservation_owner == rhs.reservation_owner &&
           lhs.initialized_at.seconds() == rhs.initialized_at.seconds() &&
           lhs.initialized_at.nanos() == rhs.initialized_at.nanos();
}

} // namespace inventory
