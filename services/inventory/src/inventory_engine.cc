#include "inventory_engine.hpp"
#include "command_validation.hpp"
#include "stockroom/helpers.hpp"
#include "stockroom/logging.hpp"
#include "stockroom/validation.hpp"
#include "../handlers/initialize_handler.hpp"
#include "../handlers/intake_handler.hpp"
#include "../handlers/reserve_handler.hpp"
#include "../handlers/commit_handler.hpp"
#include "../handlers/release_handler.hpp"

namespace inventory {

using stockroom::helpers::pack_event;

namespace {

constexpr const char* INSUFFICIENT_STOCK = "Insufficient stock";

contracts::ReservationConfirmed confirmed_outcome(const StockState& state,
                                                  const StockReserved& event) {
    contracts::ReservationConfirmed outcome;
    outcome.set_order_id(event.order_id());
    outcome.set_inventory_id(state.inventory_id);
    outcome.set_reservation_id(event.reservation_id());
    outcome.set_sku(state.sku);
    outcome.set_warehouse_id(state.warehouse_id);
    outcome.set_quantity(event.quantity());
    *outcome.mutable_reserved_at() = event.reserved_at();
    return outcome;
}

contracts::ReservationFailed failed_outcome(const StockState& state, const ReserveStock& cmd) {
    contracts::ReservationFailed outcome;
    outcome.set_order_id(cmd.order_id());
    outcome.set_inventory_id(state.inventory_id);
    outcome.set_reservation_id(cmd.reservation_id());
    outcome.set_sku(cmd.sku());
    outcome.set_warehouse_id(cmd.warehouse_id());
    outcome.set_requested_quantity(cmd.quantity());
    outcome.set_available_quantity(state.available);
    outcome.set_reason(INSUFFICIENT_STOCK);
    *outcome.mutable_failed_at() = stockroom::helpers::now();
    return outcome;
}

contracts::ReservationCommitted committed_outcome(const StockState& state,
                                                  const std::string& reservation_id,
                                                  int32_t quantity,
                                                  const google::protobuf::Timestamp& at) {
    contracts::ReservationCommitted outcome;
    outcome.set_order_id(state.owner_of(reservation_id));
    outcome.set_inventory_id(state.inventory_id);
    outcome.set_reservation_id(reservation_id);
    outcome.set_sku(state.sku);
    outcome.set_warehouse_id(state.warehouse_id);
    outcome.set_quantity(quantity);
    *outcome.mutable_committed_at() = at;
    return outcome;
}

contracts::ReservationReleased released_outcome(const StockState& state,
                                                const ReservationReleased& event) {
    contracts::ReservationReleased outcome;
    outcome.set_order_id(state.owner_of(event.reservation_id()));
    outcome.set_inventory_id(state.inventory_id);
    outcome.set_reservation_id(event.reservation_id());
    outcome.set_sku(state.sku);
    outcome.set_warehouse_id(state.warehouse_id);
    outcome.set_quantity(event.quantity());
    outcome.set_reason(event.reason());
    *outcome.mutable_released_at() = event.released_at();
    return outcome;
}

/// Integration requests name the order they act for; a hold owned by another
/// order is left alone. An empty order_id skips the check.
void require_owner(const StockState& state, const std::string& reservation_id,
                   const std::string& order_id) {
    if (order_id.empty()) return;
    const auto owner = state.owner_of(reservation_id);
    if (owner.empty() || owner == order_id) return;

    stockroom::log_warn(DOMAIN, "order_mismatch", {
        {"inventory_id", state.inventory_id},
        {"reservation_id", reservation_id},
        {"owner", owner},
        {"requested_by", order_id}});
    throw stockroom::CommandRejectedError("Reservation " + reservation_id +
                                          " belongs to order " + owner + ", not " + order_id);
}

} // anonymous namespace

InventoryEngine::InventoryEngine(stockroom::EventStore& store, const ReservationIndex& index,
                                 EngineConfig config)
    : store_(store), index_(index), config_(config) {
    if (config_.max_attempts < 1) {
        throw stockroom::ValidationError("max_attempts must be at least 1");
    }
}

template<typename Decide>
auto InventoryEngine::execute(const std::string& root, const std::string& operation,
                              Decide decide) {
    for (int attempt = 1;; ++attempt) {
        auto book = store_.load(root);
        auto version = stockroom::helpers::next_sequence(&book);
        auto state = StockState::from_event_book(&book);

        auto decision = decide(state, version);
        if (decision.pages.empty()) {
            return decision.result;
        }

        for (const auto& page : decision.pages) {
            state = StockState::apply(std::move(state), page.event());
        }

        try {
            auto new_version = store_.append(DOMAIN, root, version, decision.pages);
            stockroom::log_info(DOMAIN, operation, {
                {"inventory_id", root},
                {"version", new_version},
                {"available", state.available},
                {"reserved", state.reserved_quantity()},
                {"committed", state.committed_quantity()}});
            maybe_snapshot(root, state, version, new_version);
            return decision.result;
        } catch (const stockroom::ConcurrencyConflictError& e) {
            if (attempt >= config_.max_attempts) {
                stockroom::log_error(DOMAIN, "concurrency_retries_exhausted", {
                    {"inventory_id", root},
                    {"operation", operation},
                    {"attempts", attempt}});
                throw;
            }
            stockroom::log_warn(DOMAIN, "concurrency_retry", {
                {"inventory_id", root},
                {"operation", operation},
                {"attempt", attempt},
                {"expected_version", e.expected_version()},
                {"actual_version", e.actual_version()}});
        }
    }
}

void InventoryEngine::maybe_snapshot(const std::string& root, const StockState& state,
                                     uint32_t loaded_version, uint32_t new_version) {
    const auto interval = config_.snapshot_interval;
    if (interval == 0 || new_version / interval == loaded_version / interval) return;

    stockroom::Snapshot snapshot;
    snapshot.set_sequence(new_version);
    snapshot.mutable_state()->PackFrom(state.to_snapshot(), stockroom::helpers::TYPE_URL_PREFIX);
    store_.save_snapshot(root, snapshot);
}

std::string InventoryEngine::initialize(const InitializeInventory& cmd) {
    validate(cmd);
    const auto root = inventory_id(cmd.sku(), cmd.warehouse_id());

    return execute(root, "inventory_initialized", [&](const StockState& state, uint32_t) {
        auto event = handlers::handle_initialize(cmd, state);
        return Decision<std::string>{{pack_event(event)}, root};
    });
}

StockLevel InventoryEngine::receive_stock(const ReceiveStock& cmd) {
    validate(cmd);

    return execute(cmd.inventory_id(), "stock_received",
                   [&](const StockState& state, uint32_t version) {
        auto event = handlers::handle_receive(cmd, state);
        auto page = pack_event(event);
        auto next = StockState::apply(state, page.event());
        return Decision<StockLevel>{{page}, next.to_level(version + 1)};
    });
}

StockLevel InventoryEngine::restock(const RestockStock& cmd) {
    validate(cmd);

    return execute(cmd.inventory_id(), "stock_restocked",
                   [&](const StockState& state, uint32_t version) {
        auto event = handlers::handle_restock(cmd, state);
        auto page = pack_event(event);
        auto next = StockState::apply(state, page.event());
        return Decision<StockLevel>{{page}, next.to_level(version + 1)};
    });
}

contracts::ReservationOutcome InventoryEngine::reserve(const ReserveStock& cmd) {
    validate(cmd);
    const auto root = inventory_id(cmd.sku(), cmd.warehouse_id());

    return execute(root, "stock_reserved", [&](const StockState& state, uint32_t) {
        Decision<contracts::ReservationOutcome> decision;
        auto event = handlers::handle_reserve(cmd, state);
        if (!event) {
            stockroom::log_warn(DOMAIN, "reservation_declined", {
                {"order_id", cmd.order_id()},
                {"sku", cmd.sku()},
                {"warehouse_id", cmd.warehouse_id()},
                {"requested", cmd.quantity()},
                {"available", state.available}});
            *decision.result.mutable_failed() = failed_outcome(state, cmd);
            return decision;
        }
        decision.pages.push_back(pack_event(*event));
        *decision.result.mutable_confirmed() = confirmed_outcome(state, *event);
        return decision;
    });
}

contracts::ReservationCommitted InventoryEngine::commit(const CommitReservation& cmd) {
    validate(cmd);
    return commit_for_order(cmd, "");
}

contracts::ReservationCommitted InventoryEngine::commit_for_order(const CommitReservation& cmd,
                                                                  const std::string& order_id) {
    return execute(cmd.inventory_id(), "reservation_committed",
                   [&](const StockState& state, uint32_t) {
        Decision<contracts::ReservationCommitted> decision;
        require_owner(state, cmd.reservation_id(), order_id);
        auto event = handlers::handle_commit(cmd, state);
        if (!event) {
            stockroom::log_info(DOMAIN, "commit_already_applied", {
                {"inventory_id", cmd.inventory_id()},
                {"reservation_id", cmd.reservation_id()}});
            decision.result = committed_outcome(state, cmd.reservation_id(),
                                                state.committed.at(cmd.reservation_id()),
                                                stockroom::helpers::now());
            return decision;
        }
        decision.pages.push_back(pack_event(*event));
        decision.result = committed_outcome(state, cmd.reservation_id(), event->quantity(),
                                            event->committed_at());
        return decision;
    });
}

contracts::ReservationCommitted InventoryEngine::commit(
    const contracts::ReservationCommitRequested& request) {
    validate(request);

    auto root = index_.find(request.reservation_id());
    if (!root) {
        throw stockroom::NotFoundError("No inventory found with reservation " +
                                       request.reservation_id());
    }

    CommitReservation cmd;
    cmd.set_inventory_id(*root);
    cmd.set_reservation_id(request.reservation_id());
    return commit_for_order(cmd, request.order_id());
}

std::optional<contracts::ReservationReleased> InventoryEngine::release(
    const ReleaseReservation& cmd) {
    validate(cmd);
    return release_for_order(cmd, "");
}

std::optional<contracts::ReservationReleased> InventoryEngine::release_for_order(
    const ReleaseReservation& cmd, const std::string& order_id) {
    auto root = index_.find(cmd.reservation_id());
    if (!root) {
        stockroom::log_info(DOMAIN, "release_noop", {
            {"reservation_id", cmd.reservation_id()},
            {"cause", "unknown reservation"}});
        return std::nullopt;
    }

    using Result = std::optional<contracts::ReservationReleased>;
    return execute(*root, "reservation_released", [&](const StockState& state, uint32_t) {
        Decision<Result> decision;
        require_owner(state, cmd.reservation_id(), order_id);
        auto event = handlers::handle_release(cmd, state);
        if (!event) {
            stockroom::log_info(DOMAIN, "release_noop", {
                {"inventory_id", *root},
                {"reservation_id", cmd.reservation_id()},
                {"cause", state.is_committed(cmd.reservation_id())
                              ? "already committed" : "already released"}});
            return decision;
        }
        decision.pages.push_back(pack_event(*event));
        decision.result = released_outcome(state, *event);
        return decision;
    });
}

std::optional<contracts::ReservationReleased> InventoryEngine::release(
    const contracts::ReservationReleaseRequested& request) {
    validate(request);

    ReleaseReservation cmd;
    cmd.set_reservation_id(request.reservation_id());
    cmd.set_reason(request.reason());
    return release_for_order(cmd, request.order_id());
}

StockState InventoryEngine::load(const std::string& inventory_id) const {
    auto book = store_.load(inventory_id);
    return StockState::from_event_book(&book);
}

} // namespace inventory
