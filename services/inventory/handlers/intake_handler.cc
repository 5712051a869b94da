#include "intake_handler.hpp"
#include "stockroom/helpers.hpp"
#include "stockroom/validation.hpp"
#include <cstdint>
#include <limits>

namespace inventory {
namespace handlers {

namespace {

// Stock counts are int32; intake may not push the total on hand past that.
void require_capacity(const StockState& state, int32_t quantity) {
    const int64_t total = static_cast<int64_t>(state.total_on_hand()) + quantity;
    if (total > std::numeric_limits<int32_t>::max()) {
        throw stockroom::CommandRejectedError(
            "Intake of " + std::to_string(quantity) + " would exceed the stock limit for " +
            state.inventory_id);
    }
}

} // anonymous namespace

StockReceived handle_receive(const ReceiveStock& cmd, const StockState& state) {
    stockroom::validation::require_exists(
        state.exists(), "Inventory " + cmd.inventory_id() + " not found");
    require_capacity(state, cmd.quantity());

    StockReceived event;
    event.set_quantity(cmd.quantity());
    event.set_source(cmd.source());
    *event.mutable_received_at() = stockroom::helpers::now();
    return event;
}

StockRestocked handle_restock(const RestockStock& cmd, const StockState& state) {
    stockroom::validation::require_exists(
        state.exists(), "Inventory " + cmd.inventory_id() + " not found");
    require_capacity(state, cmd.quantity());

    StockRestocked event;
    event.set_return_id(cmd.return_id());
    event.set_quantity(cmd.quantity());
    event.set_reason(cmd.reason());
    *event.mutable_restocked_at() = stockroom::helpers::now();
    return event;
}

} // namespace handlers
} // namespace inventory
