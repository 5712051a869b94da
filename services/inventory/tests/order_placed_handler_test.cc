#include <gtest/gtest.h>
#include <limits>
#include "order_placed_handler.hpp"
#include "reservation_index.hpp"
#include "stockroom/errors.hpp"
#include "stockroom/event_store.hpp"

using namespace inventory;

namespace {

/// Store on which every append to one stream loses its race.
class ContendedEventStore : public stockroom::InMemoryEventStore {
public:
    uint32_t append(const std::string& domain, const std::string& root,
                    uint32_t expected_version, std::vector<stockroom::EventPage> pages) override {
        if (root == contended_root) {
            throw stockroom::ConcurrencyConflictError("lost race", expected_version,
                                                      expected_version + 1);
        }
        return InMemoryEventStore::append(domain, root, expected_version, std::move(pages));
    }

    std::string contended_root;
};

} // anonymous namespace

class OrderPlacedHandlerTest : public ::testing::Test {
protected:
    OrderPlacedHandlerTest() {
        store.subscribe([this](const stockroom::EventBook& book) { index.project(book); });
    }

    void stock(const std::string& sku, int32_t quantity, const std::string& warehouse = "WH-01") {
        InitializeInventory cmd;
        cmd.set_sku(sku);
        cmd.set_warehouse_id(warehouse);
        cmd.set_initial_quantity(quantity);
        engine.initialize(cmd);
    }

    static contracts::OrderPlaced order(
        const std::string& order_id,
        std::initializer_list<std::pair<std::string, int32_t>> items) {
        contracts::OrderPlaced event;
        event.set_order_id(order_id);
        event.set_customer_id("C1");
        for (const auto& [sku, quantity] : items) {
            auto* item = event.add_line_items();
            item->set_sku(sku);
            item->set_quantity(quantity);
        }
        return event;
    }

    StockState load(const std::string& sku, const std::string& warehouse = "WH-01") {
        return engine.load(inventory_id(sku, warehouse));
    }

    ContendedEventStore store;
    ReservationIndex index;
    InventoryEngine engine{store, index};
    OrderPlacedHandler handler{engine, single_warehouse("WH-01")};
};

// =============================================================================
// Grouping Tests
// =============================================================================

TEST_F(OrderPlacedHandlerTest, GroupLineItems_ShouldSumPerSkuInFirstSeenOrder) {
    auto grouped = OrderPlacedHandler::group_line_items(
        order("O1", {{"SKU-B", 1}, {"SKU-A", 2}, {"SKU-B", 4}}));

    ASSERT_EQ(grouped.size(), 2u);
    EXPECT_EQ(grouped[0].sku(), "SKU-B");
    EXPECT_EQ(grouped[0].quantity(), 5);
    EXPECT_EQ(grouped[1].sku(), "SKU-A");
    EXPECT_EQ(grouped[1].quantity(), 2);
}

TEST_F(OrderPlacedHandlerTest, GroupLineItems_Overflow_ShouldThrow) {
    const auto max = std::numeric_limits<int32_t>::max();
    EXPECT_THROW(OrderPlacedHandler::group_line_items(order("O1", {{"SKU-A", max}, {"SKU-A", 1}})),
                 stockroom::ValidationError);
}

TEST_F(OrderPlacedHandlerTest, RepeatedSku_ShouldReserveOnce) {
    // Given 20 units of SKU-3
    stock("SKU-3", 20);

    // When an order lists SKU-3 twice
    auto outcomes = handler.handle(order("O1", {{"SKU-3", 3}, {"SKU-3", 7}}));

    // Then a single reservation of 10 is made
    ASSERT_EQ(outcomes.outcomes_size(), 1);
    ASSERT_TRUE(outcomes.outcomes(0).has_confirmed());
    EXPECT_EQ(outcomes.outcomes(0).confirmed().quantity(), 10);
    auto state = load("SKU-3");
    EXPECT_EQ(state.reservations.size(), 1u);
    EXPECT_EQ(state.available, 10);
}

// =============================================================================
// Handling Tests
// =============================================================================

TEST_F(OrderPlacedHandlerTest, EachSku_ShouldBeReservedIndependently) {
    // Given plenty of SKU-A and little SKU-B
    stock("SKU-A", 10);
    stock("SKU-B", 1);

    // When the order needs more SKU-B than exists
    auto outcomes = handler.handle(order("O1", {{"SKU-A", 2}, {"SKU-B", 5}}));

    // Then SKU-A holds and SKU-B is declined
    ASSERT_EQ(outcomes.outcomes_size(), 2);
    EXPECT_EQ(outcomes.order_id(), "O1");
    ASSERT_TRUE(outcomes.outcomes(0).has_confirmed());
    EXPECT_EQ(outcomes.outcomes(0).confirmed().order_id(), "O1");
    ASSERT_TRUE(outcomes.outcomes(1).has_failed());
    EXPECT_EQ(outcomes.outcomes(1).failed().available_quantity(), 1);
    EXPECT_EQ(load("SKU-A").available, 8);
    EXPECT_EQ(load("SKU-B").available, 1);
}

TEST_F(OrderPlacedHandlerTest, UnknownSku_ShouldBeReportedAsFailure) {
    stock("SKU-A", 10);

    auto outcomes = handler.handle(order("O1", {{"SKU-A", 1}, {"SKU-X", 1}}));

    ASSERT_EQ(outcomes.outcomes_size(), 2);
    EXPECT_TRUE(outcomes.outcomes(0).has_confirmed());
    ASSERT_TRUE(outcomes.outcomes(1).has_failed());
    EXPECT_EQ(outcomes.outcomes(1).failed().sku(), "SKU-X");
    EXPECT_EQ(outcomes.outcomes(1).failed().available_quantity(), 0);
    EXPECT_FALSE(outcomes.outcomes(1).failed().reason().empty());
}

TEST_F(OrderPlacedHandlerTest, Resolver_ShouldPickWarehouse) {
    stock("SKU-A", 4, "WH-EAST");
    OrderPlacedHandler east(engine, single_warehouse("WH-EAST"));

    auto outcomes = east.handle(order("O1", {{"SKU-A", 4}}));

    ASSERT_TRUE(outcomes.outcomes(0).has_confirmed());
    EXPECT_EQ(outcomes.outcomes(0).confirmed().warehouse_id(), "WH-EAST");
    EXPECT_EQ(load("SKU-A", "WH-EAST").available, 0);
}

TEST_F(OrderPlacedHandlerTest, InvalidOrder_ShouldNotTouchStore) {
    stock("SKU-A", 10);
    auto version = store.version(inventory_id("SKU-A", "WH-01"));

    EXPECT_THROW(handler.handle(order("O1", {{"SKU-A", 2}, {"SKU-A", 0}})),
                 stockroom::ValidationError);
    EXPECT_THROW(handler.handle(order("O1", {})), stockroom::ValidationError);
    EXPECT_THROW(handler.handle(order("", {{"SKU-A", 1}})), stockroom::ValidationError);
    EXPECT_EQ(store.version(inventory_id("SKU-A", "WH-01")), version);
}

TEST_F(OrderPlacedHandlerTest, LaterSkuConflict_ShouldKeepConfirmedOutcome) {
    // Given SKU-B can never be written
    stock("SKU-A", 10);
    stock("SKU-B", 10);
    store.contended_root = inventory_id("SKU-B", "WH-01");

    // When an order reserves A then B
    auto outcomes = handler.handle(order("O1", {{"SKU-A", 4}, {"SKU-B", 4}}));

    // Then A's hold is reported and B carries the error
    ASSERT_EQ(outcomes.outcomes_size(), 2);
    ASSERT_TRUE(outcomes.outcomes(0).has_confirmed());
    EXPECT_EQ(outcomes.outcomes(0).confirmed().sku(), "SKU-A");
    ASSERT_TRUE(outcomes.outcomes(1).has_failed());
    EXPECT_EQ(outcomes.outcomes(1).failed().sku(), "SKU-B");
    EXPECT_EQ(outcomes.outcomes(1).failed().requested_quantity(), 4);
    EXPECT_FALSE(outcomes.outcomes(1).failed().reason().empty());

    // And compensation returns A's stock
    auto released = handler.compensate(outcomes, "partial_fulfilment");
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0].reservation_id(), outcomes.outcomes(0).confirmed().reservation_id());
    EXPECT_EQ(load("SKU-A").available, 10);
    EXPECT_TRUE(load("SKU-A").reservations.empty());
}

TEST_F(OrderPlacedHandlerTest, UnresolvableWarehouse_ShouldFailOnlyThatSku) {
    stock("SKU-A", 10);
    OrderPlacedHandler partial(engine, [](const std::string& sku) {
        return sku == "SKU-A" ? std::string("WH-01") : std::string();
    });

    auto outcomes = partial.handle(order("O1", {{"SKU-A", 2}, {"SKU-Z", 1}}));

    ASSERT_EQ(outcomes.outcomes_size(), 2);
    EXPECT_TRUE(outcomes.outcomes(0).has_confirmed());
    ASSERT_TRUE(outcomes.outcomes(1).has_failed());
    EXPECT_EQ(outcomes.outcomes(1).failed().sku(), "SKU-Z");
    EXPECT_EQ(load("SKU-A").available, 8);
}

// =============================================================================
// Compensation Tests
// =============================================================================

TEST_F(OrderPlacedHandlerTest, Compensate_ShouldReleaseConfirmedHolds) {
    // Given an order that was only partly satisfied
    stock("SKU-A", 10);
    stock("SKU-B", 10);
    stock("SKU-C", 0);
    auto outcomes = handler.handle(order("O1", {{"SKU-A", 3}, {"SKU-B", 4}, {"SKU-C", 1}}));

    // When it is compensated
    auto released = handler.compensate(outcomes, "partial_fulfilment");

    // Then both holds are returned
    ASSERT_EQ(released.size(), 2u);
    EXPECT_EQ(released[0].sku(), "SKU-A");
    EXPECT_EQ(released[0].reason(), "partial_fulfilment");
    EXPECT_EQ(released[1].quantity(), 4);
    EXPECT_EQ(load("SKU-A").available, 10);
    EXPECT_EQ(load("SKU-B").available, 10);
}

TEST_F(OrderPlacedHandlerTest, Compensate_Twice_ShouldReleaseNothingMore) {
    stock("SKU-A", 10);
    auto outcomes = handler.handle(order("O1", {{"SKU-A", 3}}));
    handler.compensate(outcomes, "cancelled");

    auto again = handler.compensate(outcomes, "cancelled");

    EXPECT_TRUE(again.empty());
    EXPECT_EQ(load("SKU-A").available, 10);
}
