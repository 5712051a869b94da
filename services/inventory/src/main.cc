#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "inventory_engine.hpp"
#include "inventory_service.hpp"
#include "order_placed_handler.hpp"
#include "reservation_index.hpp"
#include "service_config.hpp"
#include "stock_level_projection.hpp"
#include "stockroom/event_store.hpp"
#include "stockroom/logging.hpp"

int main(int argc, char** argv) {
    inventory::ServiceConfig config;
    try {
        config = inventory::ServiceConfig::from_env();
        if (argc > 1) {
            config.port = inventory::parse_port(argv[1]);
        }
    } catch (const stockroom::ValidationError& e) {
        stockroom::log_error(inventory::DOMAIN, "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    // Projections are wired before the engine so they see every commit.
    stockroom::InMemoryEventStore store;
    inventory::ReservationIndex index;
    inventory::StockLevelProjection levels;
    store.subscribe([&index](const stockroom::EventBook& book) { index.project(book); });
    store.subscribe([&levels](const stockroom::EventBook& book) { levels.project(book); });

    inventory::InventoryEngine engine(store, index, config.engine);
    inventory::OrderPlacedHandler orders(engine,
                                         inventory::single_warehouse(config.default_warehouse));
    auto service = inventory::create_inventory_service(engine, orders, levels);

    // Enable reflection for debugging
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        stockroom::log_error(inventory::DOMAIN, "server_start_failed",
                             {{"address", server_address}});
        return 1;
    }
    stockroom::log_info(inventory::DOMAIN, "server_listening", {
        {"address", server_address},
        {"default_warehouse", config.default_warehouse},
        {"max_attempts", config.engine.max_attempts},
        {"snapshot_interval", config.engine.snapshot_interval}});

    server->Wait();
    return 0;
}
