#pragma once

#include <memory>
#include "inventory_engine.hpp"
#include "order_placed_handler.hpp"
#include "stock_level_projection.hpp"
#include "inventory/inventory_service.grpc.pb.h"

namespace inventory {

std::unique_ptr<InventoryService::Service> create_inventory_service(
    InventoryEngine& engine, OrderPlacedHandler& orders, const StockLevelProjection& levels);

} // namespace inventory
