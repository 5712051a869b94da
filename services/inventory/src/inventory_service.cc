#include "inventory_service.hpp"
#include "stockroom/errors.hpp"
#include "stockroom/logging.hpp"
#include <grpcpp/grpcpp.h>

namespace inventory {

namespace {

class InventoryServiceImpl final : public InventoryService::Service {
public:
    InventoryServiceImpl(InventoryEngine& engine, OrderPlacedHandler& orders,
                         const StockLevelProjection& levels)
        : engine_(engine), orders_(orders), levels_(levels) {}

    grpc::Status InitializeInventory(grpc::ServerContext*,
                                     const inventory::InitializeInventory* request,
                                     InitializeInventoryResponse* response) override {
        return guarded("InitializeInventory", [&] {
            auto id = engine_.initialize(*request);
            response->set_inventory_id(id);
            if (auto level = levels_.get(id)) *response->mutable_level() = *level;
        });
    }

    grpc::Status ReceiveStock(grpc::ServerContext*, const inventory::ReceiveStock* request,
                              StockLevel* response) override {
        return guarded("ReceiveStock", [&] { *response = engine_.receive_stock(*request); });
    }

    grpc::Status RestockStock(grpc::ServerContext*, const inventory::RestockStock* request,
                              StockLevel* response) override {
        return guarded("RestockStock", [&] { *response = engine_.restock(*request); });
    }

    grpc::Status PlaceOrder(grpc::ServerContext*, const contracts::OrderPlaced* request,
                            contracts::ReservationOutcomes* response) override {
        return guarded("PlaceOrder", [&] { *response = orders_.handle(*request); });
    }

    grpc::Status CommitReservation(grpc::ServerContext*,
                                   const inventory::CommitReservation* request,
                                   contracts::ReservationCommitted* response) override {
        return guarded("CommitReservation", [&] { *response = engine_.commit(*request); });
    }

    grpc::Status RequestCommit(grpc::ServerContext*,
                               const contracts::ReservationCommitRequested* request,
                               contracts::ReservationCommitted* response) override {
        return guarded("RequestCommit", [&] { *response = engine_.commit(*request); });
    }

    grpc::Status ReleaseReservation(grpc::ServerContext*,
                                    const inventory::ReleaseReservation* request,
                                    ReleaseReservationResponse* response) override {
        return guarded("ReleaseReservation", [&] {
            fill_release(engine_.release(*request), response);
        });
    }

    grpc::Status RequestRelease(grpc::ServerContext*,
                                const contracts::ReservationReleaseRequested* request,
                                ReleaseReservationResponse* response) override {
        return guarded("RequestRelease", [&] {
            fill_release(engine_.release(*request), response);
        });
    }

    grpc::Status GetStockLevel(grpc::ServerContext*, const GetStockLevelRequest* request,
                               StockLevel* response) override {
        auto level = levels_.get(request->inventory_id());
        if (!level) {
            return grpc::Status(grpc::StatusCode::NOT_FOUND,
                                "Inventory " + request->inventory_id() + " not found");
        }
        *response = *level;
        return grpc::Status::OK;
    }

private:
    template<typename Fn>
    grpc::Status guarded(const char* rpc, Fn fn) {
        try {
            fn();
            return grpc::Status::OK;
        } catch (const stockroom::Error& e) {
            stockroom::log_warn(DOMAIN, "rpc_rejected", {
                {"rpc", rpc},
                {"code", static_cast<int>(e.status_code())},
                {"error", e.what()}});
            return e.to_grpc_status();
        } catch (const std::exception& e) {
            stockroom::log_error(DOMAIN, "rpc_failed", {{"rpc", rpc}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

    static void fill_release(const std::optional<contracts::ReservationReleased>& event,
                             ReleaseReservationResponse* response) {
        response->set_released(event.has_value());
        if (event) *response->mutable_event() = *event;
    }

    InventoryEngine& engine_;
    OrderPlacedHandler& orders_;
    const StockLevelProjection& levels_;
};

} // anonymous namespace

std::unique_ptr<InventoryService::Service> create_inventory_service(
    InventoryEngine& engine, OrderPlacedHandler& orders, const StockLevelProjection& levels) {
    return std::make_unique<InventoryServiceImpl>(engine, orders, levels);
}

} // namespace inventory
