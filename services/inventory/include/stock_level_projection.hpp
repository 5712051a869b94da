#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "stock_state.hpp"
#include "stockroom/projector.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {

/// Eventually-consistent read model of stock levels per inventory stream.
///
/// Folds committed pages incrementally with the same reducer the engine uses.
/// Pages at or below the version already projected are skipped, so
/// re-delivery is harmless.
class StockLevelProjection : public stockroom::Projector {
public:
    std::string name() const override { return "stock-levels"; }
    std::string input_domain() const override { return DOMAIN; }

    void project(const stockroom::EventBook& book) override;

    std::optional<StockLevel> get(const std::string& inventory_id) const;
    std::vector<StockLevel> all() const;

private:
    struct Row {
        StockState state;
        uint32_t version = 0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Row> rows_;
};

} // namespace inventory
