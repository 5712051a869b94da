#include "stock_level_projection.hpp"
#include "stockroom/helpers.hpp"

namespace inventory {

void StockLevelProjection::project(const stockroom::EventBook& book) {
    if (stockroom::helpers::domain(book) != DOMAIN) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& row = rows_[stockroom::helpers::root(book)];
    for (const auto& page : book.pages()) {
        if (!page.has_event() || page.sequence() < row.version) continue;
        row.state = StockState::apply(std::move(row.state), page.event());
        row.version = page.sequence() + 1;
    }
}

std::optional<StockLevel> StockLevelProjection::get(const std::string& inventory_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(inventory_id);
    if (it == rows_.end() || !it->second.state.exists()) return std::nullopt;
    return it->second.state.to_level(it->second.version);
}

std::vector<StockLevel> StockLevelProjection::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StockLevel> levels;
    for (const auto& [_, row] : rows_) {
        if (row.state.exists()) levels.push_back(row.state.to_level(row.version));
    }
    return levels;
}

} // namespace inventory
