#include "reservation_index.hpp"
#include "stock_state.hpp"
#include "stockroom/helpers.hpp"
#include "inventory/inventory.pb.h"

namespace inventory {

std::string ReservationIndex::input_domain() const {
    return DOMAIN;
}

void ReservationIndex::project(const stockroom::EventBook& book) {
    if (stockroom::helpers::domain(book) != DOMAIN) return;
    const auto root = stockroom::helpers::root(book);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& page : book.pages()) {
        if (!page.has_event() || !page.event().Is<StockReserved>()) continue;
        StockReserved event;
        if (page.event().UnpackTo(&event)) {
            owners_[event.reservation_id()] = root;
        }
    }
}

std::optional<std::string> ReservationIndex::find(const std::string& reservation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(reservation_id);
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

size_t ReservationIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.size();
}

} // namespace inventory
