#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "stockroom/projector.hpp"

namespace inventory {

/// Secondary index from reservation id to the inventory stream that holds it.
///
/// Entries are added on StockReserved and kept afterwards, so a reservation
/// can always be traced to its stream. Whether it is still a soft hold is
/// decided by the aggregate, never by the index.
class ReservationIndex : public stockroom::Projector {
public:
    std::string name() const override { return "reservation-index"; }
    std::string input_domain() const override;

    void project(const stockroom::EventBook& book) override;

    std::optional<std::string> find(const std::string& reservation_id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> owners_;
};

} // namespace inventory
