#pragma once

#include <functional>
#include <map>
#include <string>
#include <google/protobuf/any.pb.h>
#include "stockroom/types.pb.h"
#include "helpers.hpp"

namespace stockroom {

/**
 * Fluent state reconstruction from events (functional pattern).
 *
 * Appliers are keyed by the event's fully qualified protobuf name. Events with
 * no registered applier leave the state untouched.
 *
 * Example:
 *   auto router = StateRouter<StockState>([] { return StockState{}; })
 *       .on<inventory::StockReceived>([](StockState& s, const inventory::StockReceived& e) {
 *           s.available += e.quantity();
 *       });
 *   auto state = router.with_event_book(&book);
 */
template<typename State>
class StateRouter {
public:
    using Applier = std::function<void(State&, const google::protobuf::Any&)>;
    using SnapshotLoader = std::function<State(const google::protobuf::Any&)>;

    explicit StateRouter(std::function<State()> factory)
        : factory_(std::move(factory)) {}

    /**
     * Register an event applier.
     */
    template<typename Event>
    StateRouter& on(std::function<void(State&, const Event&)> applier) {
        std::string type_name = Event::descriptor()->full_name();
        appliers_[type_name] = [applier](State& state, const google::protobuf::Any& any) {
            Event event;
            if (any.UnpackTo(&event)) {
                applier(state, event);
            }
        };
        return *this;
    }

    /**
     * Register how to restore state from a snapshot payload.
     */
    StateRouter& with_snapshot(SnapshotLoader loader) {
        snapshot_loader_ = std::move(loader);
        return *this;
    }

    /**
     * Rebuild state from an EventBook, starting from its snapshot if present.
     */
    State with_event_book(const EventBook* book) const {
        if (!book) return factory_();

        auto state = book->has_snapshot() && snapshot_loader_
            ? snapshot_loader_(book->snapshot().state())
            : factory_();

        for (const auto& page : book->pages()) {
            if (!page.has_event()) continue;
            apply_event(state, page.event());
        }
        return state;
    }

    /**
     * Apply a single event to state.
     */
    void apply_event(State& state, const google::protobuf::Any& event_any) const {
        auto it = appliers_.find(helpers::type_name_from_url(event_any.type_url()));
        if (it != appliers_.end()) {
            it->second(state, event_any);
        }
    }

private:
    std::function<State()> factory_;
    std::map<std::string, Applier> appliers_;
    SnapshotLoader snapshot_loader_;
};

} // namespace stockroom
