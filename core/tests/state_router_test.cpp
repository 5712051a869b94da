#include <gtest/gtest.h>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/duration.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "stockroom/types.pb.h"
#include "stockroom/router.hpp"
#include "stockroom/helpers.hpp"

using namespace stockroom;

// =============================================================================
// State Building Tests
// =============================================================================

// Timestamps stand in for "add seconds" events, durations for "reset" events.
struct CounterState {
    int64_t total = 0;
    int applied = 0;
};

class StateRouterTest : public ::testing::Test {
protected:
    StateRouter<CounterState> make_router() {
        return StateRouter<CounterState>([] { return CounterState{}; })
            .on<google::protobuf::Timestamp>(
                [](CounterState& state, const google::protobuf::Timestamp& e) {
                    state.total += e.seconds();
                    state.applied++;
                })
            .on<google::protobuf::Duration>(
                [](CounterState& state, const google::protobuf::Duration&) {
                    state.total = 0;
                    state.applied++;
                });
    }

    static EventPage add(int64_t seconds) {
        google::protobuf::Timestamp ts;
        ts.set_seconds(seconds);
        return helpers::pack_event(ts);
    }

    static EventPage reset() {
        return helpers::pack_event(google::protobuf::Duration{});
    }
};

TEST_F(StateRouterTest, WithEventBook_ShouldApplyAllEvents) {
    // Given a book with three additions
    EventBook book;
    *book.add_pages() = add(1);
    *book.add_pages() = add(2);
    *book.add_pages() = add(3);

    // When I build state
    auto state = make_router().with_event_book(&book);

    // Then every event was folded
    EXPECT_EQ(state.total, 6);
    EXPECT_EQ(state.applied, 3);
}

TEST_F(StateRouterTest, WithNullEventBook_ShouldReturnDefaultState) {
    auto state = make_router().with_event_book(nullptr);
    EXPECT_EQ(state.total, 0);
    EXPECT_EQ(state.applied, 0);
}

TEST_F(StateRouterTest, EventsApplyInOrder) {
    EventBook book;
    *book.add_pages() = add(5);
    *book.add_pages() = reset();
    *book.add_pages() = add(2);

    auto state = make_router().with_event_book(&book);

    EXPECT_EQ(state.total, 2);
    EXPECT_EQ(state.applied, 3);
}

TEST_F(StateRouterTest, UnknownEventType_ShouldBeIgnored) {
    EventBook book;
    book.add_pages()->mutable_event()->set_type_url("type.googleapis.com/unknown.Event");
    *book.add_pages() = add(4);

    auto state = make_router().with_event_book(&book);

    EXPECT_EQ(state.total, 4);
    EXPECT_EQ(state.applied, 1);
}

TEST_F(StateRouterTest, PagesWithoutEvents_ShouldBeSkipped) {
    EventBook book;
    book.add_pages();
    *book.add_pages() = add(7);

    auto state = make_router().with_event_book(&book);

    EXPECT_EQ(state.applied, 1);
}

// =============================================================================
// Snapshot Integration Tests
// =============================================================================

TEST_F(StateRouterTest, WithSnapshot_ShouldRestoreFromSnapshotThenApplyTail) {
    // Given a router that restores the total from a snapshot timestamp
    auto router = make_router().with_snapshot([](const google::protobuf::Any& any) {
        google::protobuf::Timestamp ts;
        any.UnpackTo(&ts);
        CounterState state;
        state.total = ts.seconds();
        return state;
    });

    // And a book whose snapshot holds 100 followed by one addition
    EventBook book;
    google::protobuf::Timestamp snap;
    snap.set_seconds(100);
    book.mutable_snapshot()->set_sequence(10);
    book.mutable_snapshot()->mutable_state()->PackFrom(snap);
    *book.add_pages() = add(5);

    // When I build state
    auto state = router.with_event_book(&book);

    // Then it starts from the snapshot
    EXPECT_EQ(state.total, 105);
    EXPECT_EQ(state.applied, 1);
}

TEST_F(StateRouterTest, WithSnapshotButNoLoader_ShouldFoldPagesOnly) {
    EventBook book;
    book.mutable_snapshot()->set_sequence(10);
    *book.add_pages() = add(5);

    auto state = make_router().with_event_book(&book);

    EXPECT_EQ(state.total, 5);
}
