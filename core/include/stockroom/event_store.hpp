#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "stockroom/types.pb.h"
#include "errors.hpp"

namespace stockroom {

/**
 * Append-only, per-root event stream storage with optimistic concurrency.
 *
 * A stream's version is the number of events it holds. Writers load a stream,
 * decide, and append conditioned on the version they loaded; a mismatch raises
 * ConcurrencyConflictError and leaves the stream untouched.
 */
class EventStore {
public:
    using Listener = std::function<void(const EventBook&)>;

    virtual ~EventStore() = default;

    /**
     * Load the latest snapshot (if any) and every page after it.
     *
     * Unknown roots yield an EventBook with a cover and no pages.
     */
    virtual EventBook load(const std::string& root) const = 0;

    /**
     * Load every page from sequence 0, ignoring snapshots.
     */
    virtual EventBook load_history(const std::string& root) const = 0;

    /**
     * Append pages to a stream.
     *
     * Pages are renumbered consecutively from expected_version.
     *
     * @return The stream version after the append
     * @throws ConcurrencyConflictError if the stream is not at expected_version
     */
    virtual uint32_t append(const std::string& domain, const std::string& root,
                            uint32_t expected_version, std::vector<EventPage> pages) = 0;

    /**
     * Store a snapshot. Older snapshots are replaced; a snapshot beyond the
     * stream's version is rejected with CommandRejectedError.
     */
    virtual void save_snapshot(const std::string& root, const Snapshot& snapshot) = 0;

    /**
     * Number of events in the stream (0 for unknown roots).
     */
    virtual uint32_t version(const std::string& root) const = 0;

    /**
     * Register a listener for committed events.
     */
    virtual void subscribe(Listener listener) = 0;
};

/**
 * EventStore held entirely in memory.
 *
 * All operations serialize on one mutex. Listeners run while it is held, so
 * each stream's events reach listeners in commit order; listeners must not
 * call back into the store.
 */
class InMemoryEventStore : public EventStore {
public:
    EventBook load(const std::string& root) const override;
    EventBook load_history(const std::string& root) const override;
    uint32_t append(const std::string& domain, const std::string& root,
                    uint32_t expected_version, std::vector<EventPage> pages) override;
    void save_snapshot(const std::string& root, const Snapshot& snapshot) override;
    uint32_t version(const std::string& root) const override;
    void subscribe(Listener listener) override;

    /**
     * Roots of every stream, in key order.
     */
    std::vector<std::string> roots() const;

private:
    struct Stream {
        std::string domain;
        std::vector<EventPage> pages;
        Snapshot snapshot;
        bool has_snapshot = false;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Stream> streams_;
    std::vector<Listener> listeners_;
};

} // namespace stockroom
