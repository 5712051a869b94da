#pragma once

#include <string>
#include "stockroom/types.pb.h"

namespace stockroom {

/**
 * Read-side consumer of committed events.
 *
 * Projectors are fed every EventBook an event store commits. Implementations
 * must be safe to call concurrently with their own query methods.
 *
 * Usage:
 *   StockLevelProjection levels;
 *   store.subscribe([&levels](const EventBook& book) { levels.project(book); });
 */
class Projector {
public:
    virtual ~Projector() = default;

    /**
     * Get the projector name.
     */
    virtual std::string name() const = 0;

    /**
     * Get the input domain.
     */
    virtual std::string input_domain() const = 0;

    /**
     * Fold newly committed events into the read model.
     */
    virtual void project(const EventBook& book) = 0;
};

} // namespace stockroom
