#include "stockroom/event_store.hpp"

namespace stockroom {

namespace {

EventBook empty_book(const std::string& domain, const std::string& root) {
    EventBook book;
    book.mutable_cover()->set_domain(domain);
    book.mutable_cover()->set_root(root);
    return book;
}

} // anonymous namespace

EventBook InMemoryEventStore::load(const std::string& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(root);
    if (it == streams_.end()) return empty_book("", root);

    const auto& stream = it->second;
    auto book = empty_book(stream.domain, root);
    uint32_t from = 0;
    if (stream.has_snapshot) {
        *book.mutable_snapshot() = stream.snapshot;
        from = stream.snapshot.sequence();
    }
    for (size_t i = from; i < stream.pages.size(); ++i) {
        *book.add_pages() = stream.pages[i];
    }
    return book;
}

EventBook InMemoryEventStore::load_history(const std::string& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(root);
    if (it == streams_.end()) return empty_book("", root);

    auto book = empty_book(it->second.domain, root);
    for (const auto& page : it->second.pages) {
        *book.add_pages() = page;
    }
    return book;
}

uint32_t InMemoryEventStore::append(const std::string& domain, const std::string& root,
                                    uint32_t expected_version, std::vector<EventPage> pages) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = streams_[root];
    auto actual = static_cast<uint32_t>(stream.pages.size());
    if (actual != expected_version) {
        if (actual == 0) streams_.erase(root);
        throw ConcurrencyConflictError(
            "Stream " + root + " is at version " + std::to_string(actual) +
            ", expected " + std::to_string(expected_version),
            expected_version, actual);
    }
    if (stream.domain.empty()) stream.domain = domain;
    if (pages.empty()) return actual;

    auto committed = empty_book(stream.domain, root);
    uint32_t sequence = expected_version;
    for (auto& page : pages) {
        page.set_sequence(sequence++);
        *committed.add_pages() = page;
        stream.pages.push_back(std::move(page));
    }

    for (const auto& listener : listeners_) {
        listener(committed);
    }
    return sequence;
}

void InMemoryEventStore::save_snapshot(const std::string& root, const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(root);
    if (it == streams_.end() || snapshot.sequence() > it->second.pages.size()) {
        throw CommandRejectedError("Snapshot for " + root + " is ahead of its stream");
    }
    auto& stream = it->second;
    if (stream.has_snapshot && stream.snapshot.sequence() >= snapshot.sequence()) return;
    stream.snapshot = snapshot;
    stream.has_snapshot = true;
}

uint32_t InMemoryEventStore::version(const std::string& root) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(root);
    return it == streams_.end() ? 0 : static_cast<uint32_t>(it->second.pages.size());
}

void InMemoryEventStore::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

std::vector<std::string> InMemoryEventStore::roots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(streams_.size());
    for (const auto& [root, _] : streams_) {
        result.push_back(root);
    }
    return result;
}

} // namespace stockroom
