#pragma once

#include <string>
#include <chrono>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "stockroom/types.pb.h"

namespace stockroom {

/**
 * Helper functions for working with Stockroom types.
 */
namespace helpers {

/**
 * Get the domain from an EventBook.
 */
inline std::string domain(const EventBook& book) {
    return book.has_cover() ? book.cover().domain() : "";
}

/**
 * Get the aggregate root from an EventBook.
 */
inline std::string root(const EventBook& book) {
    return book.has_cover() ? book.cover().root() : "";
}

/**
 * Calculate the next sequence number from an EventBook.
 *
 * Accounts for a leading snapshot, so the result is the stream version the
 * book was loaded at.
 */
inline uint32_t next_sequence(const EventBook* book) {
    if (!book) return 0;
    if (book->pages_size() > 0) {
        return book->pages(book->pages_size() - 1).sequence() + 1;
    }
    return book->has_snapshot() ? book->snapshot().sequence() : 0;
}

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Check if a type URL matches the given fully qualified type name.
 * @param type_url Full type URL (e.g., "type.googleapis.com/inventory.StockReserved")
 * @param type_name Fully qualified type name (e.g., "inventory.StockReserved")
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Format a Timestamp as ISO-8601 UTC with second precision.
 */
std::string to_iso8601(const google::protobuf::Timestamp& ts);

/**
 * Generate a random (version 4) UUID string.
 */
std::string new_uuid();

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

/**
 * Pack an event into an EventPage.
 */
template<typename T>
EventPage pack_event(const T& event_message) {
    EventPage page;
    page.mutable_event()->PackFrom(event_message, TYPE_URL_PREFIX);
    *page.mutable_created_at() = now();
    return page;
}

} // namespace helpers
} // namespace stockroom
