#pragma once

#include <string>
#include "errors.hpp"

namespace stockroom {
namespace validation {

/**
 * Require that an aggregate exists (has prior events).
 */
inline void require_exists(bool exists, const std::string& message = "Aggregate does not exist") {
    if (!exists) {
        throw NotFoundError(message);
    }
}

/**
 * Require that an aggregate does not exist.
 */
inline void require_not_exists(bool exists, const std::string& message = "Aggregate already exists") {
    if (exists) {
        throw CommandRejectedError(message);
    }
}

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw ValidationError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw ValidationError(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw ValidationError(field_name + " must not be empty");
    }
}

/**
 * Require that a string is not empty and at most max_length characters.
 */
inline void require_bounded(const std::string& value, size_t max_length,
                            const std::string& field_name = "value") {
    require_not_empty(value, field_name);
    if (value.size() > max_length) {
        throw ValidationError(field_name + " must be at most " +
                              std::to_string(max_length) + " characters");
    }
}

} // namespace validation
} // namespace stockroom
