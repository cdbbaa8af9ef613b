#pragma once

#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "helpers.hpp"

namespace storefront {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw ValidationFailedError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw ValidationFailedError(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw ValidationFailedError(field_name + " must not be empty");
    }
}

/**
 * Require that text is well-formed UTF-8. Store, wire and log records all
 * carry it as text.
 */
inline void require_utf8(const std::string& value, const std::string& field_name = "value") {
    if (!helpers::is_valid_utf8(value)) {
        throw ValidationFailedError(field_name + " must be valid UTF-8");
    }
}

inline void require_utf8(const std::optional<std::string>& value,
                         const std::string& field_name = "value") {
    if (value) require_utf8(*value, field_name);
}

/**
 * Require that a collection is not empty.
 */
template<typename T>
void require_not_empty(const std::vector<T>& collection, const std::string& field_name = "collection") {
    if (collection.empty()) {
        throw ValidationFailedError(field_name + " must not be empty");
    }
}

/**
 * Require that a collection holds at most `limit` entries.
 */
template<typename T>
void require_at_most(const std::vector<T>& collection, size_t limit,
                     const std::string& field_name = "collection") {
    if (collection.size() > limit) {
        throw ValidationFailedError(field_name + " must have at most " +
                                    std::to_string(limit) + " entries");
    }
}

} // namespace validation
} // namespace storefront
