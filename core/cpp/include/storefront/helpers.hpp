#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "types.hpp"

namespace storefront {

/**
 * Helper functions shared by the order core and the service layer.
 */
namespace helpers {

/**
 * Milliseconds since the Unix epoch, the store's timestamp representation.
 */
inline int64_t to_millis(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline Timestamp from_millis(int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

/**
 * Convert a time point to a protobuf Timestamp.
 */
google::protobuf::Timestamp to_timestamp(Timestamp tp);

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Format the UTC calendar date of a time point as YYYYMMDD.
 */
std::string utc_date_stamp(Timestamp tp);

/**
 * Mask a phone number to its last 4 characters: "0821234567" -> "***4567".
 * Numbers of 4 characters or fewer keep all of them after the mask.
 */
std::optional<std::string> mask_phone(const std::optional<std::string>& phone);

/**
 * True if the bytes are well-formed UTF-8 (no overlongs, surrogates or
 * code points above U+10FFFF).
 */
bool is_valid_utf8(const std::string& text);

/**
 * Trim surrounding whitespace and upper-case an order number typed by a buyer.
 */
std::string normalize_order_number(const std::string& raw);

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Check if a type URL matches the given fully qualified type name.
 * @param type_url Full type URL (e.g., "type.googleapis.com/storefront.v1.OrderPlaced")
 * @param type_name Fully qualified type name (e.g., "storefront.v1.OrderPlaced")
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

} // namespace helpers
} // namespace storefront
