#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "order_status.hpp"

namespace storefront {

using Timestamp = std::chrono::system_clock::time_point;

/// One line of a buyer's cart as submitted at checkout.
struct CartLine {
    std::string product_id;
    std::string variant_id;
    std::string product_name;
    std::string option1_label;
    std::string option1_value;
    std::string option2_label;
    std::optional<std::string> option2_value;
    int64_t price_cents = 0;
    int64_t quantity = 0;
};

/// A checkout request. Buyers are unauthenticated, so every buyer field is optional.
struct Cart {
    std::string tenant_id;
    std::vector<CartLine> items;
    std::optional<std::string> buyer_name;
    std::optional<std::string> buyer_phone;
    std::optional<std::string> buyer_note;
    std::optional<std::string> delivery_address;
    std::optional<std::string> delivery_city;
    std::optional<std::string> delivery_province;
    std::optional<std::string> delivery_postal_code;
    std::string message;
};

/// Persisted line item. Snapshot fields are a receipt, never a live catalog view.
struct OrderItem {
    int64_t id = 0;
    std::string product_id;
    std::string variant_id;
    std::string product_name;
    std::string option1_label;
    std::string option1_value;
    std::string option2_label;
    std::optional<std::string> option2_value;
    int64_t price_cents = 0;
    int64_t quantity = 0;
};

struct Order {
    int64_t id = 0;
    std::string order_number;
    std::string tenant_id;
    std::optional<std::string> buyer_name;
    std::optional<std::string> buyer_phone;
    std::optional<std::string> buyer_note;
    std::optional<std::string> delivery_address;
    std::optional<std::string> delivery_city;
    std::optional<std::string> delivery_province;
    std::optional<std::string> delivery_postal_code;
    int64_t total_cents = 0;
    int64_t item_count = 0;
    std::string message;
    OrderStatus status = OrderStatus::Pending;
    Timestamp created_at;
    Timestamp updated_at;
    std::vector<OrderItem> items;
};

/// Input to the stock pre-check.
struct StockRequest {
    std::string variant_id;
    std::string product_name;
    int64_t quantity = 0;
};

struct StockShortfall {
    std::string variant_id;
    std::string product_name;
    int64_t requested = 0;
    int64_t available = 0;

    bool operator==(const StockShortfall& other) const {
        return variant_id == other.variant_id && product_name == other.product_name &&
               requested == other.requested && available == other.available;
    }
};

struct StockCheck {
    bool valid = true;
    std::vector<StockShortfall> shortfalls;
};

/// Per-tenant order counts. Revenue excludes cancelled orders.
struct OrderStats {
    int64_t total = 0;
    int64_t pending = 0;
    int64_t confirmed = 0;
    int64_t shipped = 0;
    int64_t delivered = 0;
    int64_t cancelled = 0;
    int64_t revenue_cents = 0;
};

/// A seller resolved from a credential.
struct Caller {
    std::string tenant_id;
    std::string caller_id;
};

} // namespace storefront
