#pragma once

#include <optional>
#include <vector>
#include "storefront/orders.pb.h"
#include "types.hpp"

namespace storefront {

/**
 * Conversions between core types and the protobuf wire contract.
 */
namespace wire {

v1::OrderStatus to_proto(OrderStatus status);

/**
 * Map a wire status to a core status. ORDER_STATUS_UNSPECIFIED and unknown
 * values yield nullopt.
 */
std::optional<OrderStatus> from_proto(v1::OrderStatus status);

v1::Order to_proto(const Order& order);

v1::StockShortfalls to_proto(const std::vector<StockShortfall>& shortfalls);

std::vector<StockShortfall> from_proto(const v1::StockShortfalls& shortfalls);

OrderStats from_proto(const v1::OrderStats& stats);

v1::OrderStats to_proto(const OrderStats& stats);

Cart from_proto(const v1::CheckoutRequest& request);

std::vector<StockRequest> from_proto(const v1::ValidateStockRequest& request);

} // namespace wire
} // namespace storefront
