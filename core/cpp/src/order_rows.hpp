#pragma once

#include <optional>
#include <string>
#include <vector>
#include "storefront/db.hpp"
#include "storefront/types.hpp"

namespace storefront {
namespace rows {

/// Column list matching read_order().
extern const char* const kOrderColumns;

/// Map the current row of a statement selecting kOrderColumns. Items are not loaded.
Order read_order(const db::Statement& stmt);

std::vector<OrderItem> load_items(db::Connection& connection, int64_t order_id);

/**
 * Load one order with its items. When `tenant_id` is set the lookup is
 * scoped to that tenant.
 */
std::optional<Order> load_order(db::Connection& connection, int64_t order_id,
                                const std::optional<std::string>& tenant_id);

std::optional<Order> load_order_by_number(db::Connection& connection,
                                          const std::string& order_number);

} // namespace rows
} // namespace storefront
