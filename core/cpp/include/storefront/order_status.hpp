#pragma once

#include <optional>
#include <string>
#include <vector>

namespace storefront {

/**
 * Order lifecycle states.
 *
 * PENDING is the only initial state. DELIVERED and CANCELLED are terminal.
 */
enum class OrderStatus { Pending, Confirmed, Shipped, Delivered, Cancelled };

/**
 * All statuses in lifecycle order.
 */
const std::vector<OrderStatus>& all_statuses();

/**
 * External name of a status ("PENDING", "CONFIRMED", ...).
 */
std::string to_string(OrderStatus status);

/**
 * Parse an external status name. Case-sensitive; unknown names yield nullopt.
 */
std::optional<OrderStatus> parse_order_status(const std::string& name);

/**
 * Legal next states for a status.
 */
const std::vector<OrderStatus>& allowed_transitions(OrderStatus from);

/**
 * Check whether `from -> to` is in the transition table.
 */
bool can_transition(OrderStatus from, OrderStatus to);

inline bool is_terminal(OrderStatus status) {
    return allowed_transitions(status).empty();
}

} // namespace storefront
