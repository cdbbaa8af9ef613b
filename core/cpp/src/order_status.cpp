#include "storefront/order_status.hpp"

#include <algorithm>
#include <map>

namespace storefront {

namespace {

const std::map<OrderStatus, std::vector<OrderStatus>>& transition_table() {
    static const std::map<OrderStatus, std::vector<OrderStatus>> table = {
        {OrderStatus::Pending, {OrderStatus::Confirmed, OrderStatus::Cancelled}},
        {OrderStatus::Confirmed, {OrderStatus::Shipped, OrderStatus::Cancelled}},
        {OrderStatus::Shipped, {OrderStatus::Delivered}},
        {OrderStatus::Delivered, {}},
        {OrderStatus::Cancelled, {}},
    };
    return table;
}

} // anonymous namespace

const std::vector<OrderStatus>& all_statuses() {
    static const std::vector<OrderStatus> statuses = {
        OrderStatus::Pending, OrderStatus::Confirmed, OrderStatus::Shipped,
        OrderStatus::Delivered, OrderStatus::Cancelled};
    return statuses;
}

std::string to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending: return "PENDING";
        case OrderStatus::Confirmed: return "CONFIRMED";
        case OrderStatus::Shipped: return "SHIPPED";
        case OrderStatus::Delivered: return "DELIVERED";
        case OrderStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<OrderStatus> parse_order_status(const std::string& name) {
    for (auto status : all_statuses()) {
        if (to_string(status) == name) return status;
    }
    return std::nullopt;
}

const std::vector<OrderStatus>& allowed_transitions(OrderStatus from) {
    return transition_table().at(from);
}

bool can_transition(OrderStatus from, OrderStatus to) {
    const auto& allowed = allowed_transitions(from);
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

} // namespace storefront
